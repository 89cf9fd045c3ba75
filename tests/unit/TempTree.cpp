#include "TempTree.hpp"

#include <atomic>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <unistd.h>

using tmr::sync::model::Entry;

namespace {
std::atomic<unsigned int> counter{0};
}

TempTree::TempTree(const std::string& tag) {
    root_ = fs::temp_directory_path() /
            ("treemirror_" + tag + "_" + std::to_string(::getpid()) + "_" + std::to_string(counter.fetch_add(1)));
    fs::remove_all(root_);
    fs::create_directories(root_);
}

TempTree::~TempTree() {
    std::error_code ec;
    // Restore access so remove_all can descend into directories a test locked down
    for (auto it = fs::recursive_directory_iterator(root_, fs::directory_options::skip_permission_denied, ec);
         !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
        if (it->is_directory(ec) && !it->is_symlink(ec))
            fs::permissions(it->path(), fs::perms::owner_all, fs::perm_options::add, ec);
    }
    fs::remove_all(root_, ec);
}

void TempTree::write(const std::string& rel, const std::string& content) const {
    const auto p = path(rel);
    fs::create_directories(p.parent_path());
    std::ofstream out(p, std::ios::binary | std::ios::trunc);
    if (!out) throw std::runtime_error("cannot write " + p.string());
    out << content;
}

void TempTree::mkdir(const std::string& rel) const {
    fs::create_directories(path(rel));
}

std::string TempTree::read(const std::string& rel) const {
    std::ifstream in(path(rel), std::ios::binary);
    if (!in) throw std::runtime_error("cannot read " + path(rel).string());
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

bool TempTree::exists(const std::string& rel) const {
    std::error_code ec;
    return fs::exists(fs::symlink_status(path(rel), ec));
}

void TempTree::setMtime(const std::string& rel, const fs::file_time_type t) const {
    fs::last_write_time(path(rel), t);
}

std::shared_ptr<const Entry> TempTree::entry(const std::string& rel) const {
    auto e = std::make_shared<Entry>();
    const auto p = path(rel);
    e->relativePath = rel;
    e->absolutePath = p;
    e->isDirectory = fs::is_directory(p);
    e->size = e->isDirectory ? 0 : fs::file_size(p);
    e->modifiedTime = fs::last_write_time(p);
    e->permissionMode = static_cast<mode_t>(fs::status(p).permissions() & fs::perms::mask);
    return e;
}

std::shared_ptr<const Entry> fileEntry(const std::string& rel, const uintmax_t size, const fs::file_time_type mtime) {
    auto e = std::make_shared<Entry>();
    e->relativePath = rel;
    e->absolutePath = fs::path("/nonexistent") / rel;
    e->size = size;
    e->modifiedTime = mtime;
    e->permissionMode = 0644;
    return e;
}

std::shared_ptr<const Entry> dirEntry(const std::string& rel) {
    auto e = std::make_shared<Entry>();
    e->relativePath = rel;
    e->absolutePath = fs::path("/nonexistent") / rel;
    e->isDirectory = true;
    e->permissionMode = 0755;
    return e;
}
