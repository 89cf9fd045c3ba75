#include "sync/Scanner.hpp"
#include "sync/errors.hpp"
#include "concurrency/ThreadPool.hpp"
#include "log/Registry.hpp"

#include <atomic>
#include <future>
#include <mutex>
#include <system_error>

using namespace tmr::sync;
using namespace tmr::sync::model;
using namespace tmr::concurrency;

namespace fs = std::filesystem;

namespace {

struct ScanState {
    fs::path root;
    IgnorePredicate ignore;
    Scanner::Role role;
    ThreadPool& pool;

    std::mutex mutex;
    std::vector<ScanResult> partials;

    std::atomic<size_t> outstanding{0};
    std::promise<void> done;

    ScanState(fs::path r, IgnorePredicate ig, const Scanner::Role ro, ThreadPool& p)
        : root(std::move(r)), ignore(std::move(ig)), role(ro), pool(p) {}
};

void finish(const std::shared_ptr<ScanState>& state) {
    if (state->outstanding.fetch_sub(1) == 1) state->done.set_value();
}

void addWarning(ScanResult& out, const std::string& rel, const std::string& msg) {
    tmr::log::Registry::scan()->warn("[Scanner] {}: {}", rel.empty() ? "." : rel, msg);
    out.warnings.push_back({Warning::Kind::Scan, rel, msg});
}

void scheduleDir(const std::shared_ptr<ScanState>& state, fs::path dir, std::string rel);

struct DirTask final : Task {
    std::shared_ptr<ScanState> state;
    fs::path dir;
    std::string rel;

    DirTask(std::shared_ptr<ScanState> s, fs::path d, std::string r)
        : state(std::move(s)), dir(std::move(d)), rel(std::move(r)) {}

    void operator()() override {
        ScanResult local;

        try {
            walk(local);
        } catch (const std::exception& e) {
            addWarning(local, rel, e.what());
        }

        {
            std::scoped_lock lock(state->mutex);
            state->partials.push_back(std::move(local));
        }

        finish(state);
    }

private:
    void walk(ScanResult& out) const {
        std::error_code ec;
        fs::directory_iterator it(dir, ec);
        if (ec) {
            addWarning(out, rel, "cannot read directory: " + ec.message());
            return;
        }

        for (; it != fs::directory_iterator(); it.increment(ec)) {
            const auto& child = it->path();
            const auto name = child.filename().string();
            const auto childRel = rel.empty() ? name : rel + "/" + name;

            if (state->ignore && state->ignore(childRel)) continue;

            if (auto entry = inspect(child, childRel, state->role, out)) {
                const bool isDir = entry->isDirectory;
                out.entries.emplace(childRel, std::move(entry));
                if (isDir) scheduleDir(state, child, childRel);
            }
        }

        if (ec) addWarning(out, rel, "directory listing interrupted: " + ec.message());
    }

    static std::shared_ptr<const Entry> inspect(const fs::path& path, const std::string& rel,
                                                const Scanner::Role role, ScanResult& out) {
        std::error_code ec;
        const auto st = fs::symlink_status(path, ec);
        if (ec) {
            addWarning(out, rel, "cannot stat: " + ec.message());
            return nullptr;
        }

        if (fs::is_symlink(st)) {
            if (role == Scanner::Role::Source) {
                addWarning(out, rel, "symbolic link skipped");
                return nullptr;
            }

            // Kept as a non-directory so the plan deletes the link itself and nothing writes through it
            auto link = std::make_shared<Entry>();
            link->relativePath = rel;
            link->absolutePath = path;
            link->isSymlink = true;
            tmr::log::Registry::scan()->debug("[Scanner] Target symlink {} will be replaced", rel);
            return link;
        }

        if (!fs::is_directory(st) && !fs::is_regular_file(st)) {
            addWarning(out, rel, "special file skipped");
            return nullptr;
        }

        auto entry = std::make_shared<Entry>();
        entry->relativePath = rel;
        entry->absolutePath = path;
        entry->isDirectory = fs::is_directory(st);
        entry->permissionMode = static_cast<mode_t>(st.permissions() & fs::perms::mask);

        entry->modifiedTime = fs::last_write_time(path, ec);
        if (ec) {
            addWarning(out, rel, "cannot read modification time: " + ec.message());
            return nullptr;
        }

        if (!entry->isDirectory) {
            entry->size = fs::file_size(path, ec);
            if (ec) {
                addWarning(out, rel, "cannot read size: " + ec.message());
                return nullptr;
            }
        }

        return entry;
    }
};

void scheduleDir(const std::shared_ptr<ScanState>& state, fs::path dir, std::string rel) {
    state->outstanding.fetch_add(1);
    try {
        state->pool.submit(std::make_shared<DirTask>(state, std::move(dir), rel));
    } catch (const std::exception& e) {
        ScanResult failed;
        addWarning(failed, rel, std::string("cannot schedule directory walk: ") + e.what());
        {
            std::scoped_lock lock(state->mutex);
            state->partials.push_back(std::move(failed));
        }
        finish(state);
    }
}

}

ScanResult Scanner::scan(const fs::path& root, const IgnorePredicate& ignore, const Role role) const {
    const auto label = to_string(role);

    std::error_code ec;
    const auto st = fs::status(root, ec);
    if (ec || !fs::exists(st)) {
        if (role == Role::Target && (!ec || ec == std::errc::no_such_file_or_directory)) {
            tmr::log::Registry::scan()->info("[Scanner] Target {} does not exist yet, treating as empty", root.string());
            return {};
        }
        throw FatalSetupError(label + " root " + root.string() + " is not accessible" +
                              (ec ? ": " + ec.message() : ""));
    }
    if (!fs::is_directory(st))
        throw FatalSetupError(label + " root " + root.string() + " is not a directory");

    tmr::log::Registry::scan()->debug("[Scanner] Scanning {} {}", label, root.string());

    const auto state = std::make_shared<ScanState>(root, ignore, role, pool_);
    auto done = state->done.get_future();

    scheduleDir(state, root, "");
    done.wait();

    // Every task has finished, merge without contention
    ScanResult result;
    size_t total = 0;
    for (const auto& p : state->partials) total += p.entries.size();
    result.entries.reserve(total);

    for (auto& p : state->partials) {
        for (auto& [rel, entry] : p.entries) result.entries.emplace(rel, std::move(entry));
        result.warnings.insert(result.warnings.end(),
                               std::make_move_iterator(p.warnings.begin()),
                               std::make_move_iterator(p.warnings.end()));
    }

    tmr::log::Registry::scan()->info("[Scanner] Finished scanning {}: {} items, {} warnings",
                                label, result.entries.size(), result.warnings.size());
    return result;
}

std::string tmr::sync::to_string(const Scanner::Role role) {
    return role == Scanner::Role::Source ? "source" : "target";
}
