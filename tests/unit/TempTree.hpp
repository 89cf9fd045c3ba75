#pragma once

#include "sync/model/Entry.hpp"

#include <filesystem>
#include <memory>
#include <string>

namespace fs = std::filesystem;

// Scratch directory removed on destruction
class TempTree {
public:
    explicit TempTree(const std::string& tag);
    ~TempTree();

    TempTree(const TempTree&) = delete;
    TempTree& operator=(const TempTree&) = delete;

    [[nodiscard]] const fs::path& root() const { return root_; }
    [[nodiscard]] fs::path path(const std::string& rel) const { return root_ / rel; }

    void write(const std::string& rel, const std::string& content) const;
    void mkdir(const std::string& rel) const;
    [[nodiscard]] std::string read(const std::string& rel) const;
    [[nodiscard]] bool exists(const std::string& rel) const;
    void setMtime(const std::string& rel, fs::file_time_type t) const;

    // Entry built from the node on disk, as a scan would produce it
    [[nodiscard]] std::shared_ptr<const tmr::sync::model::Entry> entry(const std::string& rel) const;

private:
    fs::path root_;
};

// Entries that never touch the disk, for planner tests
std::shared_ptr<const tmr::sync::model::Entry> fileEntry(const std::string& rel, uintmax_t size, fs::file_time_type mtime);
std::shared_ptr<const tmr::sync::model::Entry> dirEntry(const std::string& rel);
