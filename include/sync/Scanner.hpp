#pragma once

#include "sync/model/Entry.hpp"
#include "sync/model/Warning.hpp"

#include <filesystem>
#include <functional>
#include <string>
#include <vector>

namespace tmr::concurrency {
class ThreadPool;
}

namespace tmr::sync {

using IgnorePredicate = std::function<bool(const std::string&)>;

struct ScanResult {
    model::Mapping entries;
    std::vector<model::Warning> warnings;
};

class Scanner {
public:
    // A missing source root is fatal, a missing target root is an empty tree
    enum class Role { Source, Target };

    explicit Scanner(concurrency::ThreadPool& pool) : pool_(pool) {}

    // Fans out one task per directory on the pool, blocks until the walk completes.
    // Symbolic links are never followed: skipped with a warning in the source,
    // recorded as symlink entries in the target so the plan replaces them.
    [[nodiscard]] ScanResult scan(const std::filesystem::path& root,
                                  const IgnorePredicate& ignore,
                                  Role role) const;

private:
    concurrency::ThreadPool& pool_;
};

std::string to_string(Scanner::Role role);

}
