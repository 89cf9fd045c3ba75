#include "sync/tasks/Delete.hpp"

#include <system_error>

using namespace tmr::sync::tasks;

namespace fs = std::filesystem;

Outcome Delete::run() {
    std::error_code ec;
    const auto st = fs::symlink_status(targetPath, ec);
    if (ec || !fs::exists(st)) {
        if (!ec || ec == std::errc::no_such_file_or_directory) return {};
        throw std::system_error(ec, "stat " + targetPath.string());
    }

    if (fs::is_directory(st)) fs::remove_all(targetPath, ec);
    else fs::remove(targetPath, ec);

    if (ec && ec != std::errc::no_such_file_or_directory)
        throw std::system_error(ec, "remove " + targetPath.string());

    return {};
}
