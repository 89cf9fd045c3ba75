#include "sync/tasks/Mkdir.hpp"

#include <cerrno>
#include <stdexcept>
#include <sys/stat.h>
#include <system_error>

using namespace tmr::sync::tasks;

namespace fs = std::filesystem;

Outcome Mkdir::run() {
    if (!action.source) throw std::logic_error("mkdir without a source entry");

    ensureParentDirectory(targetPath);

    const auto mode = action.source->permissionMode ? action.source->permissionMode : 0755;
    if (::mkdir(targetPath.c_str(), mode) != 0) {
        const int err = errno;
        // A concurrent child copy may have created it already, with default bits
        std::error_code ec;
        if (err != EEXIST || !fs::is_directory(fs::symlink_status(targetPath, ec)))
            throw std::system_error(err, std::generic_category(), "mkdir " + targetPath.string());
    }

    // Both paths: the umask narrowed a fresh mkdir, a pre-existing directory carries the wrong bits
    if (::chmod(targetPath.c_str(), mode) != 0)
        throw std::system_error(errno, std::generic_category(), "chmod " + targetPath.string());

    return {};
}
