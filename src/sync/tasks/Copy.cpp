#include "sync/tasks/Copy.hpp"
#include "log/Registry.hpp"

#include <cerrno>
#include <fcntl.h>
#include <stdexcept>
#include <system_error>
#include <unistd.h>
#include <vector>

using namespace tmr::sync::tasks;
using namespace tmr::sync::model;

namespace fs = std::filesystem;

namespace {

struct FdGuard {
    int fd = -1;
    explicit FdGuard(const int f) : fd(f) {}
    ~FdGuard() { if (fd >= 0) ::close(fd); }
    FdGuard(const FdGuard&) = delete;
    FdGuard& operator=(const FdGuard&) = delete;

    // Explicit close so the error is not lost in the destructor
    void close(const fs::path& path) {
        const int f = fd;
        fd = -1;
        if (::close(f) != 0) throw std::system_error(errno, std::generic_category(), "close " + path.string());
    }
};

void writeAll(const int fd, const char* data, size_t len, const fs::path& path) {
    while (len > 0) {
        const ssize_t n = ::write(fd, data, len);
        if (n < 0) {
            if (errno == EINTR) continue;
            throw std::system_error(errno, std::generic_category(), "write " + path.string());
        }
        data += n;
        len -= static_cast<size_t>(n);
    }
}

}

void tmr::sync::tasks::ensureParentDirectory(const fs::path& path) {
    const auto parent = path.parent_path();
    if (parent.empty()) return;

    std::error_code ec;
    fs::create_directories(parent, ec);

    // A link in place of the parent would redirect the write outside the tree
    std::error_code st;
    if (!fs::is_directory(fs::symlink_status(parent, st))) {
        if (!ec) ec = st ? st : std::make_error_code(std::errc::not_a_directory);
        throw std::system_error(ec, "create parent directory " + parent.string());
    }
}

Copy::Copy(Action a, fs::path src, fs::path dst, ProgressObserver* obs, const size_t bufferSize)
    : ActionTask(std::move(a), std::move(src), std::move(dst), obs),
      bufferSize(bufferSize == 0 ? 64 * 1024 : bufferSize) {}

Outcome Copy::run() {
    if (!action.source) throw std::logic_error("copy without a source entry");

    Outcome outcome;
    ensureParentDirectory(targetPath);

    if (observer) observer->onFileStarted(action.key, action.source->size);

    FdGuard in(::open(sourcePath.c_str(), O_RDONLY | O_CLOEXEC));
    if (in.fd < 0) throw std::system_error(errno, std::generic_category(), "open " + sourcePath.string());

    const auto mode = action.source->permissionMode ? action.source->permissionMode : 0644;
    FdGuard out(::open(targetPath.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC | O_NOFOLLOW, mode));
    if (out.fd < 0) throw std::system_error(errno, std::generic_category(), "open " + targetPath.string());

    std::vector<char> buffer(bufferSize);
    while (true) {
        const ssize_t n = ::read(in.fd, buffer.data(), buffer.size());
        if (n < 0) {
            if (errno == EINTR) continue;
            throw std::system_error(errno, std::generic_category(), "read " + sourcePath.string());
        }
        if (n == 0) break;

        writeAll(out.fd, buffer.data(), static_cast<size_t>(n), targetPath);
        outcome.bytesCopied += static_cast<uintmax_t>(n);
        if (observer) observer->onBytesCopied(static_cast<uintmax_t>(n));
    }

    if (::fsync(out.fd) != 0) throw std::system_error(errno, std::generic_category(), "fsync " + targetPath.string());
    out.close(targetPath);

    std::error_code ec;
    fs::last_write_time(targetPath, action.source->modifiedTime, ec);
    if (ec) {
        const auto msg = "cannot set modification time: " + ec.message();
        tmr::log::Registry::exec()->warn("[Copy] {}: {}", action.key, msg);
        outcome.warnings.push_back({Warning::Kind::Metadata, action.key, msg});
    }

    return outcome;
}
