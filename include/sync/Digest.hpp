#pragma once

#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <string>

namespace tmr::concurrency {
class ThreadPool;
}

namespace tmr::sync {

using DigestFn = std::function<std::string(const std::filesystem::path&)>;

// Fixed-size hashing pool. Callers block until their fingerprint is ready.
class ContentDigest {
public:
    explicit ContentDigest(unsigned int workers = 4);
    ~ContentDigest();

    ContentDigest(const ContentDigest&) = delete;
    ContentDigest& operator=(const ContentDigest&) = delete;

    void start();
    void shutdown();   // drains queued jobs, joins workers

    [[nodiscard]] bool isRunning() const;
    [[nodiscard]] unsigned int workerCount() const { return workers_; }

    // Hex BLAKE2b of the file contents; throws DigestError on read failure.
    // Starts the pool on first use.
    std::string digest(const std::filesystem::path& absolutePath);

    // Bound to this instance, which must outlive the returned function
    DigestFn fn();

private:
    unsigned int workers_;
    std::unique_ptr<concurrency::ThreadPool> pool_;
    mutable std::mutex mutex_;
};

}
