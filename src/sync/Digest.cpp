#include "sync/Digest.hpp"
#include "sync/errors.hpp"
#include "sync/tasks/Hash.hpp"
#include "concurrency/ThreadPool.hpp"
#include "crypto/util/hash.hpp"
#include "log/Registry.hpp"

using namespace tmr::sync;
using namespace tmr::concurrency;

ContentDigest::ContentDigest(const unsigned int workers)
    : workers_(workers == 0 ? 1 : workers) {}

ContentDigest::~ContentDigest() {
    shutdown();
}

void ContentDigest::start() {
    std::scoped_lock lock(mutex_);
    if (pool_) return;

    crypto::hash::ensureSodium();
    pool_ = std::make_unique<ThreadPool>(workers_, "digest");
    log::Registry::digest()->debug("[ContentDigest] Started with {} workers", workers_);
}

void ContentDigest::shutdown() {
    std::unique_ptr<ThreadPool> pool;
    {
        std::scoped_lock lock(mutex_);
        pool = std::move(pool_);
    }
    if (!pool) return;

    pool->stop();
    if (log::Registry::isInitialized())
        log::Registry::digest()->debug("[ContentDigest] Stopped");
}

bool ContentDigest::isRunning() const {
    std::scoped_lock lock(mutex_);
    return static_cast<bool>(pool_);
}

std::string ContentDigest::digest(const std::filesystem::path& absolutePath) {
    start();

    const auto task = std::make_shared<tasks::Hash>(absolutePath);
    auto future = task->getFuture();

    {
        std::scoped_lock lock(mutex_);
        if (!pool_) throw DigestError("Digest service shut down while hashing " + absolutePath.string());
        pool_->submit(task);
    }

    try {
        return future.get();
    } catch (const DigestError& e) {
        log::Registry::digest()->warn("[ContentDigest] {}", e.what());
        throw;
    }
}

DigestFn ContentDigest::fn() {
    return [this](const std::filesystem::path& p) { return digest(p); };
}
