#include "sync/tasks/Hash.hpp"
#include "sync/errors.hpp"
#include "crypto/util/hash.hpp"

using namespace tmr::sync::tasks;

std::string Hash::run() {
    try {
        return crypto::hash::blake2b(path);
    } catch (const std::exception& e) {
        throw DigestError(e.what());
    }
}
