#pragma once

#include <stdexcept>
#include <string>

namespace tmr::sync {

// Setup preconditions failed, nothing has been scanned or touched
struct FatalSetupError : std::runtime_error {
    explicit FatalSetupError(const std::string& msg) : std::runtime_error(msg) {}
};

// Content digest could not be computed for a file
struct DigestError : std::runtime_error {
    explicit DigestError(const std::string& msg) : std::runtime_error(msg) {}
};

}
