#pragma once

#include <string>
#include <filesystem>

namespace tmr::crypto::hash {

// Streams the file through BLAKE2b (libsodium generichash), returns lowercase hex.
// Throws std::runtime_error when the file cannot be opened or read.
std::string blake2b(const std::filesystem::path& filepath);

// One-time libsodium initialisation, safe to call repeatedly
void ensureSodium();

}
