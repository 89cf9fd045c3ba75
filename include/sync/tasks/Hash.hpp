#pragma once

#include "concurrency/Task.hpp"

#include <filesystem>
#include <string>

namespace tmr::sync::tasks {

struct Hash final : concurrency::PromisedTask<std::string> {
    std::filesystem::path path;

    explicit Hash(std::filesystem::path p) : path(std::move(p)) {}

protected:
    std::string run() override;
};

}
