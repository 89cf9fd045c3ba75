#pragma once

#include "sync/model/Entry.hpp"

#include <memory>
#include <string>

namespace tmr::sync::model {

enum class ActionType { Add, Update, Delete };

struct Action {
    ActionType type{ActionType::Add};
    std::string key;                          // relativePath shared by both sides
    std::shared_ptr<const Entry> source{};    // Add, Update
    std::shared_ptr<const Entry> target{};    // Update, Delete

    // Entry describing what the action is about: source for Add/Update, target for Delete
    [[nodiscard]] const std::shared_ptr<const Entry>& subject() const {
        return type == ActionType::Delete ? target : source;
    }

    [[nodiscard]] bool isDirectory() const {
        const auto& e = subject();
        return e && e->isDirectory;
    }
};

std::string to_string(ActionType type);

}
