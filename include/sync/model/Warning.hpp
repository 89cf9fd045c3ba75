#pragma once

#include "sync/model/Action.hpp"

#include <string>

namespace tmr::sync::model {

struct Warning {
    enum class Kind { Scan, Comparison, Metadata, Contract };

    Kind kind{Kind::Scan};
    std::string path;
    std::string message;
};

struct ActionError {
    Action action;
    std::string message;
};

std::string to_string(Warning::Kind kind);

}
