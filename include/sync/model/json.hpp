#pragma once

#include "sync/model/Plan.hpp"
#include "sync/model/Result.hpp"

#include <nlohmann/json.hpp>

namespace tmr::sync::model {

void to_json(nlohmann::json& j, const Entry& e);
void to_json(nlohmann::json& j, const Action& a);
void to_json(nlohmann::json& j, const Warning& w);
void to_json(nlohmann::json& j, const ActionError& e);
void to_json(nlohmann::json& j, const Plan& p);
void to_json(nlohmann::json& j, const AggregateResult& r);

}
