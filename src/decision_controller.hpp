#pragma once

#include "httplib.h"
#include "nlohmann/json.hpp"

#include "decision_engine.hpp"
#include "models.hpp"

namespace controller {

nlohmann::json
toJson(const models::Decision &decision);

//POST /loan/decision
void
loanDecision(const decision::DecisionEngine &engine,
             const httplib::Request &req, httplib::Response &res);

}
