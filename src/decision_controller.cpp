#include "decision_controller.hpp"

#include <iostream>
#include <limits>

namespace controller {

namespace {

constexpr auto INVALID_REQUEST = "Invalid request!";

void
reply(httplib::Response &res, int status, const models::Decision &decision) {
  res.status = status;
  res.set_content(toJson(decision).dump(), "application/json");
}

int
statusFor(UNEXPECTED_CODE code) {
  switch (code) {
    case UNEXPECTED_CODE::INVALID_PERSONAL_CODE:
    case UNEXPECTED_CODE::INVALID_AGE:
    case UNEXPECTED_CODE::INVALID_LOAN_AMOUNT:
    case UNEXPECTED_CODE::INVALID_LOAN_PERIOD:
      return 400;
    case UNEXPECTED_CODE::NO_VALID_LOAN:
      return 404;
    case UNEXPECTED_CODE::INVALID_CONFIG:
      break;
  }
  return 500;
}

void
rejectRequest(const httplib::Request &req, httplib::Response &res) {
  std::cout << "[LOG:422] " << req.body << std::endl;

  models::Decision decision;
  decision.errorMessage = INVALID_REQUEST;
  reply(res, 422, decision);
}

}

nlohmann::json
toJson(const models::Decision &decision) {
  nlohmann::json data;

  data["loanAmount"] = decision.loanAmount.has_value()
    ? nlohmann::json(*decision.loanAmount) : nlohmann::json(nullptr);
  data["loanPeriod"] = decision.loanPeriod.has_value()
    ? nlohmann::json(*decision.loanPeriod) : nlohmann::json(nullptr);
  data["errorMessage"] = decision.errorMessage.has_value()
    ? nlohmann::json(*decision.errorMessage) : nlohmann::json(nullptr);

  return data;
}

void
loanDecision(const decision::DecisionEngine &engine,
             const httplib::Request &req, httplib::Response &res) {
  nlohmann::json data = nlohmann::json::parse(req.body, nullptr, false);

  if (data.is_discarded() || !data.is_object()) {
    rejectRequest(req, res);
    return;
  }

  if (!data.contains("personalCode") || !data["personalCode"].is_string()) {
    rejectRequest(req, res);
    return;
  }

  if (!data.contains("loanAmount") || !data["loanAmount"].is_number_integer()) {
    rejectRequest(req, res);
    return;
  }

  if (!data.contains("loanPeriod") || !data["loanPeriod"].is_number_integer()) {
    rejectRequest(req, res);
    return;
  }

  const auto period = data["loanPeriod"].template get<long long>();

  if (period < std::numeric_limits<int>::min() || period > std::numeric_limits<int>::max()) {
    rejectRequest(req, res);
    return;
  }

  const models::LoanRequest request {
    data["personalCode"].template get<std::string>(),
    data["loanAmount"].template get<long>(),
    static_cast<int>(period)
  };

  auto result = engine.decide(request.personalCode, request.loanAmount, request.loanPeriod);

  reply(res, result.has_value() ? 200 : statusFor(result.error()), decision::toDecision(result));
}

}
