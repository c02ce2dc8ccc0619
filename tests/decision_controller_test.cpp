#include "decision_controller.hpp"

#include <doctest/doctest.h>

#include <string>

namespace {

// Codes whose holders stay between 18 and 80 for decades, so today's date doesn't matter
constexpr auto DEBT = "49002010965";
constexpr auto SEGMENT_2 = "38411266610";

struct ControllerFixture {
  decision::DecisionEngine engine{config::DecisionConstants{}};
  httplib::Response res;

  nlohmann::json
  post(const std::string &body) {
    httplib::Request req;
    req.method = "POST";
    req.path = "/loan/decision";
    req.body = body;

    controller::loanDecision(engine, req, res);

    CHECK(res.get_header_value("Content-Type") == "application/json");
    return nlohmann::json::parse(res.body);
  }

  nlohmann::json
  post(const std::string &code, nlohmann::json amount, nlohmann::json period) {
    nlohmann::json body;
    body["personalCode"] = code;
    body["loanAmount"] = amount;
    body["loanPeriod"] = period;
    return post(body.dump());
  }
};

}

TEST_SUITE_BEGIN("DecisionController");

TEST_CASE_FIXTURE(ControllerFixture, "approved") {
  auto data = post(SEGMENT_2, 2000, 12);

  CHECK(res.status == 200);
  CHECK(data["loanAmount"] == 3600);
  CHECK(data["loanPeriod"] == 12);
  CHECK(data["errorMessage"].is_null());
}

TEST_CASE_FIXTURE(ControllerFixture, "no valid loan") {
  auto data = post(DEBT, 4000, 24);

  CHECK(res.status == 404);
  CHECK(data["loanAmount"].is_null());
  CHECK(data["loanPeriod"].is_null());
  CHECK(data["errorMessage"] == "You are not approved for a loan.");
}

TEST_CASE_FIXTURE(ControllerFixture, "invalid inputs") {
  SUBCASE("personal code") {
    auto data = post("49002010966", 4000, 24);
    CHECK(res.status == 400);
    CHECK(data["errorMessage"] == "Invalid personal ID code!");
    CHECK(data["loanAmount"].is_null());
  }

  SUBCASE("amount") {
    auto data = post(SEGMENT_2, 1, 24);
    CHECK(res.status == 400);
    CHECK(data["errorMessage"] == "Invalid loan amount!");
  }

  SUBCASE("period") {
    auto data = post(SEGMENT_2, 4000, 61);
    CHECK(res.status == 400);
    CHECK(data["errorMessage"] == "Invalid loan period!");
  }
}

TEST_CASE_FIXTURE(ControllerFixture, "malformed requests") {
  SUBCASE("not json") {
    auto data = post("personalCode=38411266610");
    CHECK(res.status == 422);
    CHECK(data["errorMessage"] == "Invalid request!");
  }

  SUBCASE("not an object") {
    post("[1, 2, 3]");
    CHECK(res.status == 422);
  }

  SUBCASE("missing field") {
    post(R"({"personalCode": "38411266610", "loanAmount": 4000})");
    CHECK(res.status == 422);
  }

  SUBCASE("wrong types") {
    post(SEGMENT_2, "4000", 24);
    CHECK(res.status == 422);

    post(SEGMENT_2, 4000, 24.5);
    CHECK(res.status == 422);

    post(R"({"personalCode": 38411266610, "loanAmount": 4000, "loanPeriod": 24})");
    CHECK(res.status == 422);
  }

  SUBCASE("period out of integer range") {
    post(SEGMENT_2, 4000, 99999999999LL);
    CHECK(res.status == 422);
  }
}

TEST_SUITE_END();
