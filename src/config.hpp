#pragma once

#include <expected>
#include <filesystem>
#include <string>

#include "nlohmann/json.hpp"
#include "unexpected_codes.hpp"

namespace config {

struct DecisionConstants {
  long minLoanAmount = 2000;
  long maxLoanAmount = 10000;
  int minLoanPeriod = 12;
  int maxLoanPeriod = 60;

  int segment1CreditModifier = 100;
  int segment2CreditModifier = 300;
  int segment3CreditModifier = 1000;

  long loanAmountStep = 100;

  int minAge = 18;
  int maxAge = 80;
};

struct ServerSettings {
  std::string host = "0.0.0.0";
  int port = 9999;
  int threads = 4;
};

struct Settings {
  DecisionConstants decision;
  ServerSettings server;
};

std::expected<Settings, UNEXPECTED_CODE>
fromJson(const nlohmann::json &data);

//A missing file yields the defaults
std::expected<Settings, UNEXPECTED_CODE>
load(const std::filesystem::path &path);

}
