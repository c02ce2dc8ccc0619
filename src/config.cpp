#include "config.hpp"

#include <fstream>
#include <optional>
#include <iostream>
#include <limits>
#include <sstream>

namespace config {

namespace {

constexpr long long AMOUNT_LIMIT = std::numeric_limits<int>::max();

//modifier * period is the largest amount the search can reach
bool
fitsAmount(int modifier, int maxLoanPeriod) {
  return static_cast<long long>(modifier) * maxLoanPeriod <= AMOUNT_LIMIT;
}

std::optional<UNEXPECTED_CODE>
verify(const Settings &settings) {
  const auto &d = settings.decision;

  if (d.minLoanAmount <= 0 || d.maxLoanAmount < d.minLoanAmount || d.maxLoanAmount > AMOUNT_LIMIT) {
    std::cerr << "[CONFIG_ERROR] loan amount bounds" << std::endl;
    return UNEXPECTED_CODE::INVALID_CONFIG;
  }

  if (d.minLoanPeriod <= 0 || d.maxLoanPeriod < d.minLoanPeriod) {
    std::cerr << "[CONFIG_ERROR] loan period bounds" << std::endl;
    return UNEXPECTED_CODE::INVALID_CONFIG;
  }

  if (d.loanAmountStep <= 0 || d.loanAmountStep > AMOUNT_LIMIT) {
    std::cerr << "[CONFIG_ERROR] loan amount step" << std::endl;
    return UNEXPECTED_CODE::INVALID_CONFIG;
  }

  if (d.segment1CreditModifier <= 0
      || d.segment2CreditModifier <= 0
      || d.segment3CreditModifier <= 0) {
    std::cerr << "[CONFIG_ERROR] credit modifiers" << std::endl;
    return UNEXPECTED_CODE::INVALID_CONFIG;
  }

  if (!fitsAmount(d.segment1CreditModifier, d.maxLoanPeriod)
      || !fitsAmount(d.segment2CreditModifier, d.maxLoanPeriod)
      || !fitsAmount(d.segment3CreditModifier, d.maxLoanPeriod)) {
    std::cerr << "[CONFIG_ERROR] credit modifier too large for the maximum period" << std::endl;
    return UNEXPECTED_CODE::INVALID_CONFIG;
  }

  if (d.minAge < 0 || d.maxAge < d.minAge) {
    std::cerr << "[CONFIG_ERROR] age bounds" << std::endl;
    return UNEXPECTED_CODE::INVALID_CONFIG;
  }

  if (settings.server.port < 1 || settings.server.port > 65535 || settings.server.threads < 1) {
    std::cerr << "[CONFIG_ERROR] server" << std::endl;
    return UNEXPECTED_CODE::INVALID_CONFIG;
  }

  return std::nullopt;
}

}

std::expected<Settings, UNEXPECTED_CODE>
fromJson(const nlohmann::json &data) {
  if (!data.is_object()) {
    std::cerr << "[CONFIG_ERROR] root is not an object" << std::endl;
    return std::unexpected(UNEXPECTED_CODE::INVALID_CONFIG);
  }

  Settings settings;
  auto &d = settings.decision;
  auto &s = settings.server;

  const auto empty = nlohmann::json::object();

  try {
    const auto &server = data.value("server", empty);
    s.host = server.value("host", s.host);
    s.port = server.value("port", s.port);
    s.threads = server.value("threads", s.threads);

    const auto &loan = data.value("loan", empty);
    d.minLoanAmount = loan.value("minAmount", d.minLoanAmount);
    d.maxLoanAmount = loan.value("maxAmount", d.maxLoanAmount);
    d.minLoanPeriod = loan.value("minPeriod", d.minLoanPeriod);
    d.maxLoanPeriod = loan.value("maxPeriod", d.maxLoanPeriod);
    d.loanAmountStep = loan.value("amountStep", d.loanAmountStep);

    const auto &age = data.value("age", empty);
    d.minAge = age.value("min", d.minAge);
    d.maxAge = age.value("max", d.maxAge);

    const auto &modifiers = data.value("creditModifiers", empty);
    d.segment1CreditModifier = modifiers.value("segment1", d.segment1CreditModifier);
    d.segment2CreditModifier = modifiers.value("segment2", d.segment2CreditModifier);
    d.segment3CreditModifier = modifiers.value("segment3", d.segment3CreditModifier);
  } catch (const nlohmann::json::exception &e) {
    std::cerr << "[CONFIG_ERROR] " << e.what() << std::endl;
    return std::unexpected(UNEXPECTED_CODE::INVALID_CONFIG);
  }

  if (auto error = verify(settings)) {
    return std::unexpected(*error);
  }

  return settings;
}

std::expected<Settings, UNEXPECTED_CODE>
load(const std::filesystem::path &path) {
  std::error_code ec;

  if (!std::filesystem::exists(path, ec)) {
    if (ec) {
      std::cerr << "[CONFIG_ERROR] " << path << ": " << ec.message() << std::endl;
      return std::unexpected(UNEXPECTED_CODE::INVALID_CONFIG);
    }
    std::cout << "[LOG] " << path << " not found, using default settings" << std::endl;
    return Settings{};
  }

  std::fstream s{path, s.in};

  if (!s.is_open()) {
    std::cerr << "[CONFIG_ERROR] couldn't open " << path << std::endl;
    return std::unexpected(UNEXPECTED_CODE::INVALID_CONFIG);
  }

  std::stringstream content;

  content << s.rdbuf();

  nlohmann::json data = nlohmann::json::parse(content.str(), nullptr, false);

  if (data.is_discarded()) {
    std::cerr << "[CONFIG_ERROR] " << path << " is not valid JSON" << std::endl;
    return std::unexpected(UNEXPECTED_CODE::INVALID_CONFIG);
  }

  return fromJson(data);
}

}
