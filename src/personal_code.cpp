#include "personal_code.hpp"

#include <algorithm>
#include <array>

namespace personal_code {

namespace {

constexpr std::array<int, CHECKED_DIGITS> FIRST_WEIGHTS {1, 2, 3, 4, 5, 6, 7, 8, 9, 1};
constexpr std::array<int, CHECKED_DIGITS> SECOND_WEIGHTS {3, 4, 5, 6, 7, 8, 9, 1, 2, 3};

bool
allDigits(std::string_view value) {
  return std::all_of(value.begin(), value.end(), [](char c) { return c >= '0' && c <= '9'; });
}

int
digitsToInt(std::string_view value) {
  int result = 0;
  for (char c : value) {
    result = result * 10 + (c - '0');
  }
  return result;
}

int
weightedRemainder(std::string_view digits, const std::array<int, CHECKED_DIGITS> &weights) {
  int sum = 0;
  for (std::size_t i = 0; i < weights.size(); ++i) {
    sum += (digits[i] - '0') * weights[i];
  }
  return sum % 11;
}

std::optional<int>
centuryBase(char genderDigit) {
  switch (genderDigit) {
    case '1':
    case '2':
      return 1800;
    case '3':
    case '4':
      return 1900;
    case '5':
    case '6':
      return 2000;
    case '7':
    case '8':
      return 2100;
    default:
      return std::nullopt;
  }
}

}

std::optional<int>
checkDigit(std::string_view digits) {
  if (digits.size() != CHECKED_DIGITS || !allDigits(digits)) {
    return std::nullopt;
  }

  int remainder = weightedRemainder(digits, FIRST_WEIGHTS);

  if (remainder == 10) {
    remainder = weightedRemainder(digits, SECOND_WEIGHTS);
  }

  return remainder == 10 ? 0 : remainder;
}

std::optional<std::chrono::year_month_day>
birthDate(std::string_view code) {
  if (code.size() != LENGTH || !allDigits(code)) {
    return std::nullopt;
  }

  auto base = centuryBase(code[0]);

  if (!base.has_value()) {
    return std::nullopt;
  }

  const std::chrono::year_month_day date {
    std::chrono::year{*base + digitsToInt(code.substr(1, 2))},
    std::chrono::month{static_cast<unsigned>(digitsToInt(code.substr(3, 2)))},
    std::chrono::day{static_cast<unsigned>(digitsToInt(code.substr(5, 2)))}
  };

  if (!date.ok()) {
    return std::nullopt;
  }

  return date;
}

bool
isValid(std::string_view code) {
  if (!birthDate(code).has_value()) {
    return false;
  }

  return checkDigit(code.substr(0, CHECKED_DIGITS)) == code[CHECKED_DIGITS] - '0';
}

}
