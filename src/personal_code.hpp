#pragma once

#include <chrono>
#include <cstddef>
#include <optional>
#include <string_view>

//Estonian personal identification code: GYYMMDDSSSC
namespace personal_code {

constexpr std::size_t LENGTH = 11;
constexpr std::size_t CHECKED_DIGITS = 10;

bool
isValid(std::string_view code);

//Check digit for the first ten digits of a code, absent for anything else
std::optional<int>
checkDigit(std::string_view digits);

//Absent when the code is malformed or encodes a date that doesn't exist
std::optional<std::chrono::year_month_day>
birthDate(std::string_view code);

}
