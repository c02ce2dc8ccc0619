#include "personal_code.hpp"

#include <doctest/doctest.h>

#include <chrono>

using namespace std::chrono;

TEST_SUITE_BEGIN("PersonalCode");

TEST_CASE("valid codes") {
  CHECK(personal_code::isValid("49002010965"));
  CHECK(personal_code::isValid("50307172740"));
  CHECK(personal_code::isValid("38411266610"));
  CHECK(personal_code::isValid("35006069515"));
}

TEST_CASE("check digit") {
  CHECK(personal_code::checkDigit("4900201096") == 5);
  CHECK(personal_code::checkDigit("3841126661") == 0);

  SUBCASE("wrong check digit") {
    CHECK_FALSE(personal_code::isValid("49002010966"));
    CHECK_FALSE(personal_code::isValid("38411266611"));
  }

  SUBCASE("needs exactly ten digits") {
    CHECK_FALSE(personal_code::checkDigit("").has_value());
    CHECK_FALSE(personal_code::checkDigit("490020").has_value());
    CHECK_FALSE(personal_code::checkDigit("49002010965").has_value());
    CHECK_FALSE(personal_code::checkDigit("490020109x").has_value());
  }
}

TEST_CASE("malformed codes") {
  CHECK_FALSE(personal_code::isValid(""));
  CHECK_FALSE(personal_code::isValid("abc"));
  CHECK_FALSE(personal_code::isValid("4900201096"));
  CHECK_FALSE(personal_code::isValid("490020109655"));
  CHECK_FALSE(personal_code::isValid("4900201096a"));
  CHECK_FALSE(personal_code::isValid(" 4900201096"));
}

TEST_CASE("century digit out of range") {
  CHECK_FALSE(personal_code::birthDate("09002010965").has_value());
  CHECK_FALSE(personal_code::birthDate("99002010965").has_value());
}

TEST_CASE("date must exist") {
  // month 13
  CHECK_FALSE(personal_code::isValid("39013019510"));
  // 1900 is not a leap year
  CHECK_FALSE(personal_code::isValid("30002299518"));
  // 2000 is
  CHECK(personal_code::isValid("60002299510"));
}

TEST_CASE("birth date") {
  auto date = personal_code::birthDate("49002010965");
  REQUIRE(date.has_value());
  CHECK(*date == year_month_day{year{1990}, February, day{1}});

  date = personal_code::birthDate("50307172740");
  REQUIRE(date.has_value());
  CHECK(*date == year_month_day{year{2003}, July, day{17}});

  SUBCASE("centuries") {
    CHECK(personal_code::birthDate("10001019518")->year() == year{1800});
    CHECK(personal_code::birthDate("35006069515")->year() == year{1950});
    CHECK(personal_code::birthDate("60002299510")->year() == year{2000});
    CHECK(personal_code::birthDate("70001019515")->year() == year{2100});
  }
}

TEST_SUITE_END();
