#include "decision_engine.hpp"

#include <algorithm>
#include <charconv>

#include "personal_code.hpp"

namespace decision {

namespace {

constexpr long long ROUNDING_UNIT = 100;

}

DecisionEngine::DecisionEngine(config::DecisionConstants constants)
  : constants_(constants) {}

std::expected<models::LoanOffer, UNEXPECTED_CODE>
DecisionEngine::decide(std::string_view personalCode, long loanAmount, int loanPeriod) const {
  return decide(personalCode, loanAmount, loanPeriod, today());
}

std::expected<models::LoanOffer, UNEXPECTED_CODE>
DecisionEngine::decide(std::string_view personalCode, long loanAmount, int loanPeriod,
                       std::chrono::year_month_day today) const {

  if (auto error = verifyInputs(personalCode, loanAmount, loanPeriod, today)) {
    return std::unexpected(*error);
  }

  auto segment = creditSegment(personalCode);

  if (!segment.has_value()) {
    return std::unexpected(segment.error());
  }

  const int modifier = creditModifier(*segment);

  if (modifier == 0) {
    return std::unexpected(UNEXPECTED_CODE::NO_VALID_LOAN);
  }

  for (int period = loanPeriod; period <= constants_.maxLoanPeriod; ++period) {
    const long long highest = highestValidLoanAmount(modifier, period, loanAmount);

    if (highest >= constants_.minLoanAmount) {
      return models::LoanOffer{
        static_cast<int>(std::min<long long>(constants_.maxLoanAmount, highest)),
        period
      };
    }
  }

  return std::unexpected(UNEXPECTED_CODE::NO_VALID_LOAN);
}

std::optional<UNEXPECTED_CODE>
DecisionEngine::verifyInputs(std::string_view personalCode, long loanAmount, int loanPeriod,
                             std::chrono::year_month_day today) const {

  if (!personal_code::isValid(personalCode)) {
    return UNEXPECTED_CODE::INVALID_PERSONAL_CODE;
  }

  auto applicantAge = age(personalCode, today);

  if (!applicantAge.has_value()) {
    return applicantAge.error();
  }

  if (*applicantAge < constants_.minAge || *applicantAge > constants_.maxAge) {
    return UNEXPECTED_CODE::INVALID_AGE;
  }

  if (loanAmount < constants_.minLoanAmount || loanAmount > constants_.maxLoanAmount) {
    return UNEXPECTED_CODE::INVALID_LOAN_AMOUNT;
  }

  if (loanPeriod < constants_.minLoanPeriod || loanPeriod > constants_.maxLoanPeriod) {
    return UNEXPECTED_CODE::INVALID_LOAN_PERIOD;
  }

  return std::nullopt;
}

int
DecisionEngine::creditModifier(models::CREDIT_SEGMENT segment) const {
  switch (segment) {
    case models::CREDIT_SEGMENT::SEGMENT_1:
      return constants_.segment1CreditModifier;
    case models::CREDIT_SEGMENT::SEGMENT_2:
      return constants_.segment2CreditModifier;
    case models::CREDIT_SEGMENT::SEGMENT_3:
      return constants_.segment3CreditModifier;
    case models::CREDIT_SEGMENT::DEBT:
      break;
  }
  return 0;
}

long long
DecisionEngine::highestValidLoanAmount(int modifier, int loanPeriod, long loanAmount) const {
  CreditScore initialCreditScore = creditScore(modifier, loanPeriod, loanAmount);
  CreditScore score = initialCreditScore;

  if (initialCreditScore > 1) {
    while (score > 1) {
      loanAmount += constants_.loanAmountStep;
      score = creditScore(modifier, loanPeriod, loanAmount);
    }
  } else if (initialCreditScore < 1) {
    while (score < 1) {
      loanAmount -= constants_.loanAmountStep;

      // Anything found below here is under the minimum, the caller extends the period instead
      if (loanAmount < constants_.minLoanAmount) {
        return 0;
      }

      score = creditScore(modifier, loanPeriod, loanAmount);
    }
  }

  const long long weight = static_cast<long long>(modifier) * loanPeriod;

  return weight * score.denominator / score.numerator / ROUNDING_UNIT * ROUNDING_UNIT;
}

std::expected<int, UNEXPECTED_CODE>
age(std::string_view personalCode, std::chrono::year_month_day today) {
  auto birth = personal_code::birthDate(personalCode);

  if (!birth.has_value()) {
    return std::unexpected(UNEXPECTED_CODE::INVALID_PERSONAL_CODE);
  }

  int years = static_cast<int>(today.year()) - static_cast<int>(birth->year());

  if (today.month() < birth->month()
      || (today.month() == birth->month() && today.day() < birth->day())) {
    --years;
  }

  return years;
}

std::expected<models::CREDIT_SEGMENT, UNEXPECTED_CODE>
creditSegment(std::string_view personalCode) {
  if (personalCode.size() < 4) {
    return std::unexpected(UNEXPECTED_CODE::INVALID_PERSONAL_CODE);
  }

  const auto lastFour = personalCode.substr(personalCode.size() - 4);
  int segment = 0;

  auto [ptr, ec] = std::from_chars(lastFour.data(), lastFour.data() + lastFour.size(), segment);

  if (ec != std::errc{} || ptr != lastFour.data() + lastFour.size() || segment < 0) {
    return std::unexpected(UNEXPECTED_CODE::INVALID_PERSONAL_CODE);
  }

  if (segment < 2500) {
    return models::CREDIT_SEGMENT::DEBT;
  } else if (segment < 5000) {
    return models::CREDIT_SEGMENT::SEGMENT_1;
  } else if (segment < 7500) {
    return models::CREDIT_SEGMENT::SEGMENT_2;
  }

  return models::CREDIT_SEGMENT::SEGMENT_3;
}

CreditScore
creditScore(int creditModifier, int loanPeriod, long loanAmount) {
  return CreditScore{static_cast<long long>(creditModifier) * loanPeriod, loanAmount};
}

std::strong_ordering
operator<=>(const CreditScore &score, long long value) {
  return score.numerator <=> value * score.denominator;
}

bool
operator==(const CreditScore &score, long long value) {
  return score.numerator == value * score.denominator;
}

std::string
errorMessage(UNEXPECTED_CODE code) {
  switch (code) {
    case UNEXPECTED_CODE::INVALID_PERSONAL_CODE:
      return "Invalid personal ID code!";
    case UNEXPECTED_CODE::INVALID_AGE:
      return "You are not approved for a loan due to age.";
    case UNEXPECTED_CODE::INVALID_LOAN_AMOUNT:
      return "Invalid loan amount!";
    case UNEXPECTED_CODE::INVALID_LOAN_PERIOD:
      return "Invalid loan period!";
    case UNEXPECTED_CODE::NO_VALID_LOAN:
      return "You are not approved for a loan.";
    case UNEXPECTED_CODE::INVALID_CONFIG:
      return "Invalid configuration!";
  }
  return "Unexpected error!";
}

models::Decision
toDecision(const std::expected<models::LoanOffer, UNEXPECTED_CODE> &result) {
  models::Decision decision;

  if (result.has_value()) {
    decision.loanAmount = result->loanAmount;
    decision.loanPeriod = result->loanPeriod;
  } else {
    decision.errorMessage = errorMessage(result.error());
  }

  return decision;
}

std::chrono::year_month_day
today() {
  return std::chrono::year_month_day{
    std::chrono::floor<std::chrono::days>(std::chrono::system_clock::now())
  };
}

}
