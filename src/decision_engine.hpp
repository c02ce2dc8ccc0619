#pragma once

#include <chrono>
#include <compare>
#include <expected>
#include <optional>
#include <string>
#include <string_view>

#include "config.hpp"
#include "models.hpp"
#include "unexpected_codes.hpp"

namespace decision {

//modifier * period / amount, kept as a fraction so comparisons against 1 are exact
struct CreditScore {
  long long numerator;
  long long denominator;

  double value() const { return static_cast<double>(numerator) / static_cast<double>(denominator); }
};

std::strong_ordering
operator<=>(const CreditScore &score, long long value);

bool
operator==(const CreditScore &score, long long value);

/**
 * Calculates the approved loan amount and period for an applicant.
 * The amount is bounded by a credit score derived from the credit modifier
 * of the applicant's segment, which is read from the last four digits of
 * the personal code:
 *   Debt      0000...2499
 *   Segment 1 2500...4999
 *   Segment 2 5000...7499
 *   Segment 3 7500...9999
 *
 * The engine holds only its constants, so one instance can serve
 * concurrent callers.
 */
class DecisionEngine {
public:
  explicit DecisionEngine(config::DecisionConstants constants);

  //Uses today's UTC date to derive the applicant's age
  std::expected<models::LoanOffer, UNEXPECTED_CODE>
  decide(std::string_view personalCode, long loanAmount, int loanPeriod) const;

  std::expected<models::LoanOffer, UNEXPECTED_CODE>
  decide(std::string_view personalCode, long loanAmount, int loanPeriod,
         std::chrono::year_month_day today) const;

  //Checks run in order: personal code, age, amount, period
  std::optional<UNEXPECTED_CODE>
  verifyInputs(std::string_view personalCode, long loanAmount, int loanPeriod,
               std::chrono::year_month_day today) const;

  int
  creditModifier(models::CREDIT_SEGMENT segment) const;

  //Highest amount approvable at loanPeriod, rounded down to a whole hundred.
  //Returns 0 when stepping down would leave the configured amount range.
  //May exceed the maximum loan amount, decide() applies the cap.
  long long
  highestValidLoanAmount(int modifier, int loanPeriod, long loanAmount) const;

  const config::DecisionConstants &
  constants() const { return constants_; }

private:
  config::DecisionConstants constants_;
};

std::expected<int, UNEXPECTED_CODE>
age(std::string_view personalCode, std::chrono::year_month_day today);

std::expected<models::CREDIT_SEGMENT, UNEXPECTED_CODE>
creditSegment(std::string_view personalCode);

//loanAmount must be positive
CreditScore
creditScore(int creditModifier, int loanPeriod, long loanAmount);

std::string
errorMessage(UNEXPECTED_CODE code);

models::Decision
toDecision(const std::expected<models::LoanOffer, UNEXPECTED_CODE> &result);

std::chrono::year_month_day
today();

}
