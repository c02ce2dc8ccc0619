#pragma once

#include <optional>
#include <string>

namespace models {
  enum CREDIT_SEGMENT: const unsigned char {
    DEBT,
    SEGMENT_1,
    SEGMENT_2,
    SEGMENT_3
  };

  struct LoanRequest {
    std::string
      personalCode;
    long
      loanAmount;
    int
      loanPeriod;
  };

  struct LoanOffer {
    int
      loanAmount;
    int
      loanPeriod;
  };

  //Exactly one of (loanAmount + loanPeriod) or errorMessage is set
  struct Decision {
    std::optional<int>
      loanAmount;
    std::optional<int>
      loanPeriod;
    std::optional<std::string>
      errorMessage;
  };
}
