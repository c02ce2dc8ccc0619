#pragma once

enum UNEXPECTED_CODE {
  INVALID_PERSONAL_CODE,
  INVALID_AGE,
  INVALID_LOAN_AMOUNT,
  INVALID_LOAN_PERIOD,
  NO_VALID_LOAN,
  INVALID_CONFIG
};
