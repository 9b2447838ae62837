#ifndef MEMBERORDER_RULES_ISSUE_HPP
#define MEMBERORDER_RULES_ISSUE_HPP 1

#ifndef MEMBERORDER_ERROR_REPORTER_HPP
  #include "memberorder/error/reporter.hpp"
#endif

#include <string>

namespace memberorder::rules {
  using memberorder::error::Severity;
  using memberorder::source::Location;

  /** A problem found by a rule. */
  struct Issue {
    StringRef ruleId;
    Severity severity;
    Location location;
    std::string message;
  };
}

#endif
