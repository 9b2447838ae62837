#ifndef MEMBERORDER_CONFIG_RULECONFIG_HPP
#define MEMBERORDER_CONFIG_RULECONFIG_HPP 1

#ifndef MEMBERORDER_RULES_MEMBERORDERING_HPP
  #include "memberorder/rules/memberordering.hpp"
#endif

#include <memory>
#include <string>
#include <vector>

namespace memberorder::config {
  using memberorder::error::Severity;
  using memberorder::rules::MemberOrderingRule;

  /** Settings for the member-ordering rule. */
  struct RuleConfig {
    /** Group keys, in order. Empty means the default order. */
    std::vector<std::string> order;
    bool alphabetize = false;
    Severity severity = error::WARNING;
  };

  /** Read the 'member-ordering' entry of a JSON configuration document into 'config'.
      Settings that the document does not mention are left alone. 'path' is only used
      for error messages. Returns false after reporting an error. */
  bool parseRuleConfig(StringRef text, StringRef path, RuleConfig& config);

  /** Read a JSON configuration file. Returns false after reporting an error. */
  bool loadRuleConfig(StringRef path, RuleConfig& config);

  /** Build the rule from its configuration. Returns null after reporting an error if the
      configured order is invalid. */
  std::unique_ptr<MemberOrderingRule> createRule(const RuleConfig& config);
}

#endif
