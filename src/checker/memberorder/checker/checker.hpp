#ifndef MEMBERORDER_CHECKER_CHECKER_HPP
#define MEMBERORDER_CHECKER_CHECKER_HPP 1

#ifndef MEMBERORDER_CONFIG_RULECONFIG_HPP
  #include "memberorder/config/ruleconfig.hpp"
#endif

#include <memory>
#include <vector>

namespace memberorder::checker {
  using memberorder::model::SourceFile;
  using memberorder::rules::Issue;
  using memberorder::rules::MemberOrderingRule;

  /** Represents a checking job: the rule configuration and all of the member manifests
      to be checked. Settings come from the command line. */
  class Checker {
  public:
    int run();

  private:
    std::unique_ptr<MemberOrderingRule> _rule;
    std::vector<std::unique_ptr<SourceFile>> _files;

    bool configure();
    void loadManifests();
    size_t checkFile(const SourceFile& file);
  };

  /** Send a rule's issue to the diagnostics reporter. */
  void reportIssue(const Issue& issue);
}

#endif
