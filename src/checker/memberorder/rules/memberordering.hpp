#ifndef MEMBERORDER_RULES_MEMBERORDERING_HPP
#define MEMBERORDER_RULES_MEMBERORDERING_HPP 1

#ifndef MEMBERORDER_MODEL_SOURCEFILE_HPP
  #include "memberorder/model/sourcefile.hpp"
#endif

#ifndef MEMBERORDER_RULES_ISSUE_HPP
  #include "memberorder/rules/issue.hpp"
#endif

#ifndef MEMBERORDER_RULES_VERIFIER_HPP
  #include "memberorder/rules/verifier.hpp"
#endif

namespace memberorder::rules {
  using memberorder::model::SourceFile;
  using memberorder::model::TypeDecl;

  /** Rule that checks that class members are declared in group order, and
      optionally that members of a group are sorted by name. */
  class MemberOrderingRule {
  public:
    static const char RULE_ID[];
    static const char DOCUMENTATION_URL[];

    MemberOrderingRule(
        const GroupsOrder& order,
        bool alphabetize,
        Severity severity = error::WARNING)
      : _order(order)
      , _alphabetize(alphabetize)
      , _severity(severity)
    {}

    const GroupsOrder& order() const { return _order; }
    bool alphabetize() const { return _alphabetize; }
    Severity severity() const { return _severity; }

    /** Verdicts for every checked member of a type body. */
    std::vector<MemberOrder> verify(const TypeDecl& td) const {
      return verifyMembers(td.members(), _order, _alphabetize);
    }

    /** Check all type declarations of a file. Ordering issues come first, followed by
        alphabetical issues, each in source order. */
    std::vector<Issue> check(const SourceFile& file) const;

    /** Message for a member whose group is out of place. */
    static std::string orderMessage(const MemberOrder& mo);

    /** Message for a member that is not sorted within its group. */
    static std::string alphabeticalMessage(const MemberOrder& mo);

  private:
    GroupsOrder _order;
    bool _alphabetize;
    Severity _severity;
  };
}

#endif
