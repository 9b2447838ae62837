#include "memberorder/rules/memberordering.hpp"
#include <sstream>

namespace memberorder::rules {

  const char MemberOrderingRule::RULE_ID[] = "member-ordering";
  const char MemberOrderingRule::DOCUMENTATION_URL[] = "https://git.io/JJwqN";

  std::string MemberOrderingRule::orderMessage(const MemberOrder& mo) {
    assert(mo.previousGroup != nullptr);
    std::stringstream strm;
    strm << *mo.group << " should be before " << *mo.previousGroup;
    return strm.str();
  }

  std::string MemberOrderingRule::alphabeticalMessage(const MemberOrder& mo) {
    std::stringstream strm;
    strm << mo.name << " should be alphabetically before " << mo.previousName;
    return strm.str();
  }

  std::vector<Issue> MemberOrderingRule::check(const SourceFile& file) const {
    std::vector<MemberOrder> verdicts;
    for (auto& td : file.types()) {
      auto typeVerdicts = verify(td);
      verdicts.insert(verdicts.end(), typeVerdicts.begin(), typeVerdicts.end());
    }

    std::vector<Issue> issues;
    for (auto& mo : verdicts) {
      if (mo.isWrong) {
        issues.push_back({ RULE_ID, _severity, mo.member->getLocation(), orderMessage(mo) });
      }
    }
    if (_alphabetize) {
      for (auto& mo : verdicts) {
        if (mo.isAlphabeticallyWrong) {
          issues.push_back(
              { RULE_ID, _severity, mo.member->getLocation(), alphabeticalMessage(mo) });
        }
      }
    }
    return issues;
  }
}
