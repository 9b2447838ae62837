#ifndef MEMBERORDER_RULES_VERIFIER_HPP
#define MEMBERORDER_RULES_VERIFIER_HPP 1

#ifndef MEMBERORDER_RULES_CLASSIFIER_HPP
  #include "memberorder/rules/classifier.hpp"
#endif

#include <vector>

namespace memberorder::rules {
  using memberorder::model::MemberArray;

  /** Ordering verdict for a single checked member. */
  struct MemberOrder {
    /** The member this verdict is for. */
    const MemberDescriptor* member = nullptr;

    /** Group the member was classified into. */
    const MemberGroup* group = nullptr;

    /** The group this member should have come before. For a run of members in the same
        group, this is the group that preceded the run. Null for the first member. */
    const MemberGroup* previousGroup = nullptr;

    /** Name of this member, and of the member checked just before it. */
    StringRef name;
    StringRef previousName;

    /** The member's group is out of place. */
    bool isWrong = false;

    /** The member does not sort after the previous member of the same group. */
    bool isAlphabeticallyWrong = false;
  };

  /** Compute the verdict for a member given the verdict of the member checked before it
      (null at the start of a type body). */
  MemberOrder nextMemberOrder(
      const MemberOrder* last,
      const MemberDescriptor& member,
      const MemberGroup* group,
      const GroupsOrder& order);

  /** Check the members of one type body. Members whose group is not part of the order
      produce no verdict; the result is aligned with the remaining members. Alphabetical
      verdicts are only computed when 'alphabetize' is set. */
  std::vector<MemberOrder> verifyMembers(
      MemberArray members, const GroupsOrder& order, bool alphabetize);
}

#endif
