#include "memberorder/rules/verifier.hpp"

namespace memberorder::rules {

  MemberOrder nextMemberOrder(
      const MemberOrder* last,
      const MemberDescriptor& member,
      const MemberGroup* group,
      const GroupsOrder& order) {
    MemberOrder result;
    result.member = &member;
    result.group = group;
    result.name = member.name();
    if (!last) {
      return result;
    }

    bool sameGroup = *last->group == *group;
    result.previousGroup = sameGroup ? last->previousGroup : last->group;
    result.previousName = last->name;
    // Once a group is out of place, the rest of its run is too.
    result.isWrong =
        (sameGroup && last->isWrong) || order.rank(last->group) > order.rank(group);
    result.isAlphabeticallyWrong = sameGroup && result.name.compare(last->name) != 1;
    return result;
  }

  std::vector<MemberOrder> verifyMembers(
      MemberArray members, const GroupsOrder& order, bool alphabetize) {
    Classifier classifier(order);
    std::vector<MemberOrder> result;
    result.reserve(members.size());
    for (auto& member : members) {
      auto group = classifier.classify(member);
      if (!group) {
        continue;
      }
      result.push_back(nextMemberOrder(
          result.empty() ? nullptr : &result.back(), member, group, order));
    }

    if (!alphabetize) {
      for (auto& memberOrder : result) {
        memberOrder.isAlphabeticallyWrong = false;
      }
    }
    return result;
  }
}
