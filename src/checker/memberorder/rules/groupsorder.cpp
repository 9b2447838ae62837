#include "memberorder/error/diagnostics.hpp"
#include "memberorder/rules/groupsorder.hpp"

namespace memberorder::rules {
  using memberorder::error::diag;

  GroupsOrder::GroupsOrder()
    : GroupsOrder(MemberGroup::defaultOrder())
  {}

  GroupsOrder::GroupsOrder(ArrayRef<const MemberGroup*> groups) {
    for (auto group : groups) {
      assert(!contains(group) && "Duplicate group in member order");
      _ranks[group->name()] = int(_groups.size());
      _groups.push_back(group);
    }
  }

  bool GroupsOrder::parse(ArrayRef<std::string> keys, GroupsOrder& result) {
    if (keys.empty()) {
      result = GroupsOrder();
      return true;
    }

    SmallVector<const MemberGroup*, 16> groups;
    bool success = true;
    for (auto& key : keys) {
      auto group = MemberGroup::parse(key);
      if (!group) {
        diag.error() << "Unknown member group '" << key << "' in member order.";
        success = false;
      } else if (std::find(groups.begin(), groups.end(), group) != groups.end()) {
        diag.error() << "Member group '" << key << "' appears more than once in member order.";
        success = false;
      } else {
        groups.push_back(group);
      }
    }

    if (success) {
      result = GroupsOrder(groups);
    }
    return success;
  }
}
