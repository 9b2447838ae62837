#ifndef MEMBERORDER_RULES_GROUPSORDER_HPP
#define MEMBERORDER_RULES_GROUPSORDER_HPP 1

#ifndef MEMBERORDER_MODEL_MEMBERGROUP_HPP
  #include "memberorder/model/membergroup.hpp"
#endif

#ifndef LLVM_ADT_STRINGMAP_H
  #include <llvm/ADT/StringMap.h>
#endif

#include <string>

namespace memberorder::rules {
  using memberorder::model::MemberGroup;

  /** The configured canonical order of member groups. A group's rank is its index in
      this sequence; groups that are absent are not checked at all. */
  class GroupsOrder {
  public:
    /** Construct the default order. */
    GroupsOrder();

    /** Construct an order from a list of distinct groups. */
    explicit GroupsOrder(ArrayRef<const MemberGroup*> groups);

    /** Build an order from configured group keys. An empty list selects the default
        order. Unknown or repeated keys are reported as errors, and false is returned. */
    static bool parse(ArrayRef<std::string> keys, GroupsOrder& result);

    /** Groups in order. */
    ArrayRef<const MemberGroup*> groups() const { return _groups; }

    /** Whether members of this group take part in checking. */
    bool contains(const MemberGroup* group) const {
      return _ranks.count(group->name()) > 0;
    }

    /** Index of the group within the order, or -1 if it is not present. */
    int rank(const MemberGroup* group) const {
      auto it = _ranks.find(group->name());
      return it != _ranks.end() ? it->second : -1;
    }

  private:
    SmallVector<const MemberGroup*, 16> _groups;
    llvm::StringMap<int> _ranks;
  };
}

#endif
