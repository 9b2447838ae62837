#ifndef MEMBERORDER_RULES_CLASSIFIER_HPP
#define MEMBERORDER_RULES_CLASSIFIER_HPP 1

#ifndef MEMBERORDER_MODEL_MEMBER_HPP
  #include "memberorder/model/member.hpp"
#endif

#ifndef MEMBERORDER_RULES_GROUPSORDER_HPP
  #include "memberorder/rules/groupsorder.hpp"
#endif

namespace memberorder::rules {
  using memberorder::model::MemberDescriptor;

  /** Assigns class members to member groups. */
  class Classifier {
  public:
    Classifier(const GroupsOrder& order) : _order(order) {}

    /** Return the group for this member, or nullptr if the member's group is not part
        of the configured order and the member should not be checked. */
    const MemberGroup* classify(const MemberDescriptor& member) const;

    /** The group a member belongs to, regardless of configuration. A recognized
        annotation takes precedence over the member's kind and visibility. */
    static const MemberGroup* groupOf(const MemberDescriptor& member);

  private:
    const GroupsOrder& _order;
  };
}

#endif
