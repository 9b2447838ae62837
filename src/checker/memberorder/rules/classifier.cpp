#include "memberorder/model/annotation.hpp"
#include "memberorder/rules/classifier.hpp"

namespace memberorder::rules {
  using memberorder::model::AnnotationRule;

  namespace {
    const MemberGroup* annotatedGroup(const MemberDescriptor& member) {
      for (auto& name : member.annotations()) {
        if (auto rule = AnnotationRule::parse(name)) {
          return rule->group();
        }
      }
      return nullptr;
    }
  }

  const MemberGroup* Classifier::groupOf(const MemberDescriptor& member) {
    if (auto group = annotatedGroup(member)) {
      return group;
    }

    bool isPrivate = member.isPrivate();
    switch (member.kind) {
      case MemberDescriptor::Kind::FIELD:
        return isPrivate ? &MemberGroup::PRIVATE_FIELDS : &MemberGroup::PUBLIC_FIELDS;
      case MemberDescriptor::Kind::CONSTRUCTOR:
        return &MemberGroup::CONSTRUCTORS;
      case MemberDescriptor::Kind::GETTER:
        return isPrivate ? &MemberGroup::PRIVATE_GETTERS : &MemberGroup::PUBLIC_GETTERS;
      case MemberDescriptor::Kind::SETTER:
        return isPrivate ? &MemberGroup::PRIVATE_SETTERS : &MemberGroup::PUBLIC_SETTERS;
      case MemberDescriptor::Kind::METHOD:
        return isPrivate ? &MemberGroup::PRIVATE_METHODS : &MemberGroup::PUBLIC_METHODS;
    }
    assert(false && "Invalid member kind.");
    return nullptr;
  }

  const MemberGroup* Classifier::classify(const MemberDescriptor& member) const {
    auto group = groupOf(member);
    return _order.contains(group) ? group : nullptr;
  }
}
