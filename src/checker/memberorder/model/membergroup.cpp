#include "memberorder/model/membergroup.hpp"
#include <llvm/ADT/StringMap.h>

namespace memberorder::model {

  const MemberGroup MemberGroup::PUBLIC_FIELDS("public_fields", false);
  const MemberGroup MemberGroup::PRIVATE_FIELDS("private_fields", false);
  const MemberGroup MemberGroup::PUBLIC_GETTERS("public_getters", false);
  const MemberGroup MemberGroup::PRIVATE_GETTERS("private_getters", false);
  const MemberGroup MemberGroup::PUBLIC_SETTERS("public_setters", false);
  const MemberGroup MemberGroup::PRIVATE_SETTERS("private_setters", false);
  const MemberGroup MemberGroup::CONSTRUCTORS("constructors", false);
  const MemberGroup MemberGroup::PUBLIC_METHODS("public_methods", false);
  const MemberGroup MemberGroup::PRIVATE_METHODS("private_methods", false);

  const MemberGroup MemberGroup::ANGULAR_INPUTS("angular_inputs", true);
  const MemberGroup MemberGroup::ANGULAR_OUTPUTS("angular_outputs", true);
  const MemberGroup MemberGroup::ANGULAR_HOST_BINDINGS("angular_host_bindings", true);
  const MemberGroup MemberGroup::ANGULAR_HOST_LISTENERS("angular_host_listeners", true);
  const MemberGroup MemberGroup::ANGULAR_VIEW_CHILDREN("angular_view_children", true);
  const MemberGroup MemberGroup::ANGULAR_CONTENT_CHILDREN("angular_content_children", true);

  namespace {
    const MemberGroup* ALL_GROUPS[] = {
      &MemberGroup::PUBLIC_FIELDS,
      &MemberGroup::PRIVATE_FIELDS,
      &MemberGroup::PUBLIC_GETTERS,
      &MemberGroup::PRIVATE_GETTERS,
      &MemberGroup::PUBLIC_SETTERS,
      &MemberGroup::PRIVATE_SETTERS,
      &MemberGroup::CONSTRUCTORS,
      &MemberGroup::PUBLIC_METHODS,
      &MemberGroup::PRIVATE_METHODS,
      &MemberGroup::ANGULAR_INPUTS,
      &MemberGroup::ANGULAR_OUTPUTS,
      &MemberGroup::ANGULAR_HOST_BINDINGS,
      &MemberGroup::ANGULAR_HOST_LISTENERS,
      &MemberGroup::ANGULAR_VIEW_CHILDREN,
      &MemberGroup::ANGULAR_CONTENT_CHILDREN,
    };

    const llvm::StringMap<const MemberGroup*>& groupsByName() {
      static const llvm::StringMap<const MemberGroup*> table = [] {
        llvm::StringMap<const MemberGroup*> result;
        for (auto group : ALL_GROUPS) {
          result[group->name()] = group;
        }
        return result;
      }();
      return table;
    }
  }

  ArrayRef<const MemberGroup*> MemberGroup::all() {
    return ALL_GROUPS;
  }

  ArrayRef<const MemberGroup*> MemberGroup::defaultOrder() {
    return all();
  }

  const MemberGroup* MemberGroup::parse(StringRef key) {
    auto& table = groupsByName();
    auto it = table.find(key);
    return it != table.end() ? it->second : nullptr;
  }
}
