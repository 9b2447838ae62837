#include "memberorder/model/annotation.hpp"
#include <llvm/ADT/StringMap.h>

namespace memberorder::model {

  const AnnotationRule AnnotationRule::INPUT("Input", &MemberGroup::ANGULAR_INPUTS);
  const AnnotationRule AnnotationRule::OUTPUT("Output", &MemberGroup::ANGULAR_OUTPUTS);
  const AnnotationRule AnnotationRule::HOST_BINDING(
      "HostBinding", &MemberGroup::ANGULAR_HOST_BINDINGS);
  const AnnotationRule AnnotationRule::HOST_LISTENER(
      "HostListener", &MemberGroup::ANGULAR_HOST_LISTENERS);
  const AnnotationRule AnnotationRule::VIEW_CHILD(
      "ViewChild", &MemberGroup::ANGULAR_VIEW_CHILDREN);
  const AnnotationRule AnnotationRule::VIEW_CHILDREN(
      "ViewChildren", &MemberGroup::ANGULAR_VIEW_CHILDREN);
  const AnnotationRule AnnotationRule::CONTENT_CHILD(
      "ContentChild", &MemberGroup::ANGULAR_CONTENT_CHILDREN);
  const AnnotationRule AnnotationRule::CONTENT_CHILDREN(
      "ContentChildren", &MemberGroup::ANGULAR_CONTENT_CHILDREN);

  namespace {
    const AnnotationRule* ALL_ANNOTATIONS[] = {
      &AnnotationRule::INPUT,
      &AnnotationRule::OUTPUT,
      &AnnotationRule::HOST_BINDING,
      &AnnotationRule::HOST_LISTENER,
      &AnnotationRule::VIEW_CHILD,
      &AnnotationRule::VIEW_CHILDREN,
      &AnnotationRule::CONTENT_CHILD,
      &AnnotationRule::CONTENT_CHILDREN,
    };
  }

  ArrayRef<const AnnotationRule*> AnnotationRule::all() {
    return ALL_ANNOTATIONS;
  }

  const AnnotationRule* AnnotationRule::parse(StringRef name) {
    static const llvm::StringMap<const AnnotationRule*> table = [] {
      llvm::StringMap<const AnnotationRule*> result;
      for (auto annotation : ALL_ANNOTATIONS) {
        result[annotation->name()] = annotation;
      }
      return result;
    }();
    auto it = table.find(name);
    return it != table.end() ? it->second : nullptr;
  }
}
