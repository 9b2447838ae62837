#include "memberorder/model/member.hpp"
#include <llvm/ADT/StringSwitch.h>

namespace memberorder::model {

  bool parseKind(StringRef name, MemberDescriptor::Kind& result) {
    typedef MemberDescriptor::Kind Kind;
    auto kind = llvm::StringSwitch<Optional<Kind>>(name)
        .Case("field", Kind::FIELD)
        .Case("constructor", Kind::CONSTRUCTOR)
        .Case("getter", Kind::GETTER)
        .Case("setter", Kind::SETTER)
        .Case("method", Kind::METHOD)
        .Default(llvm::None);
    if (!kind) {
      return false;
    }
    result = *kind;
    return true;
  }
}
