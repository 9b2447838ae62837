#ifndef MEMBERORDER_MODEL_SOURCEFILE_HPP
#define MEMBERORDER_MODEL_SOURCEFILE_HPP 1

#ifndef MEMBERORDER_MODEL_MEMBER_HPP
  #include "memberorder/model/member.hpp"
#endif

#include <memory>

namespace memberorder::model {

  /** An analyzed source file and the type declarations found in it. */
  class SourceFile {
  public:
    SourceFile(std::unique_ptr<source::ProgramSource> source)
      : _source(std::move(source))
    {}

    /** Source text of this file. Locations of members point into it. */
    source::ProgramSource* source() { return _source.get(); }
    const source::ProgramSource* source() const { return _source.get(); }

    /** Path of the source file, for reporting. */
    StringRef path() const { return _source ? _source->path() : StringRef(); }

    /** Type declarations, in the order in which they appear. */
    std::vector<TypeDecl>& types() { return _types; }
    llvm::ArrayRef<TypeDecl> types() const { return _types; }

  private:
    std::unique_ptr<source::ProgramSource> _source;
    std::vector<TypeDecl> _types;
  };
}

#endif
