#ifndef MEMBERORDER_MODEL_MEMBER_HPP
#define MEMBERORDER_MODEL_MEMBER_HPP 1

#ifndef MEMBERORDER_COMMON_HPP
  #include "memberorder/common.hpp"
#endif

#ifndef MEMBERORDER_SOURCE_LOCATION_HPP
  #include "memberorder/source/location.hpp"
#endif

#include <string>
#include <vector>

namespace memberorder::model {
  using memberorder::source::Locatable;
  using memberorder::source::Location;

  /** A single member of a class body, as it appears in source. */
  class MemberDescriptor : public Locatable {
  public:
    enum class Kind {
      FIELD = 1,
      CONSTRUCTOR,
      GETTER,
      SETTER,
      METHOD,
    };

    const Kind kind;

    MemberDescriptor(Kind kind, const Location& location, StringRef name)
      : kind(kind)
      , _location(location)
      , _name(name.begin(), name.end())
      , _private(isPrivateName(name))
    {}

    MemberDescriptor(Kind kind, StringRef name)
      : MemberDescriptor(kind, Location(), name)
    {}

    /** Name of the member. Unnamed constructors have an empty name. */
    StringRef name() const { return _name; }

    /** Whether this member is private. Defaults to the naming convention. */
    bool isPrivate() const { return _private; }
    void setPrivate(bool value) { _private = value; }

    /** Annotation names attached to this member, in source order. */
    const std::vector<std::string>& annotations() const { return _annotations; }
    std::vector<std::string>& annotations() { return _annotations; }

    /** Source location of this member. */
    const Location& getLocation() const { return _location; }

    /** Names that start with an underscore are private. */
    static bool isPrivateName(StringRef name) { return name.startswith("_"); }

  private:
    Location _location;
    std::string _name;
    bool _private;
    std::vector<std::string> _annotations;
  };

  typedef std::vector<MemberDescriptor> MemberList;
  typedef llvm::ArrayRef<MemberDescriptor> MemberArray;

  /** A class body: the members it declares, in source order. */
  class TypeDecl : public Locatable {
  public:
    TypeDecl(const Location& location, StringRef name)
      : _location(location)
      , _name(name.begin(), name.end())
    {}

    /** Name of the type. */
    StringRef name() const { return _name; }

    /** Members of this type, in the order in which they appear. */
    MemberList& members() { return _members; }
    MemberArray members() const { return _members; }

    const Location& getLocation() const { return _location; }

  private:
    Location _location;
    std::string _name;
    MemberList _members;
  };

  /** Look up a member kind by its manifest name ("field", "getter", ...). */
  bool parseKind(StringRef name, MemberDescriptor::Kind& result);
}

#endif
