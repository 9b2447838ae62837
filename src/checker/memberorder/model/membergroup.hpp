#ifndef MEMBERORDER_MODEL_MEMBERGROUP_HPP
#define MEMBERORDER_MODEL_MEMBERGROUP_HPP 1

#ifndef MEMBERORDER_COMMON_HPP
  #include "memberorder/common.hpp"
#endif

namespace memberorder::model {

  /** A bucket of class members that the ordering rule places relative to other buckets.
      The set of groups is closed; every group is one of the static instances below. */
  class MemberGroup {
  public:
    /** The stable key of this group, used both in configuration and in messages. */
    StringRef name() const { return _name; }

    /** True for groups that are only reachable through an annotation. */
    bool isFramework() const { return _framework; }

    bool operator==(const MemberGroup& other) const { return name() == other.name(); }
    bool operator!=(const MemberGroup& other) const { return name() != other.name(); }

    // Generic
    static const MemberGroup PUBLIC_FIELDS;
    static const MemberGroup PRIVATE_FIELDS;
    static const MemberGroup PUBLIC_GETTERS;
    static const MemberGroup PRIVATE_GETTERS;
    static const MemberGroup PUBLIC_SETTERS;
    static const MemberGroup PRIVATE_SETTERS;
    static const MemberGroup CONSTRUCTORS;
    static const MemberGroup PUBLIC_METHODS;
    static const MemberGroup PRIVATE_METHODS;

    // Angular
    static const MemberGroup ANGULAR_INPUTS;
    static const MemberGroup ANGULAR_OUTPUTS;
    static const MemberGroup ANGULAR_HOST_BINDINGS;
    static const MemberGroup ANGULAR_HOST_LISTENERS;
    static const MemberGroup ANGULAR_VIEW_CHILDREN;
    static const MemberGroup ANGULAR_CONTENT_CHILDREN;

    /** Every group, in taxonomy order. */
    static ArrayRef<const MemberGroup*> all();

    /** The order used when the configuration does not supply one: the whole taxonomy. */
    static ArrayRef<const MemberGroup*> defaultOrder();

    /** Find a group by key. Returns nullptr if there is no such group. */
    static const MemberGroup* parse(StringRef key);

  private:
    MemberGroup(const char* name, bool framework)
      : _name(name)
      , _framework(framework)
    {}

    MemberGroup(const MemberGroup&) = delete;
    MemberGroup& operator=(const MemberGroup&) = delete;

    const char* _name;
    bool _framework;
  };

  inline ::std::ostream& operator<<(::std::ostream& os, const MemberGroup& group) {
    os.write(group.name().data(), group.name().size());
    return os;
  }
}

#endif
