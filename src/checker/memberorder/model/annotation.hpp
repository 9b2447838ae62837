#ifndef MEMBERORDER_MODEL_ANNOTATION_HPP
#define MEMBERORDER_MODEL_ANNOTATION_HPP 1

#ifndef MEMBERORDER_MODEL_MEMBERGROUP_HPP
  #include "memberorder/model/membergroup.hpp"
#endif

namespace memberorder::model {

  /** An annotation that forces a member into a particular group, regardless of
      its kind or visibility. */
  class AnnotationRule {
  public:
    /** Annotation name as written in source, without the '@'. */
    StringRef name() const { return _name; }

    /** The group assigned to members that carry this annotation. */
    const MemberGroup* group() const { return _group; }

    static const AnnotationRule INPUT;
    static const AnnotationRule OUTPUT;
    static const AnnotationRule HOST_BINDING;
    static const AnnotationRule HOST_LISTENER;
    static const AnnotationRule VIEW_CHILD;
    static const AnnotationRule VIEW_CHILDREN;
    static const AnnotationRule CONTENT_CHILD;
    static const AnnotationRule CONTENT_CHILDREN;

    /** All recognized annotations. */
    static ArrayRef<const AnnotationRule*> all();

    /** Look up an annotation by name. Returns nullptr for annotations we don't recognize. */
    static const AnnotationRule* parse(StringRef name);

  private:
    AnnotationRule(const char* name, const MemberGroup* group)
      : _name(name)
      , _group(group)
    {}

    AnnotationRule(const AnnotationRule&) = delete;
    AnnotationRule& operator=(const AnnotationRule&) = delete;

    const char* _name;
    const MemberGroup* _group;
  };
}

#endif
