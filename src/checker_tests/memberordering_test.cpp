#include "catch.hpp"
#include "memberorder/rules/memberordering.hpp"

using namespace memberorder::model;
using namespace memberorder::rules;
using memberorder::source::Location;
using memberorder::source::StringSource;

namespace {
  typedef MemberDescriptor::Kind Kind;

  /** A source file with two classes, each with one misplaced and one unsorted member. */
  std::unique_ptr<SourceFile> makeFile() {
    auto file = std::make_unique<SourceFile>(std::make_unique<StringSource>(
        "widget.dart",
        "class A {\n"
        "  void _helper() {}\n"
        "  int count;\n"
        "  int b;\n"
        "  int a;\n"
        "}\n"
        "class B {\n"
        "  int y;\n"
        "  int x;\n"
        "  B();\n"
        "}\n"));
    auto src = file->source();

    file->types().emplace_back(Location(src, 1, 1, 6, 2), "A");
    auto& a = file->types().back().members();
    a.emplace_back(Kind::METHOD, Location(src, 2, 3, 2, 21), "_helper");
    a.emplace_back(Kind::FIELD, Location(src, 3, 3, 3, 13), "count");
    a.emplace_back(Kind::FIELD, Location(src, 4, 3, 4, 9), "b");
    a.emplace_back(Kind::FIELD, Location(src, 5, 3, 5, 9), "a");

    // Verification starts over at a new class, so 'y' is not compared with 'a'.
    file->types().emplace_back(Location(src, 7, 1, 11, 2), "B");
    auto& b = file->types().back().members();
    b.emplace_back(Kind::FIELD, Location(src, 8, 3, 8, 9), "y");
    b.emplace_back(Kind::FIELD, Location(src, 9, 3, 9, 9), "x");
    b.emplace_back(Kind::CONSTRUCTOR, Location(src, 10, 3, 10, 7), "");
    return file;
  }
}

TEST_CASE("MemberOrderingRule", "[rules]") {
  auto file = makeFile();

  SECTION("Identity") {
    REQUIRE(StringRef(MemberOrderingRule::RULE_ID) == "member-ordering");
    REQUIRE(StringRef(MemberOrderingRule::DOCUMENTATION_URL) == "https://git.io/JJwqN");
  }

  SECTION("Order issues only") {
    MemberOrderingRule rule(GroupsOrder(), false);
    auto issues = rule.check(*file);
    REQUIRE(issues.size() == 3);
    for (auto& issue : issues) {
      REQUIRE(issue.ruleId == "member-ordering");
      REQUIRE(issue.severity == memberorder::error::WARNING);
      REQUIRE(issue.message == "public_fields should be before private_methods");
    }
    REQUIRE(issues[0].location.startLine == 3);
    REQUIRE(issues[1].location.startLine == 4);
    REQUIRE(issues[2].location.startLine == 5);
    REQUIRE(issues[0].location.source == file->source());
  }

  SECTION("Alphabetical issues follow order issues") {
    MemberOrderingRule rule(GroupsOrder(), true, memberorder::error::INFO);
    auto issues = rule.check(*file);
    REQUIRE(issues.size() == 6);
    REQUIRE(issues[2].message == "public_fields should be before private_methods");
    REQUIRE(issues[3].message == "b should be alphabetically before count");
    REQUIRE(issues[3].location.startLine == 4);
    REQUIRE(issues[4].message == "a should be alphabetically before b");
    REQUIRE(issues[5].message == "x should be alphabetically before y");
    REQUIRE(issues[5].location.startLine == 9);
    REQUIRE(issues[5].severity == memberorder::error::INFO);
  }

  SECTION("Verdicts per type") {
    MemberOrderingRule rule(GroupsOrder(), true);
    auto verdicts = rule.verify(file->types()[1]);
    REQUIRE(verdicts.size() == 3);
    REQUIRE_FALSE(verdicts[0].isWrong);
    REQUIRE(verdicts[0].previousGroup == nullptr);
    REQUIRE(verdicts[1].isAlphabeticallyWrong);
    REQUIRE_FALSE(verdicts[2].isWrong);
  }

  SECTION("Messages") {
    MemberDescriptor member(Kind::GETTER, "size");
    MemberOrder mo;
    mo.member = &member;
    mo.group = &MemberGroup::PUBLIC_GETTERS;
    mo.previousGroup = &MemberGroup::CONSTRUCTORS;
    mo.name = "size";
    mo.previousName = "";
    REQUIRE(MemberOrderingRule::orderMessage(mo) == "public_getters should be before constructors");
    mo.previousName = "width";
    REQUIRE(MemberOrderingRule::alphabeticalMessage(mo) ==
        "size should be alphabetically before width");
  }

  SECTION("Groups left out of the order are not checked") {
    const MemberGroup* groups[] = { &MemberGroup::PUBLIC_FIELDS, &MemberGroup::CONSTRUCTORS };
    MemberOrderingRule rule((GroupsOrder(groups)), false);
    REQUIRE(rule.check(*file).empty());
  }
}
