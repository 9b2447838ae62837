#include "catch.hpp"
#include "mockreporter.hpp"
#include "memberorder/rules/groupsorder.hpp"

using namespace memberorder::model;
using namespace memberorder::rules;

TEST_CASE("GroupsOrder", "[rules]") {
  SECTION("Default order") {
    GroupsOrder order;
    REQUIRE(order.groups().size() == 15);
    REQUIRE(order.rank(&MemberGroup::PUBLIC_FIELDS) == 0);
    REQUIRE(order.rank(&MemberGroup::CONSTRUCTORS) == 6);
    REQUIRE(order.rank(&MemberGroup::PRIVATE_METHODS) == 8);
    REQUIRE(order.contains(&MemberGroup::PUBLIC_GETTERS));
    REQUIRE(order.rank(&MemberGroup::ANGULAR_INPUTS) == 9);
    REQUIRE(order.rank(&MemberGroup::ANGULAR_CONTENT_CHILDREN) == 14);
  }

  SECTION("Empty configuration selects the default order") {
    UseMockReporter umr;
    const MemberGroup* groups[] = { &MemberGroup::CONSTRUCTORS };
    GroupsOrder order(groups);
    REQUIRE(GroupsOrder::parse({}, order));
    REQUIRE(order.groups().equals(MemberGroup::defaultOrder()));
    REQUIRE(MockReporter::INSTANCE.errorCount() == 0);
  }

  SECTION("Configured order") {
    UseMockReporter umr;
    GroupsOrder order;
    std::vector<std::string> keys = {
      "angular_inputs", "constructors", "private_fields", "public_methods",
    };
    REQUIRE(GroupsOrder::parse(keys, order));
    REQUIRE(order.groups().size() == 4);
    REQUIRE(order.rank(&MemberGroup::ANGULAR_INPUTS) == 0);
    REQUIRE(order.rank(&MemberGroup::CONSTRUCTORS) == 1);
    REQUIRE(order.rank(&MemberGroup::PRIVATE_FIELDS) == 2);
    REQUIRE(order.rank(&MemberGroup::PUBLIC_METHODS) == 3);
    REQUIRE_FALSE(order.contains(&MemberGroup::PUBLIC_FIELDS));
    REQUIRE(order.rank(&MemberGroup::PUBLIC_FIELDS) == -1);
  }

  SECTION("Unknown group key") {
    UseMockReporter umr;
    GroupsOrder order;
    std::vector<std::string> keys = { "public_fields", "static_fields" };
    REQUIRE_FALSE(GroupsOrder::parse(keys, order));
    REQUIRE(MockReporter::INSTANCE.errorCount() == 1);
    REQUIRE_THAT(
        MockReporter::INSTANCE.content().str(),
        Catch::Contains("Unknown member group 'static_fields'"));
    // A failed parse leaves the previous order in place.
    REQUIRE(order.groups().size() == 15);
  }

  SECTION("Duplicate group key") {
    UseMockReporter umr;
    GroupsOrder order;
    std::vector<std::string> keys = { "constructors", "public_methods", "constructors" };
    REQUIRE_FALSE(GroupsOrder::parse(keys, order));
    REQUIRE(MockReporter::INSTANCE.errorCount() == 1);
    REQUIRE_THAT(
        MockReporter::INSTANCE.content().str(),
        Catch::Contains("'constructors' appears more than once"));
  }
}
