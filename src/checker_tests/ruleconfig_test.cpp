#include "catch.hpp"
#include "mockreporter.hpp"
#include "memberorder/config/ruleconfig.hpp"

using namespace memberorder::config;
using namespace memberorder::model;

TEST_CASE("RuleConfig", "[config]") {
  SECTION("Defaults") {
    UseMockReporter umr;
    RuleConfig config;
    REQUIRE(parseRuleConfig("{}", "test.json", config));
    REQUIRE(config.order.empty());
    REQUIRE_FALSE(config.alphabetize);
    REQUIRE(config.severity == WARNING);

    REQUIRE(parseRuleConfig("{ \"rules\": { \"other-rule\": {} } }", "test.json", config));
    REQUIRE(config.order.empty());
    REQUIRE(MockReporter::INSTANCE.errorCount() == 0);
  }

  SECTION("Rule settings") {
    UseMockReporter umr;
    RuleConfig config;
    REQUIRE(parseRuleConfig(
        "{ \"rules\": { \"member-ordering\": {"
        "    \"order\": [\"constructors\", \"public_methods\"],"
        "    \"alphabetize\": true,"
        "    \"severity\": \"error\""
        "} } }",
        "test.json", config));
    REQUIRE(config.order == std::vector<std::string>({ "constructors", "public_methods" }));
    REQUIRE(config.alphabetize);
    REQUIRE(config.severity == ERROR);
  }

  SECTION("Settings not mentioned are kept") {
    UseMockReporter umr;
    RuleConfig config;
    config.alphabetize = true;
    config.order = { "constructors" };
    REQUIRE(parseRuleConfig(
        "{ \"rules\": { \"member-ordering\": { \"severity\": \"info\" } } }",
        "test.json", config));
    REQUIRE(config.alphabetize);
    REQUIRE(config.order.size() == 1);
    REQUIRE(config.severity == INFO);
  }

  SECTION("Malformed documents") {
    UseMockReporter umr;
    RuleConfig config;
    REQUIRE_FALSE(parseRuleConfig("{ \"rules\": ", "test.json", config));
    REQUIRE_FALSE(parseRuleConfig("[]", "test.json", config));
    REQUIRE_FALSE(parseRuleConfig(
        "{ \"rules\": { \"member-ordering\": { \"alphabetize\": \"yes\" } } }",
        "test.json", config));
    REQUIRE_FALSE(parseRuleConfig(
        "{ \"rules\": { \"member-ordering\": { \"severity\": \"loud\" } } }",
        "test.json", config));
    REQUIRE(MockReporter::INSTANCE.errorCount() == 4);
    REQUIRE_THAT(MockReporter::INSTANCE.content().str(), Catch::Contains("test.json"));
    REQUIRE_THAT(
        MockReporter::INSTANCE.content().str(), Catch::Contains("unknown severity 'loud'"));
  }

  SECTION("Missing file") {
    UseMockReporter umr;
    RuleConfig config;
    REQUIRE_FALSE(loadRuleConfig(MEMBERORDER_TESTDATA_DIR "/no-such-file.json", config));
    REQUIRE_THAT(
        MockReporter::INSTANCE.content().str(),
        Catch::Contains("Cannot read configuration file"));
  }

  SECTION("Load file") {
    UseMockReporter umr;
    RuleConfig config;
    REQUIRE(loadRuleConfig(MEMBERORDER_TESTDATA_DIR "/config.json", config));
    REQUIRE(config.alphabetize);
    REQUIRE(config.order.size() == 4);
    REQUIRE(config.order[0] == "angular_inputs");
  }

  SECTION("Create rule") {
    UseMockReporter umr;
    RuleConfig config;
    config.order = { "angular_inputs", "public_fields" };
    config.alphabetize = true;
    auto rule = createRule(config);
    REQUIRE(rule != nullptr);
    REQUIRE(rule->alphabetize());
    REQUIRE(rule->severity() == WARNING);
    REQUIRE(rule->order().rank(&MemberGroup::ANGULAR_INPUTS) == 0);
    REQUIRE_FALSE(rule->order().contains(&MemberGroup::CONSTRUCTORS));
  }

  SECTION("Create rule with an unknown group") {
    UseMockReporter umr;
    RuleConfig config;
    config.order = { "public_fields", "protected_fields" };
    REQUIRE(createRule(config) == nullptr);
    REQUIRE(MockReporter::INSTANCE.errorCount() == 1);
    REQUIRE_THAT(
        MockReporter::INSTANCE.content().str(),
        Catch::Contains("Unknown member group 'protected_fields'"));
  }
}
