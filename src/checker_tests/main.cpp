#define CATCH_CONFIG_RUNNER
#include "catch.hpp"
#include "mockreporter.hpp"

MockReporter MockReporter::INSTANCE;

int main(int argc, char* argv[]) {
  return Catch::Session().run( argc, argv );
}
