#include "memberorder/checker/checker.hpp"
#include "config.h"
#include "llvm/Support/CommandLine.h"
#include "llvm/Support/raw_ostream.h"

using memberorder::checker::Checker;

static void printVersion(llvm::raw_ostream& out) {
  out << "memberorder " << MEMBERORDER_VERSION << "\n";
}

int main(int argc, char **argv) {
  llvm::cl::SetVersionPrinter(printVersion);
  llvm::cl::ParseCommandLineOptions(argc, argv, "Checks the order of class members.\n");
  Checker checker;
  return checker.run();
}
