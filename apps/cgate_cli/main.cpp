#include "commands/check.h"
#include "commands/classify.h"
#include "commands/common.h"
#include "commands/run.h"
#include "commands/state.h"

#include "cgate/core/version.h"

#include <iostream>
#include <string>

namespace {

void print_usage() {
  std::cerr << "content-gate v" << cgate::core::kBuildVersion << "\n"
            << "Usage: cgate_cli <command> [options]\n"
            << "Commands:\n"
            << "  classify   classify items into categories\n"
            << "  check      validate and score one section's units\n"
            << "  run        run or resume the pipeline for a run id\n"
            << "  state      inspect, checkpoint, repair or recover run state\n";
}

}  // namespace

int main(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  if (argc < 2) {
    print_usage();
    return kExitError;
  }

  const std::string subcommand = argv[1];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
  if (subcommand == "classify") {
    return cmd_classify(argc, argv);
  }
  if (subcommand == "check") {
    return cmd_check(argc, argv);
  }
  if (subcommand == "run") {
    return cmd_run(argc, argv);
  }
  if (subcommand == "state") {
    return cmd_state(argc, argv);
  }
  if (subcommand == "--version") {
    std::cout << cgate::core::kBuildVersion << "\n";
    return kExitOk;
  }

  std::cerr << "Unknown command: " << subcommand << "\n";
  print_usage();
  return kExitError;
}
