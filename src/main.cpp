#include "core/options.hpp"
#include "core/runner.hpp"
#include "logging/console.hpp"
#include <iostream>

int main(int argc, char **argv) {
  auto opt = ParseArgs(argc, argv);
  if (!opt) {
    std::cerr << opt.error() << "\n" << Usage();
    return 1;
  }
  if (opt->help) {
    std::cout << Usage();
    return 0;
  }
  auto ro = MakeRunOptions(*opt);
  if (!ro) {
    std::cerr << ro.error() << "\n";
    return 1;
  }

  // A single session is always traced in full.
  logging::Console::SetVerbose(opt->verbose ||
                               (ro->mode != RunMode::attack &&
                                ro->numSessions == 1));
  return Run(*ro);
}
