#include "bsk/config.h"
#include "bsk/log.h"
#include "bsk/paths.h"
#include "bskctl/cli_api.h"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace {

void print_usage() {
  std::cout << "Usage:\n"
            << "  bskctl ik --l1 <len> --l2 <len> --origin <x,y> --target <x,y> [--bend left|right]\n"
            << "  bskctl simulate [--config <path>] [--ticks <n>] [--every <n>] [--dt <s>] [--start <x,y>] [--target <x,y>]\n"
            << "                  [--seed <n>] [--offspring <n>] [--contours] [--trace <path>] [--out <path>]\n"
            << "  bskctl contours [--config <path>] [--ticks <n>] [--dt <s>] [--start <x,y>] [--target <x,y>]\n"
            << "                  [--seed <n>] [--offspring <n>] [--out <path>]\n"
            << "  bskctl validate [--config <path>]\n";
}

std::vector<std::string> collect_args(int argc, char** argv, int first) {
  std::vector<std::string> args;
  for (int i = first; i < argc; ++i) {
    args.emplace_back(argv[i]);
  }
  return args;
}

// Runs fn against the --out file when given, stdout otherwise.
template <typename Fn>
int with_output(const std::optional<fs::path>& out_path, Fn&& fn) {
  if (!out_path) {
    return fn(std::cout);
  }
  std::error_code ec;
  if (out_path->has_parent_path()) {
    fs::create_directories(out_path->parent_path(), ec);
  }
  std::ofstream out(*out_path, std::ios::binary | std::ios::trunc);
  if (!out) {
    bsk::log::error("failed to open output: " + out_path->string());
    return 1;
  }
  const int rc = fn(out);
  bsk::log::info("wrote " + out_path->string());
  return rc;
}

} // namespace

int main(int argc, char** argv) {
  if (argc < 2) {
    print_usage();
    return 1;
  }
  const std::string command = argv[1];
  if (command == "--help" || command == "-h") {
    print_usage();
    return 0;
  }

  SimulateOptions sim;
  IkOptions ik;
  std::string error;
  const std::vector<std::string> args = collect_args(argc, argv, 2);
  bool parsed = false;
  if (command == "ik") {
    parsed = parse_ik_args(args, ik, error);
  } else if (command == "simulate" || command == "contours" || command == "validate") {
    parsed = parse_simulate_args(args, sim, error);
  } else {
    print_usage();
    return 1;
  }
  if (!parsed) {
    std::cerr << "bskctl: " << error << "\n";
    print_usage();
    return 1;
  }

  const auto paths = init_cli(argc > 0 ? argv[0] : nullptr, sim.config_path);

  int rc = 0;
  if (command == "ik") {
    rc = run_ik(ik, std::cout);
  } else {
    std::vector<std::string> load_errors;
    const bsk::CreatureConfig config = bsk::load_creature_config(paths.creature_config, &load_errors);
    if (command == "validate") {
      rc = run_validate(config, load_errors, std::cout);
    } else {
      std::vector<std::string> errors = load_errors;
      if (!bsk::validate_creature_config(config, errors)) {
        for (const auto& e : errors) {
          bsk::log::error(e);
        }
        bsk::log::shutdown();
        return 1;
      }
      if (command == "simulate") {
        rc = with_output(sim.out_path,
                         [&](std::ostream& out) { return run_simulate(sim, config, out); });
      } else {
        rc = with_output(sim.out_path,
                         [&](std::ostream& out) { return run_contours(sim, config, out); });
      }
    }
  }
  bsk::log::shutdown();
  return rc;
}
