#pragma once

#include <algorithm>
#include <boost/program_options.hpp>
#include <cstdint>
#include <filesystem>
#include <string>
#include <utility>

namespace fs = std::filesystem;
namespace po = boost::program_options;

namespace clusterboot {

struct CliParams {
  fs::path config_file;
  fs::path store_path;
  std::string verbose; // vvvv
  bool keep_running = false;
  std::int64_t interval_seconds = 60;
  bool dry_run = false;
};

struct CliCtx {
  po::variables_map vm;
  clusterboot::CliParams params;
  CliCtx(po::variables_map &&vm, clusterboot::CliParams &&params_)
      : vm(std::move(vm)), params(std::move(params_)) {}

  // True iff the option was given explicitly rather than defaulted.
  bool is_specified_by_user(const std::string &opt_name) const {
    auto it = vm.find(opt_name);
    if (it == vm.end()) {
      return false;
    }
    return !it->second.defaulted();
  }

  size_t verbosity_level() const {
    if (params.verbose.empty()) {
      return 3;
    }
    if (params.verbose == "trace") {
      return 5;
    } else if (params.verbose == "debug") {
      return 4;
    } else if (params.verbose == "info") {
      return 3;
    } else if (params.verbose == "warning") {
      return 2;
    } else if (params.verbose == "error") {
      return 1;
    }
    return std::count(params.verbose.begin(), params.verbose.end(), 'v');
  }

  // Boost.Log level name for verbosity_level().
  std::string log_level() const {
    switch (verbosity_level()) {
    case 0:
    case 1:
      return "error";
    case 2:
      return "warning";
    case 3:
      return "info";
    case 4:
      return "debug";
    default:
      return "trace";
    }
  }
};

} // namespace clusterboot
