#include <boost/json.hpp>

#include "clusterboot_entry.hpp"
#include "clusterboot_common.hpp"
#include "util/my_logging.hpp"
#include "version.h"

#include <boost/program_options.hpp>
#include <cstdlib>
#include <fstream>
#include <iostream>

namespace po = boost::program_options;

namespace {
namespace js = boost::json;

fs::path get_env_path(const char *name) {
  if (const char *value = std::getenv(name); value && *value) {
    return fs::path(value);
  }
  return {};
}

struct DefaultPaths {
  fs::path config_file;
  fs::path store_file;
};

// CLUSTERBOOT_BASE_DIR replaces the /etc and /var/lib defaults.
DefaultPaths resolve_default_paths() {
  fs::path base_override = get_env_path("CLUSTERBOOT_BASE_DIR");
  if (!base_override.empty()) {
    return {base_override / "config" / "clusterboot.json",
            base_override / "runtime" / "clusterboot.db"};
  }
  return {fs::path("/etc/clusterboot/clusterboot.json"),
          fs::path("/var/lib/clusterboot/clusterboot.db")};
}

void ensure_directory_exists(const fs::path &dir) {
  if (dir.empty()) {
    return;
  }
  std::error_code ec;
  fs::create_directories(dir, ec);
  if (ec && !fs::exists(dir)) {
    throw std::runtime_error(std::string("Failed to create directory '") +
                             dir.string() + "': " + ec.message());
  }
}

void write_json_if_missing(const fs::path &file_path,
                           const js::value &content) {
  if (fs::exists(file_path)) {
    return;
  }
  ensure_directory_exists(file_path.parent_path());
  std::ofstream ofs(file_path);
  if (!ofs) {
    throw std::runtime_error("Unable to write default config file: " +
                             file_path.string());
  }
  ofs << js::serialize(content) << std::endl;
}

js::object default_config(const fs::path &log_dir) {
  return js::object{
      {"domain", ""},
      {"acme_email", ""},
      {"acme_environment", "production"},
      {"gateway_class_name", "cilium"},
      {"webhook_url", ""},
      {"polling", js::object{{"interval_seconds", 5},
                             {"deadline_seconds", 300},
                             {"backoff_multiplier", 1.0},
                             {"max_interval_seconds", 30}}},
      {"acme_dns",
       js::object{{"enabled", true},
                  {"register_url",
                   "http://acme-dns.kibaship.svc.cluster.local/register"},
                  {"replicas", 2},
                  {"allow_from", js::array{}}}},
      {"log", js::object{{"level", "info"},
                         {"log_dir", log_dir.string()},
                         {"log_file", "clusterboot"},
                         {"rotation_size", 10 * 1024 * 1024}}}};
}

} // namespace

int RunClusterbootApplication(int argc, char *argv[]) {
  for (int i = 1; i < argc; ++i) {
    std::string arg(argv[i]);
    if (arg == "-v" || arg == "--version" || arg == "version") {
      std::cout << MYAPP_VERSION << std::endl;
      return EXIT_SUCCESS;
    }
  }

  try {
    po::variables_map vm;
    po::options_description generic_desc(
        "clusterboot: bootstrap platform resources in dependency order");
    clusterboot::CliParams cli_params;
    const DefaultPaths defaults = resolve_default_paths();
    std::string config_arg;
    std::string store_arg;

    generic_desc.add_options() //
        ("config,c",
         po::value<std::string>(&config_arg)
             ->default_value(defaults.config_file.string()),
         "path of the JSON configuration file.") //
        ("store",
         po::value<std::string>(&store_arg)
             ->default_value(defaults.store_file.string()),
         "path of the SQLite resource store.") //
        ("verbose",
         po::value<std::string>(&cli_params.verbose)->default_value("info"),
         "verbosity level, like info, trace, vvvv.") //
        ("keep-running",
         po::bool_switch(&cli_params.keep_running)->default_value(false),
         "re-run the bootstrap every --interval seconds until signalled.") //
        ("interval",
         po::value<std::int64_t>(&cli_params.interval_seconds)
             ->default_value(60),
         "seconds between passes with --keep-running.") //
        ("dry-run", po::bool_switch(&cli_params.dry_run)->default_value(false),
         "provision into an in-memory store and discard the result.") //
        ("help,h", "Print help");

    po::store(po::parse_command_line(argc, argv, generic_desc), vm);
    po::notify(vm);

    if (vm.count("help")) {
      std::cerr << generic_desc << std::endl;
      std::cerr << "Environment:" << std::endl
                << "  CLUSTERBOOT_DOMAIN, CLUSTERBOOT_ACME_EMAIL, "
                   "CLUSTERBOOT_WEBHOOK_URL override the config file."
                << std::endl
                << "  CLUSTERBOOT_BASE_DIR relocates the default config and "
                   "store."
                << std::endl;
      return EXIT_SUCCESS;
    }

    cli_params.config_file = fs::path(config_arg);
    cli_params.store_path = fs::path(store_arg);

    fs::path log_dir = cli_params.store_path.parent_path() / "logs";
    try {
      write_json_if_missing(cli_params.config_file, default_config(log_dir));
    } catch (const std::exception &ex) {
      std::cerr << "Failed to prepare configuration '"
                << cli_params.config_file << "': " << ex.what() << std::endl;
      return EXIT_FAILURE;
    }

    clusterboot::BootstrapConfigProviderFile config_provider(
        cli_params.config_file);

    static clusterboot::CliCtx cli_ctx(std::move(vm), std::move(cli_params));

    clusterboot::LoggingConfig logging_config = config_provider.get().log;
    if (cli_ctx.is_specified_by_user("verbose")) {
      logging_config.level = cli_ctx.log_level();
    }
    try {
      ensure_directory_exists(logging_config.log_dir);
    } catch (const std::exception &ex) {
      std::cerr << "Failed to prepare log directory: " << ex.what()
                << std::endl;
      return EXIT_FAILURE;
    }
    init_my_log(logging_config);

    BOOST_LOG_SEV(app_logger(), trivial::info)
        << "clusterboot " << MYAPP_VERSION << " starting, config "
        << config_provider.path();
    if (config_provider.get().domain.empty()) {
      std::cerr << "Warning: no domain configured in "
                << config_provider.path()
                << "; domain-dependent steps will be skipped." << std::endl;
    }

    clusterboot::App app(config_provider, cli_ctx);
    return app.run();
  } catch (const std::exception &e) {
    std::cerr << "error catched on main: " << e.what() << std::endl;
    return EXIT_FAILURE;
  }
}

int main(int argc, char *argv[]) {
  return RunClusterbootApplication(argc, argv);
}
