#pragma once

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/json.hpp>
#include <algorithm>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <thread>

#include "clusterboot_common.hpp"
#include "conf/bootstrap_config.hpp"
#include "my_error_codes.hpp"
#include "provision/account_registrar.hpp"
#include "provision/bootstrapper.hpp"
#include "store/memory_resource_store.hpp"
#include "store/sqlite_resource_store.hpp"
#include "util/cancellation.hpp"
#include "util/my_logging.hpp"

namespace clusterboot {

// Owns the store, the registrar and the signal wiring for one process.
class App {
  CliCtx &cli_ctx_;
  IBootstrapConfigProvider &config_provider_;
  CancellationSignal cancel_;
  boost::asio::io_context ioc_;
  std::unique_ptr<boost::asio::signal_set> signals_;
  std::thread signal_thread_;

public:
  App(IBootstrapConfigProvider &config_provider, CliCtx &cli_ctx)
      : cli_ctx_(cli_ctx), config_provider_(config_provider) {}

  ~App() { shutdown(); }

  App(const App &) = delete;
  App &operator=(const App &) = delete;

  int run() {
    BootstrapConfig config = config_provider_.get();
    if (cli_ctx_.params.dry_run) {
      // Nothing will ever become ready in an empty in-memory store.
      config.polling.deadline = std::chrono::seconds(0);
    }

    std::unique_ptr<IResourceStore> store;
    if (cli_ctx_.params.dry_run) {
      BOOST_LOG_SEV(app_logger(), trivial::info)
          << "Dry run, using an in-memory store";
      store = std::make_unique<InMemoryResourceStore>();
    } else {
      BOOST_LOG_SEV(app_logger(), trivial::info)
          << "Using store " << cli_ctx_.params.store_path;
      store = std::make_unique<SqliteResourceStore>(cli_ctx_.params.store_path);
    }
    HttpAccountRegistrar registrar(config.acme_dns);

    install_signal_handlers();

    ProvisionContext ctx{.store = *store, .config = config, .cancel = &cancel_};
    Bootstrapper bootstrapper(ctx, registrar);
    const auto interval = std::chrono::seconds(
        std::max<std::int64_t>(1, cli_ctx_.params.interval_seconds));

    int exit_code = EXIT_SUCCESS;
    while (true) {
      auto r = bootstrapper.run();
      if (r.is_err()) {
        exit_code = EXIT_FAILURE;
        BOOST_LOG_SEV(app_logger(), trivial::error) << r.error().what;
        std::cerr << r.error().what << std::endl;
        if (r.error().code == my_errors::PROVISION::CANCELLED) {
          break;
        }
      } else {
        exit_code = EXIT_SUCCESS;
      }
      if (!cli_ctx_.params.keep_running) {
        break;
      }
      BOOST_LOG_SEV(app_logger(), trivial::info)
          << "Next bootstrap pass in " << interval.count() << "s";
      if (cancel_.wait_for(interval)) {
        break;
      }
    }
    shutdown();
    return exit_code;
  }

  void shutdown() {
    if (signals_) {
      boost::system::error_code ec;
      signals_->cancel(ec);
      if (ec) {
        BOOST_LOG_SEV(app_logger(), trivial::debug)
            << "Shutdown: cancel signals: " << ec.message();
      }
    }
    ioc_.stop();
    if (signal_thread_.joinable()) {
      signal_thread_.join();
    }
    signals_.reset();
  }

private:
  void install_signal_handlers() {
    signals_ = std::make_unique<boost::asio::signal_set>(ioc_, SIGINT, SIGTERM);
    signals_->async_wait(
        [this](const boost::system::error_code &error, int signal) {
          if (!error) {
            const char *signal_name = (signal == SIGINT) ? "SIGINT" : "SIGTERM";
            std::cerr << signal_name << " received, cancelling bootstrap..."
                      << std::endl;
            BOOST_LOG_SEV(app_logger(), trivial::warning)
                << signal_name << " received";
            cancel_.cancel();
          }
        });
    signal_thread_ = std::thread([this] { ioc_.run(); });
  }
};

} // namespace clusterboot
