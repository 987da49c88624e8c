#include <exception>
#include <iostream>
#include <utility>
#include <string>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>

#include "api/upgrader/upgrader.hpp"
#include "internal/cli/command_line.hpp"
#include "internal/cli/exit_status.hpp"
#include "internal/config/config_loader.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"

using upgrader::cli::Command;
using upgrader::observability::IntField;
using upgrader::observability::StringField;

namespace {

void Shutdown() {
  upgrader::observability::ShutdownLogging();
  upgrader::observability::ShutdownTracing();
}

template <typename Awaitable, typename OnResult>
void RunCooperative(Awaitable task, OnResult on_result) {
  boost::asio::io_context io;
  std::exception_ptr      failure;

  boost::asio::co_spawn(io, std::move(task), [&](std::exception_ptr e, auto... value) {
    failure = e;
    if (!e) {
      on_result(value...);
    }
  });
  io.run();

  if (failure) {
    std::rethrow_exception(failure);
  }
}

void PrintReport(const upgrader::UpgradeReport& report) {
  std::cout << "Upgraders found: " << report.total_steps << ", already applied: " << report.already_applied
            << ", applied now: " << report.applied << std::endl;
}

} // namespace

int main(int argc, char** argv) {
  upgrader::cli::Invocation invocation;
  try {
    invocation = upgrader::cli::ParseCommandLine(argc, argv);
  } catch (const upgrader::util::ConfigurationError& e) {
    std::cerr << e.what() << "\n\n" << upgrader::cli::Usage();
    return upgrader::cli::kExitUsage;
  }

  if (invocation.command == Command::kHelp) {
    std::cout << upgrader::cli::Usage();
    return argc < 2 ? upgrader::cli::kExitUsage : upgrader::cli::kExitOk;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration: file, then flags, then environment defaults
    // ------------------------------------------------------------
    upgrader::runtime::config::RuntimeConfig config;
    if (!invocation.config_path.empty()) {
      config = upgrader::config::ConfigLoader::LoadFromYaml(invocation.config_path);
    }
    config.MergeFrom(invocation.overrides);
    upgrader::cli::ApplyEnvironment(config);

    upgrader::observability::InitializeTracing(config);
    upgrader::observability::InitializeLogging(config);

    const auto target   = upgrader::cli::ResolveTarget(config);
    const auto options  = upgrader::cli::ResolveOptions(config);
    const auto strategy = upgrader::cli::ResolveStrategy(config);
    const bool blocking = strategy == upgrader::factory::Strategy::kBlocking;

    if (invocation.command == Command::kCheckConnection) {
      if (blocking) {
        upgrader::CheckConnection(target, options.ssl_mode);
      } else {
        RunCooperative(upgrader::CheckConnectionAsync(target, options.ssl_mode), [] {});
      }
      std::cout << "Connection OK" << std::endl;
    } else {
      const auto path = upgrader::cli::ResolvePath(config);
      UPGRADER_LOG_INFO("Starting upgrade", {StringField("path", path.string()), StringField("strategy", blocking ? "blocking" : "cooperative")});

      if (blocking) {
        PrintReport(upgrader::Upgrade(path, target, options));
      } else {
        RunCooperative(upgrader::UpgradeAsync(path, target, options), [](const upgrader::UpgradeReport& report) { PrintReport(report); });
      }
    }

    Shutdown();
  } catch (const std::exception& e) {
    const auto code = upgrader::cli::ExitCodeFor(e);
    UPGRADER_LOG_ERROR("Fatal error", {StringField("error", e.what()), IntField("exit_code", code)});
    std::cerr << "error: " << e.what() << std::endl;
    Shutdown();
    return code;
  }

  return upgrader::cli::kExitOk;
}
