#include <chrono>
#include <exception>
#include <iostream>
#include <utility>
#include <string>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/use_awaitable.hpp>

#include "api/upgrader/upgrader.hpp"

namespace asio = boost::asio;

// Ticks while the upgrade runs, to show the thread is never blocked by it.
upgrader::Task<void> Heartbeat(const bool& done) {
  asio::steady_timer timer(co_await asio::this_coro::executor);
  while (!done) {
    timer.expires_after(std::chrono::milliseconds(100));
    co_await timer.async_wait(asio::use_awaitable);
    std::cout << "." << std::flush;
  }
}

int main(int argc, char** argv) {
  if (argc < 3) {
    std::cerr << "Usage: async_upgrade_example <upgraders-dir> <connection-string> [schema]" << '\n';
    return 1;
  }

  upgrader::ConnectionTarget target;
  target.connection_string = argv[2];

  upgrader::OptionsBuilder builder;
  if (argc > 3) {
    builder.Schema(argv[3]).CreateSchema(true);
  }

  asio::io_context   io;
  bool               done = false;
  std::exception_ptr failure;

  asio::co_spawn(io, upgrader::UpgradeAsync(argv[1], target, builder.Build()),
                 [&](std::exception_ptr e, upgrader::UpgradeReport report) {
                   done    = true;
                   failure = e;
                   if (!e) {
                     std::cout << "\napplied " << report.applied << " of " << report.total_steps << " upgraders" << '\n';
                   }
                 });
  asio::co_spawn(io, Heartbeat(done), asio::detached);
  io.run();

  if (failure) {
    try {
      std::rethrow_exception(failure);
    } catch (const upgrader::UpgraderError& e) {
      std::cerr << "\nupgrade failed (" << upgrader::util::ToString(e.Kind()) << "): " << e.what() << '\n';
      return 1;
    }
  }

  return 0;
}
