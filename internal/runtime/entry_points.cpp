#include "api/upgrader/upgrader.hpp"

#include <exception>
#include <optional>
#include <utility>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/this_coro.hpp>

#include "internal/factory.hpp"

namespace upgrader {

namespace asio = boost::asio;

namespace {

// Drives a Task to completion on a private io_context owned by the
// calling thread. Blocking sessions never suspend, so this amounts to a
// plain call with the coroutine frames around it.
template <typename T>
T RunToCompletion(asio::io_context& io, Task<T> task) {
  std::exception_ptr failure;
  std::optional<T>   result;

  asio::co_spawn(io, std::move(task), [&](std::exception_ptr e, T value) {
    failure = e;
    if (!e) {
      result.emplace(std::move(value));
    }
  });
  io.run();

  if (failure) {
    std::rethrow_exception(failure);
  }
  return std::move(*result);
}

void RunToCompletion(asio::io_context& io, Task<void> task) {
  std::exception_ptr failure;

  asio::co_spawn(io, std::move(task), [&](std::exception_ptr e) { failure = e; });
  io.run();

  if (failure) {
    std::rethrow_exception(failure);
  }
}

} // namespace

UpgradeReport Upgrade(const std::filesystem::path& directory, const ConnectionTarget& target, const Options& options) {
  asio::io_context io;
  auto session = factory::MakeSession(factory::Strategy::kBlocking, target, options.ssl_mode, io.get_executor());
  return RunToCompletion(io, core::RunUpgrade(*session, directory, options));
}

void CheckConnection(const ConnectionTarget& target, SslMode ssl_mode) {
  asio::io_context io;
  auto session = factory::MakeSession(factory::Strategy::kBlocking, target, ssl_mode, io.get_executor());
  RunToCompletion(io, core::RunCheckConnection(*session, ssl_mode));
}

Task<UpgradeReport> UpgradeAsync(std::filesystem::path directory, ConnectionTarget target, Options options) {
  auto executor = co_await asio::this_coro::executor;
  auto session  = factory::MakeSession(factory::Strategy::kCooperative, target, options.ssl_mode, executor);
  co_return co_await core::RunUpgrade(*session, std::move(directory), std::move(options));
}

Task<void> CheckConnectionAsync(ConnectionTarget target, SslMode ssl_mode) {
  auto executor = co_await asio::this_coro::executor;
  auto session  = factory::MakeSession(factory::Strategy::kCooperative, target, ssl_mode, executor);
  co_await core::RunCheckConnection(*session, ssl_mode);
}

} // namespace upgrader
