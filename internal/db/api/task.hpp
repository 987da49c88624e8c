#pragma once

#include <utility>

#include <boost/asio/awaitable.hpp>

namespace upgrader {

/*
  Return type of every database operation.

  Blocking sessions complete the awaitable without ever suspending;
  cooperative sessions suspend on socket readiness. Engine code awaits
  either one the same way.
*/
template <typename T>
using Task = boost::asio::awaitable<T>;

} // namespace upgrader
