#pragma once

#include <utility>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/use_future.hpp>

namespace novelforge::asio_utils {

namespace asio = boost::asio;

// ============================================================================
// run_blocking: drive an awaitable to completion on a private io_context
// ============================================================================
// For callers without an event loop (the CLI, startup hooks, tests).
// Exceptions thrown inside the coroutine are rethrown here.
template<typename T>
T run_blocking(asio::awaitable<T> task) {
    asio::io_context ioc;
    auto result = asio::co_spawn(ioc, std::move(task), asio::use_future);
    ioc.run();
    return result.get();
}

} // namespace novelforge::asio_utils
