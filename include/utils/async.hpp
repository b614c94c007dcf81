#pragma once

#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>
#include <future>
#include <memory>
#include <type_traits>

namespace vstore {
namespace utils {

// Runs fn on the pool and returns a future for its result. Exceptions thrown
// by fn are delivered through the future.
template <typename Fn>
auto post_task(boost::asio::thread_pool& pool, Fn fn) -> std::future<std::invoke_result_t<Fn>> {
  using Result = std::invoke_result_t<Fn>;
  auto task = std::make_shared<std::packaged_task<Result()>>(std::move(fn));
  auto future = task->get_future();
  boost::asio::post(pool, [task]() { (*task)(); });
  return future;
}

} // namespace utils
} // namespace vstore
