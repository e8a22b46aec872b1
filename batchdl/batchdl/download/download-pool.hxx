#pragma once

#include <memory>
#include <cstddef>
#include <utility>
#include <exception>
#include <stdexcept>
#include <algorithm>

#include <boost/asio.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/redirect_error.hpp>

namespace batchdl
{
  namespace asio = boost::asio;

  namespace detail
  {
    template <typename F>
    struct pool_state
    {
      F job;
      std::size_t count;
      std::size_t next {0};
      std::size_t running {0};
      std::exception_ptr error;
      asio::steady_timer done;

      pool_state (F j, std::size_t n, const asio::any_io_executor& ex)
        : job (std::move (j)), count (n), done (ex)
      {
        done.expires_at (asio::steady_timer::time_point::max ());
      }
    };

    // Take the next index off the shared queue until it is drained.
    //
    template <typename F>
    asio::awaitable<void>
    pool_worker (std::shared_ptr<pool_state<F>> s)
    {
      while (s->next < s->count)
      {
        std::size_t i (s->next++);

        try
        {
          co_await s->job (i);
        }
        catch (...)
        {
          // Keep draining. The first error is rethrown once all workers are
          // done.
          //
          if (!s->error)
            s->error = std::current_exception ();
        }
      }

      if (--s->running == 0)
        s->done.cancel ();
    }
  }

  // Run job(0) ... job(n - 1) with at most limit of them in flight.
  //
  // The indices are drained from a shared queue by limit worker coroutines,
  // so a job starts as soon as any other finishes and the order of
  // completion is unspecified. Returns once every job has finished. Jobs are
  // expected to handle their own errors; an exception that escapes one does
  // not stop the others and is rethrown at the end.
  //
  // All workers run on the calling coroutine's executor, which must not run
  // handlers concurrently (single-threaded io_context or a strand).
  //
  template <typename F>
  asio::awaitable<void>
  run_bounded (std::size_t n, std::size_t limit, F job)
  {
    if (limit == 0)
      throw std::invalid_argument ("concurrency limit must be positive");

    if (n == 0)
      co_return;

    auto ex (co_await asio::this_coro::executor);

    auto s (std::make_shared<detail::pool_state<F>> (std::move (job), n, ex));

    std::size_t w (std::min (n, limit));
    s->running = w;

    for (std::size_t i (0); i != w; ++i)
      asio::co_spawn (ex, detail::pool_worker (s), asio::detached);

    if (s->running != 0)
    {
      boost::system::error_code ec;
      co_await s->done.async_wait (
        asio::redirect_error (asio::use_awaitable, ec));
    }

    if (s->error)
      std::rethrow_exception (s->error);
  }
}
