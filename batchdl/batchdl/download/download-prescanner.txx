#include <iostream>

#include <batchdl/diagnostics.hxx>
#include <batchdl/download/download-pool.hxx>

namespace batchdl
{
  template <typename T>
  asio::awaitable<size_map> basic_size_prescanner<T>::
  scan (std::vector<prescan_target> ts)
  {
    size_map r;

    failures_ = 0;
    done_ = 0;
    total_ = ts.size ();

    if (ts.empty ())
      co_return r;

    trace (trace_level::info,
           "prescanning " + std::to_string (ts.size ()) + " file(s)");

    co_await run_bounded (
      ts.size (),
      traits_type::concurrency,
      [this, &ts, &r] (std::size_t i)
      {
        return scan_one (ts[i], r);
      });

    trace (trace_level::info,
           "prescan done, " + std::to_string (failures_) + " failure(s)");

    co_return r;
  }

  template <typename T>
  asio::awaitable<void> basic_size_prescanner<T>::
  scan_one (const prescan_target& t, size_map& r)
  {
    std::uint64_t n (0);

    try
    {
      n = co_await fetch_size (t.url);
    }
    catch (const std::exception& e)
    {
      trace (trace_level::warning,
             "prescan failed for " + t.name + ": " + e.what ());

      std::size_t f (++failures_);

      if (f <= traits_type::max_warnings)
        warn ("could not get size for '" + t.name + "'; it will show as 0 B");
      else if (f == traits_type::max_warnings + 1)
        warn ("more size errors suppressed");
    }

    r[t.url] = n;

    if (on_progress_)
      on_progress_ (++done_, total_);
  }

  template <typename T>
  asio::awaitable<std::uint64_t> basic_size_prescanner<T>::
  fetch_size (const string_type& url)
  {
    // HEAD first. Any failure (transport, status, no length) moves on to
    // the GET.
    //
    try
    {
      auto r (co_await client_.head (url));

      if (r.is_success ())
      {
        if (auto n = r.content_length (); n && *n > 0)
        {
          trace (trace_level::debug,
                 "got size " + std::to_string (*n) + " via HEAD for " + url);
          co_return *n;
        }
      }
    }
    catch (const std::exception& e)
    {
      trace (trace_level::debug,
             "HEAD failed for " + url + ": " + e.what ());
    }

    auto r (co_await client_.probe (url));

    if (!r.is_success ())
      throw std::runtime_error ("GET returned " + to_string (r.status));

    auto n (r.content_length ());

    if (!n || *n == 0)
      throw std::runtime_error ("no content length in response");

    trace (trace_level::debug,
           "got size " + std::to_string (*n) + " via GET for " + url);

    co_return *n;
  }

  template <typename T>
  void basic_size_prescanner<T>::
  warn (const string_type& m)
  {
    if (on_warning_)
      on_warning_ (m);
    else
      std::cerr << "warning: " << m << std::endl;
  }
}
