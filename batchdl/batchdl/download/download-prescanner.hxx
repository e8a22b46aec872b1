#pragma once

#include <string>
#include <vector>
#include <cstddef>
#include <cstdint>
#include <functional>

#include <boost/asio.hpp>

#include <batchdl/http/http-client.hxx>
#include <batchdl/download/download-types.hxx>

namespace batchdl
{
  template <typename C = http_client>
  struct size_prescanner_traits
  {
    using client_type = C;
    using string_type = typename client_type::string_type;

    // Probes in flight at once. Header-only exchanges are cheap, so this is
    // independent of (and higher than) the transfer concurrency.
    //
    static constexpr std::size_t concurrency = 20;

    // Failures reported individually before the rest are only counted.
    //
    static constexpr std::size_t max_warnings = 5;

    // Called with (done, total) after every item.
    //
    using progress_callback = std::function<void (std::size_t, std::size_t)>;

    using warning_callback = std::function<void (const string_type&)>;
  };

  // Resource whose size is to be discovered.
  //
  struct prescan_target
  {
    std::string url;
    std::string name; // For messages.
  };

  // Size discovery ahead of a batch.
  //
  // Each URL is first asked for with HEAD. If that fails or does not yield
  // a nonzero Content-Length, a GET is issued and only its head read. If
  // neither works the size is recorded as 0 (unknown) and the failure
  // counted. Nothing here is fatal.
  //
  template <typename T = size_prescanner_traits<>>
  class basic_size_prescanner
  {
  public:
    using traits_type = T;
    using client_type = typename traits_type::client_type;
    using string_type = typename traits_type::string_type;
    using progress_callback = typename traits_type::progress_callback;
    using warning_callback = typename traits_type::warning_callback;

    explicit
    basic_size_prescanner (client_type& c)
      : client_ (c) {}

    basic_size_prescanner (const basic_size_prescanner&) = delete;
    basic_size_prescanner& operator= (const basic_size_prescanner&) = delete;

    // Without a warning callback warnings go to std::cerr.
    //
    void
    set_warning_callback (warning_callback cb)
    {
      on_warning_ = std::move (cb);
    }

    void
    set_progress_callback (progress_callback cb)
    {
      on_progress_ = std::move (cb);
    }

    asio::awaitable<size_map>
    scan (std::vector<prescan_target> targets);

    // Discover the size of a single URL. Throws if it cannot be determined.
    //
    asio::awaitable<std::uint64_t>
    fetch_size (const string_type& url);

    // Number of failures in the last scan.
    //
    std::size_t
    failures () const noexcept
    {
      return failures_;
    }

  private:
    asio::awaitable<void>
    scan_one (const prescan_target&, size_map&);

    void
    warn (const string_type&);

    client_type& client_;

    warning_callback on_warning_;
    progress_callback on_progress_;

    std::size_t failures_ {0};
    std::size_t done_ {0};
    std::size_t total_ {0};
  };

  using size_prescanner = basic_size_prescanner<>;

  std::vector<prescan_target>
  prescan_targets (const std::vector<download_item>&);

  std::vector<prescan_target>
  prescan_targets (const std::vector<remote_file>&);
}

#include <batchdl/download/download-prescanner.txx>
