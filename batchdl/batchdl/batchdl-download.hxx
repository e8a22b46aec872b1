#pragma once

#include <memory>
#include <vector>
#include <cstddef>
#include <cstdint>
#include <filesystem>

#include <boost/asio.hpp>

#include <batchdl/http/http.hxx>
#include <batchdl/download/download-manager.hxx>
#include <batchdl/download/download-prescanner.hxx>

#include <batchdl/batchdl-source.hxx>
#include <batchdl/batchdl-progress.hxx>

namespace batchdl
{
  namespace fs = std::filesystem;
  namespace asio = boost::asio;

  // Runs one batch end to end: size discovery, the transfers under the
  // concurrency limit, and the final report.
  //
  class download_coordinator
  {
  public:
    using manager_type = download_manager;
    using prescanner_type = size_prescanner;

    download_coordinator (http_client& http,
                          progress_coordinator& progress,
                          std::size_t max_parallel);

    download_coordinator (const download_coordinator&) = delete;
    download_coordinator& operator= (const download_coordinator&) = delete;

    void
    queue_download (planned_download d);

    std::size_t
    queued_count () const noexcept
    {
      return queue_.size ();
    }

    // Download everything queued into dir. The progress display (if render
    // is true) is up from the size discovery until every transfer is
    // terminal. Returns the number of failed transfers.
    //
    asio::awaitable<std::size_t>
    execute_all (const fs::path& dir, bool render);

    std::size_t
    total_count () const;

    std::size_t
    completed_count () const;

    std::size_t
    failed_count () const;

    std::uint64_t
    downloaded_bytes () const;

    manager_type&
    manager () noexcept;

  private:
    void
    report () const;

    http_client& http_;
    progress_coordinator& progress_;
    std::size_t max_parallel_;
    std::vector<planned_download> queue_;
    std::unique_ptr<manager_type> manager_;
  };
}
