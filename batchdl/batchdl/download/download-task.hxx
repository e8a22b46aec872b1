#pragma once

#include <atomic>
#include <memory>
#include <cstdint>
#include <filesystem>

#include <batchdl/download/download-types.hxx>

namespace batchdl
{
  // One scheduled transfer.
  //
  // Owned by the download manager for the duration of a batch. The
  // destination file belongs to this task alone.
  //
  struct download_task
  {
    download_item item;
    fs::path target;

    // Size discovered by the prescan (0 = unknown).
    //
    std::uint64_t expected_size {0};

    std::atomic<download_state> state {download_state::pending};

    // Bytes written by this run (resumed bytes not included).
    //
    std::atomic<std::uint64_t> downloaded_bytes {0};

    // Set before state becomes failed.
    //
    download_error error;

    download_task (download_item i, fs::path t, std::uint64_t size)
      : item (std::move (i)), target (std::move (t)), expected_size (size) {}

    download_task (const download_task&) = delete;
    download_task& operator= (const download_task&) = delete;

    bool
    completed () const
    {
      return state.load () == download_state::completed;
    }

    bool
    failed () const
    {
      return state.load () == download_state::failed;
    }

    void
    set_error (download_error e)
    {
      error = std::move (e);
      state.store (download_state::failed);
    }
  };
}
