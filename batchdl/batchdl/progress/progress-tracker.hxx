#pragma once

#include <string>
#include <atomic>
#include <chrono>
#include <cstdint>

#include <batchdl/progress/progress-types.hxx>

namespace batchdl
{
  template <typename S = std::string>
  struct progress_tracker_traits
  {
    using string_type = S;

    // EWMA weight of the newest sample (0.0-1.0). A low value keeps the
    // displayed speed steady.
    //
    static constexpr float ewma_alpha = 0.2f;

    // Minimum interval between samples in milliseconds. Sampling every chunk
    // would mostly measure socket buffering.
    //
    static constexpr int min_update_interval_ms = 500;
  };

  // Transfer speed estimate from successive position readings.
  //
  // The speed is an exponentially weighted moving average of the
  // instantaneous rate between samples, so it reacts to stalls without
  // jumping on every burst.
  //
  template <typename T = progress_tracker_traits<>>
  class basic_progress_tracker
  {
  public:
    using traits_type = T;

    basic_progress_tracker () = default;

    basic_progress_tracker (const basic_progress_tracker&) = delete;
    basic_progress_tracker& operator= (const basic_progress_tracker&) = delete;

    // Feed the current position. Calls closer together than the minimum
    // interval are ignored.
    //
    void
    update (std::uint64_t position) noexcept;

    float
    speed () const noexcept
    {
      return speed_.load (std::memory_order_relaxed);
    }

    void
    reset () noexcept;

  private:
    std::atomic<std::uint64_t> last_position_ {0};
    std::atomic<std::uint64_t> last_time_us_ {0};
    std::atomic<float> speed_ {0.0f};
  };

  using progress_tracker = basic_progress_tracker<>;
}

#include <batchdl/progress/progress-tracker.txx>
