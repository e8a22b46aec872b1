#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <ostream>

#include <batchdl/progress/progress-counter.hxx>

namespace batchdl
{
  // State of a displayed progress entry.
  //
  // There is no pending state: an entry only exists once its transfer has
  // started.
  //
  enum class progress_state
  {
    active,
    completed,
    failed
  };

  inline std::ostream&
  operator<< (std::ostream& o, progress_state s)
  {
    switch (s)
    {
    case progress_state::active:    return o << "active";
    case progress_state::completed: return o << "completed";
    case progress_state::failed:    return o << "failed";
    }
    return o;
  }

  using time_point = std::chrono::steady_clock::time_point;

  // Live metrics of one transfer (or of the whole batch).
  //
  struct progress_metrics
  {
    progress_counter bytes;
    std::atomic<float> speed {0.0f};   // Bytes per second.
    std::atomic<progress_state> state {progress_state::active};

    progress_metrics () = default;

    progress_metrics (const progress_metrics&) = delete;
    progress_metrics& operator= (const progress_metrics&) = delete;
  };

  // Snapshot of progress metrics (for rendering, non-atomic).
  //
  struct progress_snapshot
  {
    std::uint64_t total_bytes {0};
    std::uint64_t current_bytes {0};
    float speed {0.0f};
    progress_state state {progress_state::active};

    progress_snapshot () = default;

    explicit
    progress_snapshot (const progress_metrics& m)
      : speed (m.speed.load (std::memory_order_relaxed)),
        state (m.state.load (std::memory_order_relaxed))
    {
      progress_sample s (m.bytes.read ());
      total_bytes = s.length;
      current_bytes = s.position;
    }

    progress_snapshot (const progress_counter& c, float spd)
      : speed (spd)
    {
      progress_sample s (c.read ());
      total_bytes = s.length;
      current_bytes = s.position;
    }

    float
    progress_ratio () const noexcept
    {
      if (total_bytes == 0)
        return 0.0f;

      return static_cast<float> (current_bytes) /
             static_cast<float> (total_bytes);
    }

    // Return the ETA in seconds or 0 if unknown.
    //
    int
    eta_seconds () const noexcept
    {
      if (speed <= 0.0f || total_bytes <= current_bytes)
        return 0;

      return static_cast<int> ((total_bytes - current_bytes) / speed);
    }
  };
}
