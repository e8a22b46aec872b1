#pragma once

#include <atomic>
#include <cstdint>

namespace batchdl
{
  // Point-in-time reading of a progress counter.
  //
  struct progress_sample
  {
    std::uint64_t position {0};
    std::uint64_t length {0};   // 0 = unknown

    float
    ratio () const noexcept
    {
      return length != 0
        ? static_cast<float> (position) / static_cast<float> (length)
        : 0.0f;
    }
  };

  // Byte counter shared between the transfer that feeds it and whoever
  // displays it.
  //
  // All operations are lock-free and may be called from any thread. The
  // position never goes down and, once the length is known (nonzero), never
  // exceeds it: increments past the length are clamped.
  //
  class progress_counter
  {
  public:
    progress_counter () = default;

    explicit
    progress_counter (std::uint64_t length)
      : length_ (length) {}

    progress_counter (const progress_counter&) = delete;
    progress_counter& operator= (const progress_counter&) = delete;

    void
    add (std::uint64_t delta) noexcept;

    // Raise the position to n unless it is already there.
    //
    void
    advance_to (std::uint64_t n) noexcept;

    // Set the length. It is never set below the current position so that
    // the invariant holds from here on.
    //
    void
    set_length (std::uint64_t n) noexcept;

    // Extend the length by n, for a share discovered after the length was
    // set. Like set_length(), never below the current position.
    //
    void
    grow_length (std::uint64_t n) noexcept;

    progress_sample
    read () const noexcept;

    std::uint64_t
    position () const noexcept
    {
      return position_.load (std::memory_order_relaxed);
    }

    std::uint64_t
    length () const noexcept
    {
      return length_.load (std::memory_order_relaxed);
    }

  private:
    std::atomic<std::uint64_t> position_ {0};
    std::atomic<std::uint64_t> length_ {0};
  };
}
