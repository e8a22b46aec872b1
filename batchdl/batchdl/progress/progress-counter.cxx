#include <batchdl/progress/progress-counter.hxx>

#include <limits>
#include <algorithm>

using namespace std;

namespace batchdl
{
  void progress_counter::
  add (uint64_t d) noexcept
  {
    if (d == 0)
      return;

    uint64_t p (position_.load (memory_order_relaxed));

    for (;;)
    {
      uint64_t l (length_.load (memory_order_relaxed));

      // Saturate rather than wrap on (absurd) overflow.
      //
      uint64_t n (p + d < p ? numeric_limits<uint64_t>::max () : p + d);

      if (l != 0 && n > l)
        n = l;

      if (n <= p)
        return;

      if (position_.compare_exchange_weak (p, n, memory_order_relaxed))
        return;
    }
  }

  void progress_counter::
  advance_to (uint64_t n) noexcept
  {
    uint64_t p (position_.load (memory_order_relaxed));

    for (;;)
    {
      uint64_t l (length_.load (memory_order_relaxed));
      uint64_t v (l != 0 ? min (n, l) : n);

      if (v <= p)
        return;

      if (position_.compare_exchange_weak (p, v, memory_order_relaxed))
        return;
    }
  }

  void progress_counter::
  set_length (uint64_t n) noexcept
  {
    if (n == 0)
    {
      length_.store (0, memory_order_relaxed);
      return;
    }

    uint64_t l (length_.load (memory_order_relaxed));

    for (;;)
    {
      uint64_t v (max (n, position_.load (memory_order_relaxed)));

      if (length_.compare_exchange_weak (l, v, memory_order_relaxed))
        return;
    }
  }

  void progress_counter::
  grow_length (uint64_t n) noexcept
  {
    if (n == 0)
      return;

    uint64_t l (length_.load (memory_order_relaxed));

    for (;;)
    {
      uint64_t v (l + n < l ? numeric_limits<uint64_t>::max () : l + n);
      v = max (v, position_.load (memory_order_relaxed));

      if (length_.compare_exchange_weak (l, v, memory_order_relaxed))
        return;
    }
  }

  progress_sample progress_counter::
  read () const noexcept
  {
    progress_sample s;
    s.length = length_.load (memory_order_relaxed);
    s.position = position_.load (memory_order_relaxed);

    // The two loads are not atomic as a pair. A length read before a racing
    // set_length() could be below the position read after it.
    //
    if (s.length != 0 && s.position > s.length)
      s.length = s.position;

    return s;
  }
}
