namespace batchdl
{
  inline std::uint64_t
  current_time_us () noexcept
  {
    using namespace std::chrono;
    auto us (duration_cast<microseconds> (
               steady_clock::now ().time_since_epoch ()));
    return static_cast<std::uint64_t> (us.count ());
  }

  template <typename T>
  void basic_progress_tracker<T>::
  update (std::uint64_t n) noexcept
  {
    std::uint64_t t (current_time_us ());
    std::uint64_t t0 (last_time_us_.load (std::memory_order_relaxed));

    // The first call only establishes the baseline.
    //
    if (t0 == 0)
    {
      last_position_.store (n, std::memory_order_relaxed);
      last_time_us_.store (t, std::memory_order_relaxed);
      return;
    }

    std::uint64_t dt (t - t0);

    if (dt < static_cast<std::uint64_t> (traits_type::min_update_interval_ms) *
             1000)
      return;

    std::uint64_t n0 (last_position_.load (std::memory_order_relaxed));
    std::uint64_t dn (n > n0 ? n - n0 : 0);

    float inst (static_cast<float> (dn) /
                (static_cast<float> (dt) / 1000000.0f));

    float s0 (speed_.load (std::memory_order_relaxed));
    float s (s0 == 0.0f
             ? inst
             : traits_type::ewma_alpha * inst +
               (1.0f - traits_type::ewma_alpha) * s0);

    last_position_.store (n, std::memory_order_relaxed);
    last_time_us_.store (t, std::memory_order_relaxed);
    speed_.store (s, std::memory_order_relaxed);
  }

  template <typename T>
  void basic_progress_tracker<T>::
  reset () noexcept
  {
    last_position_.store (0, std::memory_order_relaxed);
    last_time_us_.store (0, std::memory_order_relaxed);
    speed_.store (0.0f, std::memory_order_relaxed);
  }
}
