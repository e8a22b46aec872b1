#pragma once

#include <atomic>
#include <memory>
#include <string>
#include <vector>
#include <cstddef>
#include <cstdint>

#include <boost/asio.hpp>

#include <batchdl/progress/progress-types.hxx>
#include <batchdl/progress/progress-tracker.hxx>
#include <batchdl/progress/progress-renderer.hxx>

namespace batchdl
{
  namespace asio = boost::asio;

  template <typename S = std::string>
  struct progress_manager_traits
  {
    using string_type = S;
    using executor_type = asio::any_io_executor;

    // Speed/ETA sampling interval in milliseconds.
    //
    static constexpr int update_interval_ms = 100;

    // Redraw interval in milliseconds.
    //
    static constexpr int render_interval_ms = 50;
  };

  // Progress of one active transfer.
  //
  // The byte counter is written by the transfer and read by the update and
  // render loops, all without locking. The error message is written once,
  // before the state is switched to failed, and only read after observing
  // that state.
  //
  template <typename T = progress_manager_traits<>>
  class basic_progress_entry
  {
  public:
    using traits_type = T;
    using string_type = typename traits_type::string_type;
    using tracker_type =
      basic_progress_tracker<progress_tracker_traits<string_type>>;

    basic_progress_entry (string_type label, std::uint64_t total)
      : label_ (std::move (label))
    {
      metrics_.bytes.set_length (total);
    }

    const string_type&
    label () const noexcept
    {
      return label_;
    }

    progress_counter&
    counter () noexcept
    {
      return metrics_.bytes;
    }

    const progress_counter&
    counter () const noexcept
    {
      return metrics_.bytes;
    }

    progress_metrics&
    metrics () noexcept
    {
      return metrics_;
    }

    const progress_metrics&
    metrics () const noexcept
    {
      return metrics_;
    }

    tracker_type&
    tracker () noexcept
    {
      return tracker_;
    }

    progress_state
    state () const noexcept
    {
      return metrics_.state.load (std::memory_order_acquire);
    }

    // Valid only once state() returned failed.
    //
    const string_type&
    error () const noexcept
    {
      return error_;
    }

    progress_snapshot
    snapshot () const
    {
      return progress_snapshot (metrics_);
    }

  private:
    template <typename>
    friend class basic_progress_manager;

    string_type label_;
    string_type error_;
    progress_metrics metrics_;
    tracker_type tracker_;
  };

  // Progress aggregator of a batch.
  //
  // Holds the overall counter, shared by reference with every transfer, and
  // the list of entries of the transfers in flight. Entries are added when a
  // transfer begins, dropped when it completes, and kept in a sticky failed
  // state when it fails.
  //
  // The list itself is copy on write: modifications are serialized on a
  // strand and published through a double buffer so that the update and
  // render loops read it without locking. Rendering is optional; without it
  // the accounting behaves the same.
  //
  template <typename T = progress_manager_traits<>>
  class basic_progress_manager
  {
  public:
    using traits_type = T;
    using string_type = typename traits_type::string_type;
    using executor_type = typename traits_type::executor_type;
    using entry_type = basic_progress_entry<traits_type>;
    using entry_ptr = std::shared_ptr<entry_type>;
    using renderer_type =
      basic_progress_renderer<progress_renderer_traits<string_type>>;
    using context_type = basic_progress_render_context<string_type>;

    explicit
    basic_progress_manager (asio::io_context& ioc);

    ~basic_progress_manager ();

    basic_progress_manager (const basic_progress_manager&) = delete;
    basic_progress_manager& operator= (const basic_progress_manager&) = delete;

    // Start the update loop and, if requested, the terminal display.
    //
    void
    start (bool render);

    // Stop the loops. When rendering, the final state is drawn first and
    // remains on the terminal.
    //
    asio::awaitable<void>
    stop ();

    // Create an entry for a transfer that is about to begin. Total is the
    // expected size or 0 if unknown.
    //
    entry_ptr
    add_entry (string_type label, std::uint64_t total);

    // Drop the entry of a successful transfer.
    //
    void
    complete_entry (entry_ptr e);

    // Switch the entry of a failed transfer to its persistent error display.
    //
    void
    fail_entry (entry_ptr e, string_type message);

    // Number of transfers in the batch (for the summary line).
    //
    void
    set_total_count (std::size_t n) noexcept
    {
      total_count_.store (n, std::memory_order_relaxed);
    }

    void
    set_status (string_type s);

    void
    add_log (string_type message);

    progress_counter&
    overall () noexcept
    {
      return overall_.bytes;
    }

    progress_snapshot
    overall_snapshot () const
    {
      return progress_snapshot (overall_);
    }

    // Current list of entries (active and failed).
    //
    std::vector<entry_ptr>
    entries () const
    {
      int r (entries_buffer_.load (std::memory_order_acquire));
      return entries_buffers_[r];
    }

    std::size_t
    completed_count () const noexcept
    {
      return completed_count_.load (std::memory_order_relaxed);
    }

    std::size_t
    failed_count () const noexcept
    {
      return failed_count_.load (std::memory_order_relaxed);
    }

    bool
    running () const noexcept
    {
      return running_.load (std::memory_order_relaxed);
    }

    bool
    rendering () const noexcept
    {
      return renderer_ != nullptr;
    }

  private:
    asio::awaitable<void>
    update_loop ();

    asio::awaitable<void>
    render_loop ();

    // Sample speeds of the entries and of the overall counter.
    //
    void
    refresh ();

    // Must be called on the strand.
    //
    context_type
    collect_context ();

    // Replace the published entry list with f applied to a copy of it. Must
    // be called on the strand.
    //
    template <typename F>
    void
    modify_entries (F&& f);

    asio::io_context& ioc_;
    asio::strand<executor_type> strand_;
    asio::steady_timer update_timer_;
    asio::steady_timer render_timer_;

    std::unique_ptr<renderer_type> renderer_;

    std::atomic<bool> running_ {false};

    std::vector<entry_ptr> entries_buffers_[2];
    std::atomic<int> entries_buffer_ {0};

    progress_metrics overall_;
    basic_progress_tracker<progress_tracker_traits<string_type>>
    overall_tracker_;

    std::atomic<std::size_t> completed_count_ {0};
    std::atomic<std::size_t> failed_count_ {0};
    std::atomic<std::size_t> total_count_ {0};

    // Only accessed on the strand.
    //
    std::vector<string_type> logs_;
    string_type status_;
  };

  using progress_entry = basic_progress_entry<>;
  using progress_manager = basic_progress_manager<>;
}

#include <batchdl/progress/progress-manager.txx>
