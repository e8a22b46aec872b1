#include <chrono>
#include <algorithm>

namespace batchdl
{
  template <typename T>
  basic_progress_manager<T>::
  basic_progress_manager (asio::io_context& ioc)
      : ioc_ (ioc),
        strand_ (asio::make_strand (ioc)),
        update_timer_ (ioc),
        render_timer_ (ioc)
  {
  }

  template <typename T>
  basic_progress_manager<T>::
  ~basic_progress_manager ()
  {
    if (running_.exchange (false, std::memory_order_relaxed))
    {
      update_timer_.cancel ();
      render_timer_.cancel ();

      if (renderer_ != nullptr)
        renderer_->stop ();
    }
  }

  template <typename T>
  void basic_progress_manager<T>::
  start (bool render)
  {
    if (running_.exchange (true, std::memory_order_relaxed))
      return;

    asio::co_spawn (strand_, update_loop (), asio::detached);

    if (render)
    {
      renderer_ = std::make_unique<renderer_type> ();
      renderer_->start ();

      asio::co_spawn (strand_, render_loop (), asio::detached);
    }
  }

  template <typename T>
  asio::awaitable<void> basic_progress_manager<T>::
  stop ()
  {
    if (!running_.exchange (false, std::memory_order_relaxed))
      co_return;

    update_timer_.cancel ();
    render_timer_.cancel ();

    // Queue behind any pending entry, log, or status changes so that the
    // final frame reflects all of them.
    //
    co_await asio::post (strand_, asio::use_awaitable);

    refresh ();

    if (renderer_ != nullptr)
    {
      renderer_->update (collect_context ());
      renderer_->stop ();
      renderer_.reset ();
    }

    co_return;
  }

  template <typename T>
  template <typename F>
  void basic_progress_manager<T>::
  modify_entries (F&& f)
  {
    int r (entries_buffer_.load (std::memory_order_relaxed));
    int w ((r + 1) % 2);

    entries_buffers_[w] = entries_buffers_[r];
    f (entries_buffers_[w]);

    entries_buffer_.store (w, std::memory_order_release);
  }

  template <typename T>
  typename basic_progress_manager<T>::entry_ptr basic_progress_manager<T>::
  add_entry (string_type l, std::uint64_t total)
  {
    auto e (std::make_shared<entry_type> (std::move (l), total));

    asio::post (strand_,
                [this, e]
    {
      modify_entries ([&e] (std::vector<entry_ptr>& v) {v.push_back (e);});
    });

    return e;
  }

  template <typename T>
  void basic_progress_manager<T>::
  complete_entry (entry_ptr e)
  {
    e->metrics ().state.store (progress_state::completed,
                               std::memory_order_release);

    completed_count_.fetch_add (1, std::memory_order_relaxed);

    asio::post (strand_,
                [this, e]
    {
      modify_entries ([&e] (std::vector<entry_ptr>& v)
      {
        auto i (std::find (v.begin (), v.end (), e));

        if (i != v.end ())
          v.erase (i);
      });
    });
  }

  template <typename T>
  void basic_progress_manager<T>::
  fail_entry (entry_ptr e, string_type m)
  {
    // The entry stays in the list. Publish the message before the state so
    // that readers who see failed also see the message.
    //
    e->error_ = std::move (m);
    e->metrics ().speed.store (0.0f, std::memory_order_relaxed);
    e->metrics ().state.store (progress_state::failed,
                               std::memory_order_release);

    failed_count_.fetch_add (1, std::memory_order_relaxed);
  }

  template <typename T>
  void basic_progress_manager<T>::
  set_status (string_type s)
  {
    asio::post (strand_,
                [this, s = std::move (s)] () mutable
    {
      status_ = std::move (s);
    });
  }

  template <typename T>
  void basic_progress_manager<T>::
  add_log (string_type m)
  {
    asio::post (strand_,
                [this, m = std::move (m)] () mutable
    {
      logs_.push_back (std::move (m));

      // Only the most recent messages are shown.
      //
      if (logs_.size () >
          progress_renderer_traits<string_type>::max_log_messages)
        logs_.erase (logs_.begin ());
    });
  }

  template <typename T>
  void basic_progress_manager<T>::
  refresh ()
  {
    int r (entries_buffer_.load (std::memory_order_acquire));

    for (const auto& e: entries_buffers_[r])
    {
      if (e->state () != progress_state::active)
        continue;

      auto& t (e->tracker ());
      t.update (e->counter ().position ());

      e->metrics ().speed.store (t.speed (), std::memory_order_relaxed);
    }

    // The overall speed comes from its own counter rather than the sum of
    // the entry speeds: finished entries no longer contribute to the sum.
    //
    overall_tracker_.update (overall_.bytes.position ());
    overall_.speed.store (overall_tracker_.speed (), std::memory_order_relaxed);
  }

  template <typename T>
  asio::awaitable<void> basic_progress_manager<T>::
  update_loop ()
  {
    while (running_.load (std::memory_order_relaxed))
    {
      refresh ();

      update_timer_.expires_after (
        std::chrono::milliseconds (traits_type::update_interval_ms));

      try
      {
        co_await update_timer_.async_wait (asio::use_awaitable);
      }
      catch (const boost::system::system_error& e)
      {
        if (e.code () == asio::error::operation_aborted)
          break;

        throw;
      }
    }

    co_return;
  }

  template <typename T>
  asio::awaitable<void> basic_progress_manager<T>::
  render_loop ()
  {
    while (running_.load (std::memory_order_relaxed) && renderer_ != nullptr)
    {
      renderer_->update (collect_context ());

      render_timer_.expires_after (
        std::chrono::milliseconds (traits_type::render_interval_ms));

      try
      {
        co_await render_timer_.async_wait (asio::use_awaitable);
      }
      catch (const boost::system::system_error& e)
      {
        if (e.code () == asio::error::operation_aborted)
          break;

        throw;
      }
    }

    co_return;
  }

  template <typename T>
  typename basic_progress_manager<T>::context_type basic_progress_manager<T>::
  collect_context ()
  {
    context_type c;

    int r (entries_buffer_.load (std::memory_order_acquire));

    for (const auto& e: entries_buffers_[r])
    {
      bool f (e->state () == progress_state::failed);
      progress_snapshot s (e->snapshot ());

      if (f)
        s.state = progress_state::failed;

      c.items.emplace_back (e->label (), s, f ? e->error () : string_type ());
    }

    c.overall = progress_snapshot (overall_);
    c.completed_count = completed_count_.load (std::memory_order_relaxed);
    c.failed_count = failed_count_.load (std::memory_order_relaxed);
    c.total_count = total_count_.load (std::memory_order_relaxed);
    c.log_messages = logs_;
    c.status = status_;

    return c;
  }
}
