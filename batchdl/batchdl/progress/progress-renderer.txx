#include <iomanip>
#include <sstream>
#include <algorithm>

#include <batchdl/progress/progress-format.hxx>

namespace batchdl
{
  template <typename S>
  ftxui::Element progress_renderer_traits<S>::
  render_item (const string_type& label, const progress_snapshot& s, int w)
  {
    using namespace ftxui;

    // Without a known length there is nothing to take a percentage of.
    //
    bool ind (s.total_bytes == 0);
    int pct (static_cast<int> (s.progress_ratio () * 100));

    std::ostringstream l;
    l << std::left << std::setw (static_cast<int> (label_width))
      << truncate_label (label, label_width);

    // Fixed widths keep the columns from jittering as the numbers change.
    //
    std::ostringstream r;
    r << std::right << format_bar (s.progress_ratio (), w, ind) << ' ';

    if (ind)
      r << std::setw (4) << "?" << "%";
    else
      r << std::setw (4) << pct << "%";

    r << " | " << std::setw (21)
      << (format_bytes (s.current_bytes) + " / " +
          (ind ? std::string ("?") : format_bytes (s.total_bytes)))
      << " | " << std::setw (12) << format_speed (s.speed)
      << " | " << std::setw (6);

    int eta (s.eta_seconds ());
    r << (eta > 0 ? format_duration (eta) : std::string ("-"));

    return hbox ({
      text (l.str ()),
      filler (),
      text (r.str ())
    });
  }

  template <typename S>
  ftxui::Element progress_renderer_traits<S>::
  render_failed (const string_type& label, const string_type& error)
  {
    using namespace ftxui;

    std::ostringstream l;
    l << std::left << std::setw (static_cast<int> (label_width))
      << truncate_label (label, label_width);

    return hbox ({
      text (l.str ()),
      filler (),
      text ("[ERROR: " + shorten_message (error, error_width) + "]") |
        color (Color::Red)
    });
  }

  template <typename S>
  ftxui::Element progress_renderer_traits<S>::
  render_summary (std::size_t done,
                  std::size_t failed,
                  std::size_t total,
                  const progress_snapshot& s)
  {
    using namespace ftxui;

    bool ind (s.total_bytes == 0);
    int pct (static_cast<int> (s.progress_ratio () * 100));

    std::ostringstream l;
    l << "[" << done << "/" << total << "] Total";

    if (failed != 0)
      l << " (" << failed << " failed)";

    std::ostringstream r;
    r << std::right << format_bar (s.progress_ratio (), default_bar_width, ind)
      << ' ' << std::setw (4) << pct << "%"
      << " | " << std::setw (21)
      << (format_bytes (s.current_bytes) + " / " +
          format_bytes (s.total_bytes))
      << " | " << std::setw (12) << format_speed (s.speed)
      << " | " << std::setw (6);

    int eta (s.eta_seconds ());
    r << (eta > 0 ? format_duration (eta) : std::string ("-"));

    return hbox ({
      text (l.str ()) | bold,
      filler (),
      text (r.str ())
    });
  }

  template <typename S>
  ftxui::Element progress_renderer_traits<S>::
  render_logs (const std::vector<string_type>& msgs)
  {
    using namespace ftxui;

    Elements es;
    es.reserve (msgs.size ());

    for (const auto& m: msgs)
      es.push_back (text (m) | dim);

    return vbox (std::move (es));
  }

  template <typename S>
  ftxui::Element progress_renderer_traits<S>::
  render_status (const string_type& s)
  {
    using namespace ftxui;

    if (s.empty ())
      return text ("");

    return text (s) | bold | color (Color::Green);
  }

  template <typename T>
  basic_progress_renderer<T>::
  basic_progress_renderer ()
      : screen_ (ftxui::ScreenInteractive::FitComponent ())
  {
  }

  template <typename T>
  basic_progress_renderer<T>::
  ~basic_progress_renderer ()
  {
    stop ();
  }

  template <typename T>
  void basic_progress_renderer<T>::
  start ()
  {
    if (running_.exchange (true, std::memory_order_relaxed))
      return;

    component_ = create_component ();

    // ScreenInteractive::Loop() blocks, so it cannot share the ASIO thread.
    //
    ui_thread_ = std::jthread ([this]
    {
      screen_.Loop (component_);
    });
  }

  template <typename T>
  void basic_progress_renderer<T>::
  stop ()
  {
    if (!running_.exchange (false, std::memory_order_relaxed))
      return;

    // Draw the last context before leaving. Posted tasks run in order so the
    // exit comes after the redraw.
    //
    screen_.Post (ftxui::Event::Custom);
    screen_.Exit ();

    if (ui_thread_.joinable ())
      ui_thread_.join ();
  }

  template <typename T>
  void basic_progress_renderer<T>::
  update (context_type&& ctx) noexcept
  {
    int r (render_buffer_.load (std::memory_order_relaxed));
    int w ((r + 1) % 2);

    contexts_[w] = std::move (ctx);
    render_buffer_.store (w, std::memory_order_release);

    if (component_ && running ())
      screen_.Post (ftxui::Event::Custom);
  }

  template <typename T>
  ftxui::Component basic_progress_renderer<T>::
  create_component ()
  {
    using namespace ftxui;

    return Renderer ([this]
    {
      int r (render_buffer_.load (std::memory_order_acquire));
      const context_type& c (contexts_[r]);

      Elements es;

      // Reserve room for the logs, the status, and the summary and show as
      // many entries as still fit. Failed entries come first so that they
      // never scroll out of view.
      //
      int h (Terminal::Size ().dimy);
      int reserved (static_cast<int> (c.log_messages.size ()) + 4);
      std::size_t room (static_cast<std::size_t> (std::max (1, h - reserved)));

      std::size_t shown (0);

      for (const auto& i: c.items)
      {
        if (i.snapshot.state != progress_state::failed || shown == room)
          continue;

        es.push_back (traits_type::render_failed (i.label, i.error));
        ++shown;
      }

      for (const auto& i: c.items)
      {
        if (i.snapshot.state == progress_state::failed || shown == room)
          continue;

        es.push_back (traits_type::render_item (i.label, i.snapshot));
        ++shown;
      }

      if (shown < c.items.size ())
      {
        std::ostringstream o;
        o << "... (" << c.items.size () - shown << " more not shown)";
        es.push_back (text (o.str ()) | dim);
      }

      Elements bottom;

      if (!c.log_messages.empty ())
        bottom.push_back (traits_type::render_logs (c.log_messages));

      if (!c.status.empty ())
        bottom.push_back (traits_type::render_status (c.status));

      bottom.push_back (separator ());
      bottom.push_back (traits_type::render_summary (c.completed_count,
                                                     c.failed_count,
                                                     c.total_count,
                                                     c.overall));

      return vbox ({
        vbox (std::move (es)),
        vbox (std::move (bottom))
      });
    });
  }
}
