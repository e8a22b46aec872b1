#pragma once

#include <atomic>
#include <string>
#include <thread>
#include <vector>
#include <cstddef>

#include <ftxui/component/component.hpp>
#include <ftxui/component/screen_interactive.hpp>
#include <ftxui/dom/elements.hpp>
#include <ftxui/screen/terminal.hpp>

#include <batchdl/progress/progress-types.hxx>

namespace batchdl
{
  template <typename S = std::string>
  struct progress_renderer_traits
  {
    using string_type = S;

    static constexpr int default_bar_width = 25;

    // Width of the label column. Longer names are shortened keeping their
    // end, which is where part numbers and quantization tags live.
    //
    static constexpr std::size_t label_width = 30;

    // Failed entries show their error shortened to this many characters.
    //
    static constexpr std::size_t error_width = 40;

    static constexpr std::size_t max_log_messages = 5;

    static ftxui::Element
    render_item (const string_type& label,
                 const progress_snapshot& snapshot,
                 int bar_width = default_bar_width);

    static ftxui::Element
    render_failed (const string_type& label, const string_type& error);

    static ftxui::Element
    render_summary (std::size_t completed,
                    std::size_t failed,
                    std::size_t total,
                    const progress_snapshot& overall);

    static ftxui::Element
    render_logs (const std::vector<string_type>& messages);

    static ftxui::Element
    render_status (const string_type& status);
  };

  // Item to render.
  //
  template <typename S = std::string>
  struct basic_progress_item
  {
    using string_type = S;

    string_type label;
    progress_snapshot snapshot;
    string_type error;          // Set for failed items.

    basic_progress_item () = default;

    basic_progress_item (string_type l, progress_snapshot s, string_type e)
      : label (std::move (l)), snapshot (s), error (std::move (e)) {}
  };

  template <typename S = std::string>
  struct basic_progress_render_context
  {
    using string_type = S;
    using item_type = basic_progress_item<string_type>;

    std::vector<item_type> items;
    progress_snapshot overall;
    std::vector<string_type> log_messages;
    string_type status;
    std::size_t completed_count {0};
    std::size_t failed_count {0};
    std::size_t total_count {0};
  };

  // FTXUI progress renderer.
  //
  // The UI loop runs on its own thread; contexts are handed over through a
  // double buffer. The screen only occupies the lines it needs, and the last
  // frame stays on the terminal after stop() so the final state (including
  // any failed entries) remains visible.
  //
  template <typename T = progress_renderer_traits<>>
  class basic_progress_renderer
  {
  public:
    using traits_type = T;
    using string_type = typename traits_type::string_type;
    using context_type = basic_progress_render_context<string_type>;

    basic_progress_renderer ();
    ~basic_progress_renderer ();

    basic_progress_renderer (const basic_progress_renderer&) = delete;
    basic_progress_renderer& operator= (const basic_progress_renderer&) = delete;

    void
    start ();

    // Stop rendering and wait for the UI thread to finish.
    //
    void
    stop ();

    void
    update (context_type&& ctx) noexcept;

    bool
    running () const noexcept
    {
      return running_.load (std::memory_order_relaxed);
    }

  private:
    ftxui::Component
    create_component ();

    context_type contexts_[2];
    std::atomic<int> render_buffer_ {0};

    ftxui::ScreenInteractive screen_;
    ftxui::Component component_;

    std::atomic<bool> running_ {false};
    std::jthread ui_thread_;
  };

  using progress_item = basic_progress_item<>;
  using progress_render_context = basic_progress_render_context<>;
  using progress_renderer = basic_progress_renderer<>;
}

#include <batchdl/progress/progress-renderer.txx>
