#pragma once

#include <string>
#include <memory>

#include <boost/asio.hpp>

#include <batchdl/progress/progress-manager.hxx>

namespace batchdl
{
  namespace asio = boost::asio;

  // Progress display of a run and the console messages that must not tear
  // it.
  //
  // While the display is up, messages are shown in its log area below the
  // bars. Otherwise they go to std::cerr with their severity prefix. Either
  // way they are also traced.
  //
  class progress_coordinator
  {
  public:
    using manager_type = progress_manager;

    explicit
    progress_coordinator (asio::io_context& ioc);

    progress_coordinator (const progress_coordinator&) = delete;
    progress_coordinator& operator= (const progress_coordinator&) = delete;

    // Start the accounting and, if render is true, the terminal display.
    //
    void
    start (bool render);

    // Stop the display, leaving its last frame on the terminal.
    //
    asio::awaitable<void>
    stop ();

    bool
    running () const noexcept;

    bool
    rendering () const noexcept;

    void
    info (const std::string& message);

    void
    warning (const std::string& message);

    // Status line above the summary (empty to clear).
    //
    void
    status (std::string s);

    manager_type&
    manager () noexcept;

    const manager_type&
    manager () const noexcept;

  private:
    void
    emit (const char* prefix, const std::string& message);

    std::unique_ptr<manager_type> manager_;
  };
}
