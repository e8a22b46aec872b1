#include <batchdl/batchdl-progress.hxx>

#include <iostream>

#include <batchdl/diagnostics.hxx>

using namespace std;

namespace batchdl
{
  progress_coordinator::
  progress_coordinator (asio::io_context& c)
    : manager_ (make_unique<manager_type> (c))
  {
  }

  void progress_coordinator::
  start (bool r)
  {
    manager_->start (r);
  }

  asio::awaitable<void> progress_coordinator::
  stop ()
  {
    co_await manager_->stop ();
  }

  bool progress_coordinator::
  running () const noexcept
  {
    return manager_->running ();
  }

  bool progress_coordinator::
  rendering () const noexcept
  {
    return manager_->rendering ();
  }

  void progress_coordinator::
  info (const string& m)
  {
    trace (trace_level::info, m);
    emit ("info: ", m);
  }

  void progress_coordinator::
  warning (const string& m)
  {
    trace (trace_level::warning, m);
    emit ("warning: ", m);
  }

  void progress_coordinator::
  status (string s)
  {
    if (!s.empty ())
      trace (trace_level::debug, s);

    manager_->set_status (move (s));
  }

  void progress_coordinator::
  emit (const char* p, const string& m)
  {
    // Writing to the terminal under the display would scroll it apart.
    //
    if (manager_->rendering ())
      manager_->add_log (p + m);
    else
      cerr << p << m << endl;
  }

  progress_coordinator::manager_type& progress_coordinator::
  manager () noexcept
  {
    return *manager_;
  }

  const progress_coordinator::manager_type& progress_coordinator::
  manager () const noexcept
  {
    return *manager_;
  }
}
