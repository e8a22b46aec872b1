#include <batchdl/diagnostics.hxx>

#include <mutex>
#include <ctime>
#include <chrono>
#include <atomic>
#include <iomanip>
#include <fstream>
#include <stdexcept>

using namespace std;

namespace batchdl
{
  ostream&
  operator<< (ostream& o, trace_level l)
  {
    switch (l)
    {
    case trace_level::debug:   return o << "DEBUG";
    case trace_level::info:    return o << "INFO";
    case trace_level::warning: return o << "WARN";
    case trace_level::error:   return o << "ERROR";
    }
    return o;
  }

  static mutex trace_mutex;
  static ofstream trace_file;
  static atomic<bool> trace_open (false);

  void
  open_trace (const filesystem::path& p)
  {
    lock_guard<mutex> l (trace_mutex);

    if (trace_file.is_open ())
      trace_file.close ();

    trace_file.open (p, ios::out | ios::trunc);

    if (!trace_file)
      throw runtime_error ("unable to open log file '" + p.string () + "'");

    trace_open.store (true, memory_order_release);
  }

  bool
  tracing () noexcept
  {
    return trace_open.load (memory_order_acquire);
  }

  void
  trace (trace_level lv, const string& m)
  {
    if (!tracing ())
      return;

    using namespace chrono;

    auto now (system_clock::now ());
    time_t t (system_clock::to_time_t (now));
    auto ms (duration_cast<milliseconds> (now.time_since_epoch ()) % 1000);

    tm lt;
    localtime_r (&t, &lt);

    lock_guard<mutex> l (trace_mutex);

    trace_file << '[' << put_time (&lt, "%Y-%m-%d %H:%M:%S") << '.'
               << setfill ('0') << setw (3) << ms.count () << setfill (' ')
               << "][" << lv << "] " << m << '\n';
    trace_file.flush ();
  }
}
