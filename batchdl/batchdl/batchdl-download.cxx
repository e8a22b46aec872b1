#include <batchdl/batchdl-download.hxx>

#include <iostream>
#include <stdexcept>

#include <batchdl/diagnostics.hxx>
#include <batchdl/progress/progress-format.hxx>

using namespace std;

namespace batchdl
{
  download_coordinator::
  download_coordinator (http_client& h, progress_coordinator& p, size_t mp)
    : http_ (h),
      progress_ (p),
      max_parallel_ (mp),
      manager_ (make_unique<manager_type> (h, p.manager (), mp))
  {
    if (mp == 0)
      throw invalid_argument ("concurrency must be greater than 0");

    manager_->set_warning_callback ([this] (const string& m)
    {
      progress_.warning (m);
    });

    // Without the display a line per completed task is all the user gets.
    // Failures are listed by report().
    //
    manager_->set_task_completion_callback ([this] (const download_task& t)
    {
      if (!progress_.rendering () && t.completed ())
        cerr << "info: completed " << t.target.filename ().string () << endl;
    });
  }

  void download_coordinator::
  queue_download (planned_download d)
  {
    queue_.push_back (move (d));
  }

  asio::awaitable<size_t> download_coordinator::
  execute_all (const fs::path& dir, bool render)
  {
    progress_.info ("preparing to download " + to_string (queue_.size ()) +
                    " file(s) to '" + dir.string () + "' with concurrency " +
                    to_string (max_parallel_));

    progress_.start (render);

    // Size discovery.
    //
    vector<prescan_target> ts;
    ts.reserve (queue_.size ());

    for (const planned_download& d: queue_)
      ts.push_back (prescan_target {d.item.url,
                                    d.target.filename ().string ()});

    prescanner_type ps (http_);

    ps.set_warning_callback ([this] (const string& m)
    {
      progress_.warning (m);
    });

    ps.set_progress_callback ([this] (size_t d, size_t t)
    {
      progress_.status ("scanning file sizes (" + to_string (d) + "/" +
                        to_string (t) + ")");
    });

    progress_.status ("scanning file sizes (0/" + to_string (ts.size ()) +
                      ")");

    size_map sizes (co_await ps.scan (move (ts)));

    // The overall length starts as the sum of what is known. A transfer of
    // unknown size grows it once it learns its own.
    //
    uint64_t total (0);

    for (planned_download& d: queue_)
    {
      auto i (sizes.find (d.item.url));
      uint64_t n (i != sizes.end () ? i->second : 0);

      total += n;
      manager_->add_task (move (d.item), move (d.target), n);
    }

    queue_.clear ();

    progress_.manager ().overall ().set_length (total);
    progress_.status ("downloading");

    co_await manager_->download_all ();

    progress_.status (string ());
    co_await progress_.stop ();

    report ();

    co_return manager_->failed_count ();
  }

  void download_coordinator::
  report () const
  {
    auto& o (cerr);

    for (const auto& t: manager_->tasks ())
    {
      if (!t->failed ())
        continue;

      o << "error: " << t->target.filename ().string () << ": "
        << t->error.message << endl;
    }

    o << "info: all downloads processed: " << completed_count ()
      << " completed, " << failed_count () << " failed, "
      << format_bytes (downloaded_bytes ()) << " downloaded" << endl;

    trace (trace_level::info,
           "batch finished: " + to_string (completed_count ()) +
           " completed, " + to_string (failed_count ()) + " failed");
  }

  size_t download_coordinator::
  total_count () const
  {
    return manager_->total_count ();
  }

  size_t download_coordinator::
  completed_count () const
  {
    return manager_->completed_count ();
  }

  size_t download_coordinator::
  failed_count () const
  {
    return manager_->failed_count ();
  }

  uint64_t download_coordinator::
  downloaded_bytes () const
  {
    return manager_->downloaded_bytes ();
  }

  download_coordinator::manager_type& download_coordinator::
  manager () noexcept
  {
    return *manager_;
  }
}
