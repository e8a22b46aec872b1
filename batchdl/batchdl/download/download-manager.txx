#include <batchdl/diagnostics.hxx>
#include <batchdl/progress/progress-format.hxx>
#include <batchdl/download/download-pool.hxx>

namespace batchdl
{
  template <typename T>
  asio::awaitable<void> basic_download_manager<T>::
  download_all ()
  {
    if (tasks_.empty ())
      co_return;

    progress_.set_total_count (tasks_.size ());

    trace (trace_level::info,
           "starting " + std::to_string (tasks_.size ()) +
           " download(s) with concurrency " + std::to_string (max_parallel_));

    co_await run_bounded (tasks_.size (),
                          max_parallel_,
                          [this] (std::size_t i)
                          {
                            return run_task (tasks_[i]);
                          });
  }

  template <typename T>
  asio::awaitable<void> basic_download_manager<T>::
  run_task (std::shared_ptr<download_task> task)
  {
    // The entry only appears once the transfer begins, so at most
    // max_parallel of them are active at a time.
    //
    auto e (progress_.add_entry (task->target.filename ().string (),
                                 task->expected_size));

    try
    {
      co_await transfer (client_,
                         *task,
                         e->counter (),
                         progress_.overall (),
                         on_warning_);
    }
    catch (const download_failure& x)
    {
      task->set_error (download_error (x.what (), task->item.url, x.kind ()));
    }
    catch (const std::exception& x)
    {
      task->set_error (download_error (x.what (), task->item.url));
    }

    if (task->failed ())
    {
      trace (trace_level::error,
             "download of " + task->item.url + " failed: " +
             task->error.message);

      progress_.fail_entry (e,
                            shorten_message (task->error.message,
                                             traits_type::error_width));
    }
    else
      progress_.complete_entry (e);

    if (on_task_complete_)
      on_task_complete_ (*task);
  }
}
