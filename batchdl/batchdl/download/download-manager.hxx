#pragma once

#include <memory>
#include <vector>
#include <cstddef>
#include <cstdint>
#include <functional>

#include <boost/asio.hpp>

#include <batchdl/http/http-client.hxx>
#include <batchdl/progress/progress-manager.hxx>
#include <batchdl/download/download-task.hxx>
#include <batchdl/download/download-types.hxx>
#include <batchdl/download/download-transfer.hxx>

namespace batchdl
{
  template <typename C = http_client, typename P = progress_manager>
  struct download_manager_traits
  {
    using client_type = C;
    using progress_type = P;

    // Failed entries keep their error, shortened to this many characters.
    //
    static constexpr std::size_t error_width = 40;

    // Called once per task when it reaches a terminal state.
    //
    using completion_callback = std::function<void (const download_task&)>;
  };

  // Batch scheduler.
  //
  // Runs the queued tasks with at most max_parallel transfers in flight. A
  // task's failure is recorded on the task and its progress entry, and
  // never affects the other tasks. There are no retries: a partial file is
  // kept, so running the batch again resumes it.
  //
  template <typename T = download_manager_traits<>>
  class basic_download_manager
  {
  public:
    using traits_type = T;
    using client_type = typename traits_type::client_type;
    using progress_type = typename traits_type::progress_type;
    using completion_callback = typename traits_type::completion_callback;

    basic_download_manager (client_type& client,
                            progress_type& progress,
                            std::size_t max_parallel = 3)
      : client_ (client),
        progress_ (progress),
        max_parallel_ (max_parallel)
    {
    }

    basic_download_manager (const basic_download_manager&) = delete;
    basic_download_manager& operator= (const basic_download_manager&) = delete;

    void
    set_max_parallel (std::size_t n)
    {
      max_parallel_ = n;
    }

    std::size_t
    max_parallel () const
    {
      return max_parallel_;
    }

    std::shared_ptr<download_task>
    add_task (download_item item, fs::path target, std::uint64_t size)
    {
      auto t (std::make_shared<download_task> (std::move (item),
                                               std::move (target),
                                               size));
      tasks_.push_back (t);
      return t;
    }

    const std::vector<std::shared_ptr<download_task>>&
    tasks () const
    {
      return tasks_;
    }

    std::size_t
    total_count () const
    {
      return tasks_.size ();
    }

    std::size_t
    completed_count () const
    {
      std::size_t n (0);
      for (const auto& t: tasks_)
        if (t->completed ())
          ++n;
      return n;
    }

    std::size_t
    failed_count () const
    {
      std::size_t n (0);
      for (const auto& t: tasks_)
        if (t->failed ())
          ++n;
      return n;
    }

    // Bytes written by this run across all tasks.
    //
    std::uint64_t
    downloaded_bytes () const
    {
      std::uint64_t n (0);
      for (const auto& t: tasks_)
        n += t->downloaded_bytes.load ();
      return n;
    }

    void
    set_task_completion_callback (completion_callback cb)
    {
      on_task_complete_ = std::move (cb);
    }

    // Receives warnings of the transfers (resume refused, and so on).
    //
    void
    set_warning_callback (transfer_warning cb)
    {
      on_warning_ = std::move (cb);
    }

    // Run every queued task. Returns once all of them are terminal.
    //
    asio::awaitable<void>
    download_all ();

  private:
    asio::awaitable<void>
    run_task (std::shared_ptr<download_task> task);

    client_type& client_;
    progress_type& progress_;
    std::size_t max_parallel_;
    std::vector<std::shared_ptr<download_task>> tasks_;

    completion_callback on_task_complete_;
    transfer_warning on_warning_;
  };

  using download_manager = basic_download_manager<>;
}

#include <batchdl/download/download-manager.txx>
