#pragma once

#include <string>
#include <functional>

#include <boost/asio.hpp>

#include <batchdl/http/http-client.hxx>
#include <batchdl/progress/progress-counter.hxx>
#include <batchdl/download/download-task.hxx>
#include <batchdl/download/download-types.hxx>

namespace batchdl
{
  using transfer_warning = std::function<void (const std::string&)>;

  // Download one task into its target file, resuming a partial file if the
  // server allows it.
  //
  // The entry counter tracks this task (its length is expected to be set to
  // the task's expected size, if known) and the overall counter the whole
  // batch. Both only ever move forward. Bytes already on disk are added to
  // the overall counter once it is established that they are kept.
  //
  // Throws download_failure or, for anything the HTTP client does not map,
  // another std::exception. A partial file is left in place on failure.
  //
  template <typename C>
  asio::awaitable<void>
  transfer (C& client,
            download_task& task,
            progress_counter& entry,
            progress_counter& overall,
            transfer_warning warn = transfer_warning ());
}

#include <batchdl/download/download-transfer.txx>
