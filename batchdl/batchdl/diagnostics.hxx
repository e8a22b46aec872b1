#pragma once

#include <string>
#include <ostream>
#include <filesystem>

namespace batchdl
{
  enum class trace_level
  {
    debug,
    info,
    warning,
    error
  };

  std::ostream&
  operator<< (std::ostream&, trace_level);

  // Open the trace file, truncating it. Throws std::runtime_error if it
  // cannot be opened. Until this is called trace() does nothing.
  //
  void
  open_trace (const std::filesystem::path&);

  bool
  tracing () noexcept;

  // Append a "[YYYY-mm-dd HH:MM:SS.mmm][LEVEL] message" line. Safe to call
  // from any thread.
  //
  void
  trace (trace_level, const std::string& message);
}
