#pragma once

#include <string>
#include <cstdint>
#include <cstddef>

namespace batchdl
{
  // Format a byte count with decimal (SI) units and two decimals, for
  // example "512 B" or "1.50 GB". Model hubs quote sizes this way, so the
  // numbers line up with what the user saw on the web page.
  //
  std::string
  format_bytes (std::uint64_t);

  std::string
  format_speed (float bytes_per_second);

  // Format a duration as "42s", "5m07s", or "2h03m".
  //
  std::string
  format_duration (int seconds);

  // Format a large count compactly: "950", "12.3K", "4.5M", "1.2B".
  //
  std::string
  format_count (std::uint64_t);

  // Format a "[===>    ]" bar of the given inner width. An indeterminate
  // bar is rendered as a marker in the middle.
  //
  std::string
  format_bar (float ratio, int width, bool indeterminate);

  // Shorten a file name for display keeping its end and extension, for
  // example "...Q4_K_M-00001-of-00003.gguf".
  //
  std::string
  truncate_label (const std::string& name, std::size_t max);

  // Shorten a message to at most max characters with a trailing "...".
  //
  std::string
  shorten_message (const std::string& message, std::size_t max);
}
