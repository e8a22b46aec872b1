#pragma once

#include <string>
#include <vector>
#include <cstddef>
#include <optional>

#include <batchdl/download/download-types.hxx>
#include <batchdl/selection/series-types.hxx>

namespace batchdl
{
  // Components of a series part file name.
  //
  struct series_part_name
  {
    std::string base;
    std::size_t index;
    std::size_t total;
  };

  // Match <base>-NNNNN-of-MMMMM.gguf (five digits each).
  //
  std::optional<series_part_name>
  parse_series_name (const std::string& filename);

  // Group the files into series, keyed by base name and declared total, and
  // standalone files, and return them ordered by label.
  //
  std::vector<selectable_entry>
  classify_files (const std::vector<remote_file>& files, const size_map& sizes);

  // Keep files with the .gguf extension (any case).
  //
  std::vector<remote_file>
  filter_gguf (std::vector<remote_file> files);
}
