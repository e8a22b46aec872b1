#pragma once

#include <string>
#include <vector>
#include <istream>
#include <ostream>
#include <stdexcept>

#include <batchdl/download/download-types.hxx>
#include <batchdl/selection/series-types.hxx>

namespace batchdl
{
  // Input line that does not select anything sensible. The message is meant
  // for the user.
  //
  class invalid_selection: public std::invalid_argument
  {
  public:
    using std::invalid_argument::invalid_argument;
  };

  struct selection_result
  {
    std::vector<remote_file> files;
    std::vector<std::string> warnings;
  };

  // Parse a selection line against the listed entries.
  //
  // Accepts "all", "none", or comma-separated 1-based indices (surrounding
  // whitespace and case are ignored, as are empty items). Incomplete entries
  // are skipped with a warning. Any item that is not a listed index throws
  // invalid_selection. Files are unique by name: when one is selected again
  // the later occurrence replaces the earlier one.
  //
  selection_result
  parse_selection (const std::string& line,
                   const std::vector<selectable_entry>& entries);

  // List the entries on out and read lines from in until one parses.
  // Warnings and complaints go to out. Throws std::ios_base::failure if the
  // input ends first.
  //
  std::vector<remote_file>
  prompt_selection (const std::vector<selectable_entry>& entries,
                    std::istream& in,
                    std::ostream& out);
}
