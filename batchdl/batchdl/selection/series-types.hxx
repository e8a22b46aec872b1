#pragma once

#include <string>
#include <vector>
#include <variant>
#include <cstddef>
#include <cstdint>
#include <utility>

#include <batchdl/download/download-types.hxx>

namespace batchdl
{
  // Remote file with its discovered size (0 = unknown).
  //
  struct sized_file
  {
    remote_file file;
    std::uint64_t size {0};
  };

  // Parts of one multi-part file, <base>-NNNNN-of-MMMMM.gguf.
  //
  struct series_group
  {
    std::string base;
    std::size_t declared_total {0}; // MMMMM
    std::vector<sized_file> parts;  // Ordered by file name.
    std::uint64_t total_size {0};

    // All declared parts and nothing else are present.
    //
    bool
    complete () const noexcept
    {
      return declared_total > 0 && parts.size () == declared_total;
    }
  };

  struct standalone_file
  {
    sized_file file;
  };

  // Entry of the selection list: either a whole series or a single file.
  //
  class selectable_entry
  {
  public:
    using value_type = std::variant<series_group, standalone_file>;

    explicit
    selectable_entry (series_group g)
      : value_ (std::move (g)) {}

    explicit
    selectable_entry (standalone_file f)
      : value_ (std::move (f)) {}

    std::string
    label () const;

    bool
    complete () const noexcept;

    // Files this entry stands for.
    //
    std::vector<remote_file>
    files () const;

    bool
    series () const noexcept
    {
      return std::holds_alternative<series_group> (value_);
    }

    const value_type&
    value () const noexcept
    {
      return value_;
    }

  private:
    value_type value_;
  };
}
