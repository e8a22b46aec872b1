#pragma once

#include <map>
#include <string>
#include <vector>
#include <istream>
#include <optional>
#include <functional>
#include <filesystem>

#include <batchdl/download/download-types.hxx>

namespace batchdl
{
  namespace fs = std::filesystem;

  // Where the list of downloads comes from.
  //
  enum class source_kind
  {
    urls,       // Positional arguments.
    file,       // --file
    repository, // --hf
    model       // --model
  };

  // The source related parts of the command line.
  //
  struct source_request
  {
    std::vector<std::string> urls;
    std::optional<std::string> file;
    std::optional<std::string> repository;
    std::optional<std::string> model;
  };

  // Determine the single source of the request. Throws std::invalid_argument
  // if there is none or more than one.
  //
  source_kind
  validate_sources (const source_request&);

  // URL list, one per line. Lines are trimmed; blank lines and lines starting
  // with '#' are skipped.
  //
  std::vector<std::string>
  parse_url_list (std::istream&);

  // As above but from a file. Throws std::runtime_error if it cannot be
  // read.
  //
  std::vector<std::string>
  read_url_list (const fs::path&);

  // Known model aliases and their download URLs.
  //
  const std::map<std::string, std::string>&
  model_registry ();

  // The item of a model alias, named after the last segment of its URL.
  // Throws std::invalid_argument for an unknown alias.
  //
  download_item
  resolve_model_alias (const std::string& alias);

  // A download with its resolved destination.
  //
  struct planned_download
  {
    download_item item;
    fs::path target;
  };

  using plan_warning = std::function<void (const std::string&)>;

  // Resolve the destination of every item under dir. An item whose
  // destination is already taken by an earlier one is skipped with a
  // warning, so every destination has exactly one owner.
  //
  std::vector<planned_download>
  plan_downloads (const std::vector<download_item>& items,
                  const fs::path& dir,
                  const plan_warning& warn);
}
