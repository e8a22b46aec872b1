#pragma once

#include <string>
#include <vector>
#include <optional>

namespace batchdl
{
  // Local name for a download and what was wrong with the inputs, if
  // anything.
  //
  struct resolved_name
  {
    std::string name; // Relative path, never empty.
    std::vector<std::string> warnings;
  };

  // Derive the local (relative) file name of a download.
  //
  // A preferred name is used after lexical cleanup, unless it is absolute or
  // climbs out of the destination with "..", in which case only its base
  // name is kept. Otherwise the last segment of the URL path is used. If
  // that leaves nothing usable a name is generated from the current time
  // (download_<hex>.<ext>, with .file if no plausible extension survives).
  //
  resolved_name
  resolve_filename (const std::string& url,
                    const std::optional<std::string>& preferred);

  // Replace characters that are not valid in file names on some platform.
  //
  std::string
  sanitize_filename (const std::string&);

  // Directory name for a Hugging Face repository: owner_repo, or hf_<name>
  // for a bare name.
  //
  std::string
  repo_id_to_safe_path (const std::string& repo_id);
}
