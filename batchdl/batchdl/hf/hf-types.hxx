#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include <optional>

#include <boost/json.hpp>

#include <batchdl/download/download-types.hxx>

namespace batchdl
{
  namespace json = boost::json;

  // Search result entry.
  //
  struct hf_model_summary
  {
    std::string id;
    std::optional<std::string> author;
    std::uint64_t downloads {0};
    std::uint64_t likes {0};
    std::string last_modified;          // ISO 8601 as sent.
    std::vector<std::string> tags;
    std::optional<std::string> pipeline_tag;
    bool is_private {false};

    // Empty if not gated, otherwise "Gated", "Gated (auto)", or
    // "Gated (manual)".
    //
    std::string gated;

    // Author, or the owner part of the id if there is none.
    //
    std::string
    owner () const;

    // YYYY-mm-dd part of last_modified.
    //
    std::string
    updated () const;
  };

  struct hf_api_traits
  {
    using file_type = remote_file;
    using model_type = hf_model_summary;

    // Files of a repository from its model info (siblings[].rfilename),
    // with download URLs on the main branch.
    //
    static std::vector<file_type>
    parse_repository_files (const json::value& jv, const std::string& repo);

    static model_type
    parse_model (const json::value& jv);

    static std::vector<model_type>
    parse_models (const json::value& jv);
  };
}
