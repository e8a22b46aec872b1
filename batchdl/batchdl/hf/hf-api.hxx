#pragma once

#include <string>
#include <vector>

#include <boost/asio.hpp>
#include <boost/json.hpp>

#include <batchdl/http/http-json.hxx>
#include <batchdl/hf/hf-types.hxx>
#include <batchdl/hf/hf-endpoint.hxx>

namespace batchdl
{
  namespace asio = boost::asio;

  // Hugging Face Hub API client.
  //
  // Uses the shared HTTP client, so requests carry the same credentials as
  // the downloads (gated repositories need them for the listing too).
  //
  template <typename T = hf_api_traits>
  class hf_api
  {
  public:
    using traits_type = T;
    using file_type = typename traits_type::file_type;
    using model_type = typename traits_type::model_type;

    explicit
    hf_api (http_client& c)
      : client_ (c) {}

    hf_api (const hf_api&) = delete;
    hf_api& operator= (const hf_api&) = delete;

    // List the files of a repository (owner/name, optionally with the site
    // prefix).
    //
    asio::awaitable<std::vector<file_type>>
    repository_files (const std::string& repo);

    asio::awaitable<std::vector<model_type>>
    search_models (const std::string& query);

  private:
    json_http_client client_;
  };
}

#include <batchdl/hf/hf-api.txx>
