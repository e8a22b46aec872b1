#pragma once

#include <string>
#include <vector>
#include <ostream>

#include <boost/asio.hpp>

#include <batchdl/http/http.hxx>
#include <batchdl/hf/hf-types.hxx>

namespace batchdl
{
  namespace asio = boost::asio;

  // Print the search results, most downloaded first, in the order given.
  //
  void
  print_model_search (std::ostream&,
                      const std::string& query,
                      const std::vector<hf_model_summary>& models);

  // Search the Hugging Face Hub and print the results to std::cout.
  //
  asio::awaitable<void>
  search_models (http_client& http, const std::string& query);
}
