#pragma once

#include <vector>
#include <istream>
#include <ostream>

#include <boost/asio.hpp>

#include <batchdl/http/http.hxx>
#include <batchdl/download/download-types.hxx>

namespace batchdl
{
  namespace asio = boost::asio;

  // Let the user pick GGUF files and series out of a repository listing.
  //
  // Only .gguf files are offered. Their sizes are discovered first so that
  // the list can show them. Returns the chosen files, possibly none.
  //
  asio::awaitable<std::vector<remote_file>>
  select_gguf_files (http_client& http,
                     std::vector<remote_file> files,
                     std::istream& in,
                     std::ostream& out);
}
