#pragma once

#include <string>

#include <boost/json.hpp>
#include <boost/asio.hpp>

#include <batchdl/http/http-types.hxx>
#include <batchdl/http/http-request.hxx>
#include <batchdl/http/http-response.hxx>
#include <batchdl/http/http-client.hxx>

namespace batchdl
{
  // Parse JSON from the HTTP response body.
  //
  template <typename S>
  boost::json::value
  parse_json (const basic_http_response<S>& response);

  // JSON HTTP client wrapper.
  //
  // Borrows the HTTP client so that API calls share the user agent and
  // credentials of the transfers.
  //
  template <typename T = http_client_traits<>>
  class basic_json_http_client
  {
  public:
    using traits_type   = T;
    using string_type   = typename traits_type::string_type;
    using client_type   = basic_http_client<traits_type>;
    using request_type  = typename traits_type::request_type;
    using response_type = typename traits_type::response_type;

    explicit
    basic_json_http_client (client_type& c)
      : client_ (c) {}

    basic_json_http_client (const basic_json_http_client&) = delete;
    basic_json_http_client& operator= (const basic_json_http_client&) = delete;

    // Perform a JSON GET request. Any non-2xx status is an error whose
    // message includes the status and the beginning of the body.
    //
    boost::asio::awaitable<boost::json::value>
    get_json (const string_type& url);

    client_type&
    client () noexcept
    {
      return client_;
    }

  private:
    client_type& client_;
  };

  using json_http_client = basic_json_http_client<>;
}

#include <batchdl/http/http-json.ixx>
