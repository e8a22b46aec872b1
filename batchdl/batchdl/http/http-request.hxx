#pragma once

#include <string>
#include <utility>
#include <optional>

#include <batchdl/http/http-types.hxx>

namespace batchdl
{
  // HTTP request.
  //
  // Requests never carry a body here; everything we send is a GET or a HEAD.
  //
  template <typename S>
  class basic_http_request
  {
  public:
    using string_type  = S;
    using headers_type = basic_http_headers<string_type>;

    http_method  method;
    string_type  url;
    http_version version;
    headers_type headers;

    basic_http_request ()
      : method (http_method::get) {}

    basic_http_request (http_method m,
                        string_type u,
                        http_version v = http_version (1, 1))
        : method (m), url (std::move (u)), version (v) {}

    // Return the request target (path and query) of the URL.
    //
    string_type
    target () const;

    // Return the host component of the URL (without port).
    //
    string_type
    host () const;

    void
    set_header (string_type name, string_type value)
    {
      headers.set (std::move (name), std::move (value));
    }

    std::optional<string_type>
    get_header (const string_type& name) const
    {
      return headers.get (name);
    }

    bool
    has_header (const string_type& name) const
    {
      return headers.contains (name);
    }

    void
    set_user_agent (string_type ua)
    {
      set_header (string_type ("User-Agent"), std::move (ua));
    }

    void
    set_bearer_token (const string_type& token)
    {
      set_header (string_type ("Authorization"),
                  string_type ("Bearer ") + token);
    }

    // Request bytes from the specified offset to the end of the resource.
    //
    void
    set_range_from (std::uint64_t offset)
    {
      set_header (string_type ("Range"),
                  string_type ("bytes=") + std::to_string (offset) + '-');
    }

    // Add the Host header if missing.
    //
    void
    normalize ();
  };

  using http_request = basic_http_request<std::string>;
}

#include <batchdl/http/http-request.ixx>
