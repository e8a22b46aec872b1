#pragma once

#include <string>
#include <cstdint>
#include <utility>
#include <ostream>
#include <optional>

#include <batchdl/http/http-types.hxx>

namespace batchdl
{
  // Parsed Content-Range value.
  //
  // For "bytes 100-199/1000" first is 100, last is 199, and complete is 1000.
  // For "bytes */1000" (the 416 form) only complete is set.
  //
  struct content_range
  {
    std::optional<std::uint64_t> first;
    std::optional<std::uint64_t> last;
    std::optional<std::uint64_t> complete;
  };

  // HTTP response.
  //
  // For streamed transfers the body stays empty and only the status and
  // headers of the final (post-redirect) response are kept.
  //
  template <typename S, typename B = S>
  class basic_http_response
  {
  public:
    using string_type  = S;
    using body_type    = B;
    using headers_type = basic_http_headers<string_type>;

    http_status              status;
    http_version             version;
    string_type              reason;
    headers_type             headers;
    std::optional<body_type> body;

    // Final URL after following redirects.
    //
    string_type url;

    basic_http_response () : status (http_status::ok) {}

    explicit
    basic_http_response (http_status s) : status (s) {}

    std::uint16_t
    status_code () const noexcept
    {
      return static_cast<std::uint16_t> (status);
    }

    bool
    is_success () const noexcept
    {
      return status_code () >= 200 && status_code () < 300;
    }

    bool
    is_redirection () const noexcept
    {
      return status_code () >= 300 && status_code () < 400;
    }

    bool
    is_partial () const noexcept
    {
      return status == http_status::partial_content;
    }

    std::optional<string_type>
    get_header (const string_type& name) const
    {
      return headers.get (name);
    }

    std::optional<string_type>
    location () const
    {
      return get_header (string_type ("Location"));
    }

    std::optional<std::uint64_t>
    content_length () const;

    std::optional<content_range>
    range () const;
  };

  template <typename S, typename B>
  inline auto
  operator<< (std::basic_ostream<typename S::value_type>& o,
              const basic_http_response<S, B>& r) -> decltype (o)
  {
    o << r.version << ' ' << r.status_code ();

    if (!r.reason.empty ())
      o << ' ' << r.reason;

    return o;
  }

  using http_response = basic_http_response<std::string, std::string>;

  // Parse a Content-Range header value. Return nullopt if the value is not in
  // the bytes unit or malformed.
  //
  std::optional<content_range>
  parse_content_range (const std::string&);
}

#include <batchdl/http/http-response.ixx>
