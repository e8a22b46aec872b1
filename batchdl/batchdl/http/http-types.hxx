#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include <utility>
#include <ostream>
#include <optional>

namespace batchdl
{
  // HTTP method.
  //
  // We only ever fetch things, so the set is limited to what a downloader
  // issues.
  //
  enum class http_method
  {
    get,
    head
  };

  std::string
  to_string (http_method);

  inline std::ostream&
  operator<< (std::ostream& o, http_method m)
  {
    return o << to_string (m);
  }

  // HTTP status code.
  //
  // Values not listed here are still representable (the underlying type is
  // wide enough) and are printed numerically.
  //
  enum class http_status : std::uint16_t
  {
    ok                    = 200,
    no_content            = 204,
    partial_content       = 206,

    moved_permanently     = 301,
    found                 = 302,
    see_other             = 303,
    temporary_redirect    = 307,
    permanent_redirect    = 308,

    bad_request           = 400,
    unauthorized          = 401,
    forbidden             = 403,
    not_found             = 404,
    method_not_allowed    = 405,
    range_not_satisfiable = 416,
    too_many_requests     = 429,

    internal_server_error = 500,
    bad_gateway           = 502,
    service_unavailable   = 503,
    gateway_timeout       = 504
  };

  // Return "<code> <reason>", for example "404 Not Found".
  //
  std::string
  to_string (http_status);

  inline std::ostream&
  operator<< (std::ostream& o, http_status s)
  {
    return o << to_string (s);
  }

  // HTTP header field.
  //
  template <typename S>
  struct basic_http_field
  {
    using string_type = S;

    string_type name;
    string_type value;

    basic_http_field () = default;

    basic_http_field (string_type n, string_type v)
        : name (std::move (n)), value (std::move (v)) {}
  };

  // HTTP headers collection.
  //
  // Lookups are case-insensitive (RFC 7230). Order of insertion is kept so
  // that requests go out the way they were composed.
  //
  template <typename S>
  struct basic_http_headers
  {
    using string_type = S;
    using field_type  = basic_http_field<string_type>;
    using fields_type = std::vector<field_type>;

    fields_type fields;

    // Set a header field, replacing any existing field with the same name.
    //
    void
    set (string_type name, string_type value);

    // Add a header field (allows duplicates).
    //
    void
    add (string_type name, string_type value);

    // Return the first value of the field or nullopt if absent.
    //
    std::optional<string_type>
    get (const string_type& name) const;

    bool
    contains (const string_type& name) const
    {
      return get (name).has_value ();
    }

    // Remove all fields with the given name.
    //
    void
    remove (const string_type& name);

    bool
    empty () const noexcept
    {
      return fields.empty ();
    }

    using const_iterator = typename fields_type::const_iterator;

    const_iterator begin () const noexcept { return fields.begin (); }
    const_iterator end ()   const noexcept { return fields.end (); }
  };

  // HTTP version.
  //
  struct http_version
  {
    std::uint8_t major;
    std::uint8_t minor;

    http_version (std::uint8_t maj = 1, std::uint8_t min = 1)
        : major (maj), minor (min) {}

    bool
    operator== (const http_version& v) const noexcept
    {
      return major == v.major && minor == v.minor;
    }

    std::string
    string () const;
  };

  inline std::ostream&
  operator<< (std::ostream& o, const http_version& v)
  {
    return o << v.string ();
  }

  using http_field   = basic_http_field<std::string>;
  using http_headers = basic_http_headers<std::string>;
}

#include <batchdl/http/http-types.ixx>
