#include <batchdl/http/http-types.hxx>

using namespace std;

namespace batchdl
{
  string
  to_string (http_method m)
  {
    switch (m)
    {
      case http_method::get:  return "GET";
      case http_method::head: return "HEAD";
    }
    return "GET";
  }

  string
  to_string (http_status s)
  {
    const char* r (nullptr);

    switch (s)
    {
      case http_status::ok:                    r = "OK"; break;
      case http_status::no_content:            r = "No Content"; break;
      case http_status::partial_content:       r = "Partial Content"; break;
      case http_status::moved_permanently:     r = "Moved Permanently"; break;
      case http_status::found:                 r = "Found"; break;
      case http_status::see_other:             r = "See Other"; break;
      case http_status::temporary_redirect:    r = "Temporary Redirect"; break;
      case http_status::permanent_redirect:    r = "Permanent Redirect"; break;
      case http_status::bad_request:           r = "Bad Request"; break;
      case http_status::unauthorized:          r = "Unauthorized"; break;
      case http_status::forbidden:             r = "Forbidden"; break;
      case http_status::not_found:             r = "Not Found"; break;
      case http_status::method_not_allowed:    r = "Method Not Allowed"; break;
      case http_status::range_not_satisfiable: r = "Range Not Satisfiable"; break;
      case http_status::too_many_requests:     r = "Too Many Requests"; break;
      case http_status::internal_server_error: r = "Internal Server Error"; break;
      case http_status::bad_gateway:           r = "Bad Gateway"; break;
      case http_status::service_unavailable:   r = "Service Unavailable"; break;
      case http_status::gateway_timeout:       r = "Gateway Timeout"; break;
    }

    string c (std::to_string (static_cast<uint16_t> (s)));
    return r != nullptr ? c + ' ' + r : c;
  }

  string http_version::
  string () const
  {
    return "HTTP/" + std::to_string (major) + '.' + std::to_string (minor);
  }
}
