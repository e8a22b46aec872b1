#include <stdexcept>

namespace batchdl
{
  template <typename S>
  inline boost::json::value
  parse_json (const basic_http_response<S>& r)
  {
    if (!r.body)
      throw std::runtime_error ("HTTP response has no body to parse as JSON");

    // Use the error_code overload and wrap the error in our own exception
    // for consistency with the rest of the client API.
    //
    boost::system::error_code ec;
    boost::json::value v (boost::json::parse (*r.body, ec));

    if (ec)
      throw std::runtime_error ("failed to parse JSON response: " +
                                ec.message ());

    return v;
  }

  template <typename T>
  inline boost::asio::awaitable<boost::json::value>
  basic_json_http_client<T>::
  get_json (const string_type& url)
  {
    request_type req (http_method::get, url);
    req.set_header (string_type ("Accept"), string_type ("application/json"));

    response_type res (co_await client_.request (std::move (req)));

    if (!res.is_success ())
    {
      std::string m ("request to " + url + " failed with status " +
                     to_string (res.status));

      // The APIs we talk to explain themselves in the body. Keep the first
      // bit of it, the rest is usually an HTML error page.
      //
      if (res.body && !res.body->empty ())
        m += ": " + res.body->substr (0, 200);

      throw std::runtime_error (m);
    }

    co_return parse_json (res);
  }
}
