#pragma once

#include <string>
#include <memory>
#include <limits>
#include <cstdint>
#include <cstddef>
#include <stdexcept>
#include <functional>

#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast.hpp>

#include <batchdl/http/http-types.hxx>
#include <batchdl/http/http-request.hxx>
#include <batchdl/http/http-response.hxx>

#include <batchdl/version.hxx>

namespace batchdl
{
  namespace asio  = boost::asio;
  namespace beast = boost::beast;
  namespace ssl   = boost::asio::ssl;

  // Convert a timeout in seconds to the milliseconds the client takes.
  // Throw std::invalid_argument if the result does not fit.
  //
  inline std::uint32_t
  timeout_milliseconds (std::uint64_t seconds)
  {
    if (seconds > std::numeric_limits<std::uint32_t>::max () / 1000)
      throw std::invalid_argument ("timeout of " + std::to_string (seconds) +
                                   " seconds is too large");

    return static_cast<std::uint32_t> (seconds * 1000);
  }

  // HTTP client options.
  //
  template <typename S = std::string>
  struct http_client_traits
  {
    using string_type   = S;
    using request_type  = basic_http_request<string_type>;
    using response_type = basic_http_response<string_type>;

    // Bound on connection establishment (name resolution, connect and TLS
    // handshake) in milliseconds (0 = no timeout).
    //
    std::uint32_t connect_timeout = 20000;

    // Idle bound on every read and write after the connection is up, in
    // milliseconds (0 = no timeout). The timer is re-armed for each body
    // chunk, so a slow but steady transfer never trips it while a stalled one
    // does.
    //
    std::uint32_t read_timeout = 60000;

    // Maximum number of redirects to follow.
    //
    std::uint8_t max_redirects = 10;

    bool verify_ssl = true;

    // SSL certificate file path (empty = use system defaults).
    //
    string_type ssl_cert_file;

    string_type user_agent = string_type ("batchdl/" BATCHDL_VERSION_ID);

    // Sent as "Authorization: Bearer <token>" on every request unless empty.
    //
    string_type bearer_token;

    bool follow_redirects = true;

    // Upper bound on buffered (non-streamed) response bodies.
    //
    std::uint64_t body_limit = 64 * 1024 * 1024;
  };

  // HTTP client session context.
  //
  template <typename T = http_client_traits<>>
  class basic_http_session
  {
  public:
    using traits_type = T;
    using string_type = typename traits_type::string_type;

    basic_http_session (asio::io_context& ioc, const traits_type& traits)
      : ioc_ (ioc), traits_ (traits), ssl_ctx_ (ssl::context::tlsv12_client)
    {
      configure_ssl ();
    }

    basic_http_session (const basic_http_session&) = delete;
    basic_http_session& operator= (const basic_http_session&) = delete;

    asio::io_context&
    io_context () noexcept
    {
      return ioc_;
    }

    const traits_type&
    traits () const noexcept
    {
      return traits_;
    }

    ssl::context&
    ssl_context () noexcept
    {
      return ssl_ctx_;
    }

  private:
    void
    configure_ssl ();

  private:
    asio::io_context& ioc_;
    traits_type traits_;
    ssl::context ssl_ctx_;
  };

  // HTTP client.
  //
  // Every operation opens its own connection and closes it when done. There
  // is no connection reuse: a download batch spends its time moving bodies,
  // not in handshakes.
  //
  template <typename T = http_client_traits<>>
  class basic_http_client
  {
  public:
    using traits_type   = T;
    using string_type   = typename traits_type::string_type;
    using request_type  = typename traits_type::request_type;
    using response_type = typename traits_type::response_type;
    using session_type  = basic_http_session<traits_type>;

    // Called once with the status and headers of the final response, before
    // any body bytes. Throwing aborts the exchange.
    //
    using head_handler = std::function<void (const response_type&)>;

    // Called for every body chunk in order. Throwing aborts the exchange.
    //
    using chunk_handler = std::function<void (const char*, std::size_t)>;

    explicit
    basic_http_client (asio::io_context& ioc)
      : session_ (std::make_unique<session_type> (ioc, traits_type ())) {}

    basic_http_client (asio::io_context& ioc, const traits_type& traits)
      : session_ (std::make_unique<session_type> (ioc, traits)) {}

    basic_http_client (const basic_http_client&) = delete;
    basic_http_client& operator= (const basic_http_client&) = delete;

    // Perform a request and buffer the whole response body.
    //
    asio::awaitable<response_type>
    request (request_type req);

    asio::awaitable<response_type>
    get (const string_type& url);

    // Perform a HEAD request. The parser is told not to expect a body even
    // though Content-Length describes one.
    //
    asio::awaitable<response_type>
    head (const string_type& url);

    // Perform a GET request, read the response head only, and drop the
    // connection. This is how we learn the size of a resource on servers
    // that reject HEAD without pulling its body.
    //
    asio::awaitable<response_type>
    probe (const string_type& url);

    // Perform a request and stream the body of the final response through
    // the handlers. The returned response has no body.
    //
    asio::awaitable<response_type>
    stream (request_type req, head_handler on_head, chunk_handler on_chunk);

    session_type&
    session () noexcept
    {
      return *session_;
    }

    const traits_type&
    traits () const noexcept
    {
      return session_->traits ();
    }

  private:
    enum class body_mode
    {
      buffer, // Read the body into the response.
      head,   // Read the head only (HEAD request or probe).
      stream  // Hand the body to the chunk handler.
    };

    // Common request path: apply default headers, connect, exchange, and
    // follow redirects.
    //
    asio::awaitable<response_type>
    request_impl (request_type req,
                  body_mode mode,
                  const head_handler* on_head,
                  const chunk_handler* on_chunk,
                  std::uint8_t redirect_count);

    // Send the request on an established stream and read the response
    // according to the mode. Redirect responses are returned without their
    // body.
    //
    template <typename Stream>
    asio::awaitable<response_type>
    exchange (Stream& s,
              const request_type& req,
              body_mode mode,
              const head_handler* on_head,
              const chunk_handler* on_chunk);

    asio::awaitable<response_type>
    request_ssl (const request_type& req,
                 body_mode mode,
                 const head_handler* on_head,
                 const chunk_handler* on_chunk);

    asio::awaitable<response_type>
    request_tcp (const request_type& req,
                 body_mode mode,
                 const head_handler* on_head,
                 const chunk_handler* on_chunk);

    void
    prepare (request_type& req) const;

  private:
    std::unique_ptr<session_type> session_;
  };

  using http_session = basic_http_session<>;
  using http_client  = basic_http_client<>;
}

#include <batchdl/http/http-client.ixx>
#include <batchdl/http/http-client.txx>
