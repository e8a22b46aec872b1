#include <limits>
#include <memory>
#include <chrono>
#include <stdexcept>

#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/ssl/stream.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <openssl/err.h>
#include <openssl/ssl.h>

namespace batchdl
{
  namespace http = beast::http;
  using tcp = asio::ip::tcp;

  struct url_parts
  {
    std::string scheme;
    std::string host;
    std::string port;
    std::string target;
  };

  // Parse a scheme://host[:port][/path][?query] URL.
  //
  // Note that this is deliberately minimal: no user info, no IPv6 literals.
  // Everything we talk to (Hugging Face, its CDN, plain mirrors) fits.
  //
  inline url_parts
  parse_url (const std::string& url)
  {
    url_parts r;
    std::size_t pos (0);

    std::size_t p (url.find ("://"));
    if (p != std::string::npos)
    {
      r.scheme = url.substr (0, p);
      pos = p + 3;
    }
    else
      r.scheme = "http";

    // The authority ends at the start of the path or the query.
    //
    std::size_t end (url.find_first_of ("/?#", pos));
    if (end == std::string::npos)
      end = url.size ();

    std::string auth (url.substr (pos, end - pos));
    std::size_t colon (auth.find (':'));

    if (colon != std::string::npos)
    {
      r.host = auth.substr (0, colon);
      r.port = auth.substr (colon + 1);
    }
    else
    {
      r.host = auth;
      r.port = (r.scheme == "https") ? "443" : "80";
    }

    if (r.host.empty ())
      throw std::invalid_argument ("invalid URL '" + url + "': no host");

    if (r.scheme != "http" && r.scheme != "https")
      throw std::invalid_argument ("invalid URL '" + url +
                                   "': unsupported scheme " + r.scheme);

    r.target = basic_http_request<std::string> (http_method::get,
                                                url).target ();
    return r;
  }

  // Resolve a Location header value against the URL that produced it.
  //
  inline std::string
  resolve_location (const std::string& base, const std::string& loc)
  {
    if (loc.find ("://") != std::string::npos)
      return loc;

    url_parts b (parse_url (base));
    std::string origin (b.scheme + "://" + b.host);

    bool def ((b.scheme == "https" && b.port == "443") ||
              (b.scheme == "http"  && b.port == "80"));
    if (!def)
      origin += ':' + b.port;

    // Network-path reference (//host/path).
    //
    if (loc.compare (0, 2, "//") == 0)
      return b.scheme + ':' + loc;

    if (!loc.empty () && loc[0] == '/')
      return origin + loc;

    // Relative to the directory of the current path.
    //
    std::string dir (b.target.substr (0, b.target.find ('?')));
    dir.erase (dir.rfind ('/') + 1);

    return origin + dir + loc;
  }

  inline http::verb
  to_beast_verb (http_method m)
  {
    switch (m)
    {
      case http_method::get:  return http::verb::get;
      case http_method::head: return http::verb::head;
    }
    return http::verb::get;
  }

  inline http_status
  from_beast_status (unsigned s)
  {
    return static_cast<http_status> (static_cast<std::uint16_t> (s));
  }

  // Arm the stream timer with the given bound (0 means no bound).
  //
  inline void
  arm_timeout (beast::tcp_stream& s, std::uint32_t ms)
  {
    if (ms != 0)
      s.expires_after (std::chrono::milliseconds (ms));
    else
      s.expires_never ();
  }

  // Resolve the host and port of the URL, bounded by the given timeout (0
  // means no bound).
  //
  // An in-flight resolve cannot be interrupted, so we wait on a timer that
  // the resolve completion cancels and leave a late resolve to finish into
  // the shared state.
  //
  inline asio::awaitable<tcp::resolver::results_type>
  resolve_host (asio::io_context& ctx, const url_parts& u, std::uint32_t ms)
  {
    if (ms == 0)
    {
      tcp::resolver r (ctx);
      co_return co_await r.async_resolve (u.host,
                                          u.port,
                                          asio::use_awaitable);
    }

    struct state
    {
      explicit
      state (asio::io_context& c): resolver (c), signal (c) {}

      tcp::resolver resolver;
      asio::steady_timer signal;
      boost::system::error_code ec;
      tcp::resolver::results_type results;
      bool done = false;
    };

    auto s (std::make_shared<state> (ctx));
    s->signal.expires_after (std::chrono::milliseconds (ms));

    s->resolver.async_resolve (
      u.host,
      u.port,
      [s] (const boost::system::error_code& ec,
           tcp::resolver::results_type r)
    {
      s->ec = ec;
      s->results = std::move (r);
      s->done = true;
      s->signal.cancel ();
    });

    boost::system::error_code ec;
    co_await s->signal.async_wait (
      asio::redirect_error (asio::use_awaitable, ec));

    if (!s->done)
    {
      s->resolver.cancel ();
      throw boost::system::system_error (asio::error::timed_out,
                                         "unable to resolve " + u.host);
    }

    if (s->ec)
      throw boost::system::system_error (s->ec,
                                         "unable to resolve " + u.host);

    co_return s->results;
  }

  template <typename T>
  asio::awaitable<typename basic_http_client<T>::response_type>
  basic_http_client<T>::
  request_impl (request_type req,
                body_mode mode,
                const head_handler* on_head,
                const chunk_handler* on_chunk,
                std::uint8_t redirect_count)
  {
    const auto& tr (session_->traits ());

    url_parts parts (parse_url (req.url));

    response_type r;

    if (parts.scheme == "https")
      r = co_await request_ssl (req, mode, on_head, on_chunk);
    else
      r = co_await request_tcp (req, mode, on_head, on_chunk);

    if (tr.follow_redirects && r.is_redirection ())
    {
      if (auto loc = r.location ())
      {
        if (redirect_count >= tr.max_redirects)
          throw std::runtime_error ("maximum redirects exceeded for " +
                                    req.url);

        request_type next (req.method,
                           resolve_location (req.url, *loc),
                           req.version);
        next.headers = req.headers;

        // The copied Host would point the CDN at the origin name.
        //
        next.headers.remove (string_type ("Host"));

        // Never hand credentials to a different host. Hugging Face redirects
        // downloads to a CDN that must not see the token.
        //
        if (next.host () != req.host ())
          next.headers.remove (string_type ("Authorization"));

        next.normalize ();

        co_return co_await request_impl (std::move (next),
                                         mode,
                                         on_head,
                                         on_chunk,
                                         redirect_count + 1);
      }
    }

    co_return r;
  }

  template <typename T>
  template <typename Stream>
  asio::awaitable<typename basic_http_client<T>::response_type>
  basic_http_client<T>::
  exchange (Stream& s,
            const request_type& req,
            body_mode mode,
            const head_handler* on_head,
            const chunk_handler* on_chunk)
  {
    using parser_type = http::response_parser<http::buffer_body>;

    const auto& tr (session_->traits ());

    // We need the lowest layer (the TCP stream) to set timeouts, regardless
    // of whether there is an SSL layer on top.
    //
    auto& layer (beast::get_lowest_layer (s));

    http::request<http::empty_body> br;
    br.method (to_beast_verb (req.method));
    br.target (req.target ());
    br.version (req.version.major * 10 + req.version.minor);

    for (const auto& h : req.headers)
      br.set (h.name, h.value);

    arm_timeout (layer, tr.read_timeout);
    co_await http::async_write (s, br, asio::use_awaitable);

    beast::flat_buffer b;
    parser_type p;

    p.body_limit (mode == body_mode::stream
                  ? std::numeric_limits<std::uint64_t>::max ()
                  : tr.body_limit);

    // A HEAD response describes a body it doesn't carry.
    //
    if (req.method == http_method::head)
      p.skip (true);

    arm_timeout (layer, tr.read_timeout);
    co_await http::async_read_header (s, b, p, asio::use_awaitable);

    const auto& h (p.get ());

    response_type r;
    r.status  = from_beast_status (h.result_int ());
    r.version = http_version (h.version () / 10, h.version () % 10);
    r.reason  = string_type (h.reason ());
    r.url     = req.url;

    for (const auto& f : h)
      r.headers.add (string_type (f.name_string ()),
                     string_type (f.value ()));

    // Leave the body of a redirect on the wire, the connection is dropped
    // anyway.
    //
    if (tr.follow_redirects && r.is_redirection () && r.location ())
      co_return r;

    if (mode == body_mode::head)
      co_return r;

    if (mode == body_mode::stream)
      (*on_head) (r);

    string_type body;
    char buf[8192];

    while (!p.is_done ())
    {
      p.get ().body ().data = buf;
      p.get ().body ().size = sizeof (buf);

      // Re-arm for every chunk: this is an idle bound, not a deadline for
      // the whole body.
      //
      arm_timeout (layer, tr.read_timeout);

      beast::error_code ec;
      co_await http::async_read (s, b, p,
                                 asio::redirect_error (asio::use_awaitable,
                                                       ec));

      // The parser reports a full buffer as need_buffer, which simply means
      // we have to drain it before continuing.
      //
      if (ec == http::error::need_buffer)
        ec = {};

      if (ec)
        throw beast::system_error (ec);

      std::size_t n (sizeof (buf) - p.get ().body ().size);

      if (n != 0)
      {
        if (mode == body_mode::stream)
          (*on_chunk) (buf, n);
        else
          body.append (buf, n);
      }
    }

    if (mode == body_mode::buffer)
      r.body = std::move (body);

    co_return r;
  }

  template <typename T>
  asio::awaitable<typename basic_http_client<T>::response_type>
  basic_http_client<T>::
  request_ssl (const request_type& req,
               body_mode mode,
               const head_handler* on_head,
               const chunk_handler* on_chunk)
  {
    using stream_type = beast::ssl_stream<beast::tcp_stream>;

    auto& ctx (session_->io_context ());
    auto& sctx (session_->ssl_context ());
    const auto& tr (session_->traits ());

    url_parts parts (parse_url (req.url));

    auto addrs (co_await resolve_host (ctx, parts, tr.connect_timeout));

    stream_type s (ctx, sctx);

    // Set the SNI hostname. Beast doesn't wrap this so we drop down to the
    // OpenSSL C API. Failing here means the handshake would fail or return
    // the wrong certificate later.
    //
    if (!SSL_set_tlsext_host_name (s.native_handle (), parts.host.c_str ()))
    {
      beast::error_code ec (static_cast<int> (::ERR_get_error ()),
                            asio::error::get_ssl_category ());

      throw beast::system_error (ec, "unable to set SNI hostname");
    }

    if (tr.verify_ssl)
      s.set_verify_callback (ssl::host_name_verification (parts.host));

    auto& layer (beast::get_lowest_layer (s));

    arm_timeout (layer, tr.connect_timeout);
    co_await layer.async_connect (addrs, asio::use_awaitable);

    arm_timeout (layer, tr.connect_timeout);
    co_await s.async_handshake (ssl::stream_base::client,
                                asio::use_awaitable);

    // Note that we don't attempt an SSL shutdown: plenty of servers just
    // close the TCP connection after the response and the shutdown would
    // then block until the timeout.
    //
    co_return co_await exchange (s, req, mode, on_head, on_chunk);
  }

  template <typename T>
  asio::awaitable<typename basic_http_client<T>::response_type>
  basic_http_client<T>::
  request_tcp (const request_type& req,
               body_mode mode,
               const head_handler* on_head,
               const chunk_handler* on_chunk)
  {
    auto& ctx (session_->io_context ());
    const auto& tr (session_->traits ());

    url_parts parts (parse_url (req.url));

    auto addrs (co_await resolve_host (ctx, parts, tr.connect_timeout));

    beast::tcp_stream s (ctx);

    arm_timeout (s, tr.connect_timeout);
    co_await s.async_connect (addrs, asio::use_awaitable);

    response_type r (co_await exchange (s, req, mode, on_head, on_chunk));

    beast::error_code ec;
    s.socket ().shutdown (tcp::socket::shutdown_both, ec);

    co_return r;
  }
}
