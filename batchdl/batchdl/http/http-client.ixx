#include <openssl/ssl.h>

namespace batchdl
{
  template <typename T>
  inline void basic_http_session<T>::
  configure_ssl ()
  {
    if (!traits_.ssl_cert_file.empty ())
      ssl_ctx_.load_verify_file (traits_.ssl_cert_file);
    else
      ssl_ctx_.set_default_verify_paths ();

    ssl_ctx_.set_verify_mode (traits_.verify_ssl
                              ? ssl::verify_peer
                              : ssl::verify_none);

    ssl_ctx_.set_options (ssl::context::default_workarounds |
                          ssl::context::no_sslv2 |
                          ssl::context::no_sslv3 |
                          ssl::context::single_dh_use);

    // SNI is set per stream, make sure the context doesn't interfere.
    //
    SSL_CTX_set_tlsext_servername_callback (ssl_ctx_.native_handle (),
                                            nullptr);
  }

  template <typename T>
  inline void basic_http_client<T>::
  prepare (request_type& req) const
  {
    const auto& tr (session_->traits ());

    if (!req.has_header (string_type ("User-Agent")))
      req.set_user_agent (tr.user_agent);

    if (!tr.bearer_token.empty () &&
        !req.has_header (string_type ("Authorization")))
      req.set_bearer_token (tr.bearer_token);

    req.normalize ();
  }

  template <typename T>
  inline asio::awaitable<typename basic_http_client<T>::response_type>
  basic_http_client<T>::
  request (request_type req)
  {
    prepare (req);
    co_return co_await request_impl (std::move (req),
                                     body_mode::buffer,
                                     nullptr,
                                     nullptr,
                                     0);
  }

  template <typename T>
  inline asio::awaitable<typename basic_http_client<T>::response_type>
  basic_http_client<T>::
  get (const string_type& url)
  {
    co_return co_await request (request_type (http_method::get, url));
  }

  template <typename T>
  inline asio::awaitable<typename basic_http_client<T>::response_type>
  basic_http_client<T>::
  head (const string_type& url)
  {
    request_type req (http_method::head, url);
    prepare (req);
    co_return co_await request_impl (std::move (req),
                                     body_mode::head,
                                     nullptr,
                                     nullptr,
                                     0);
  }

  template <typename T>
  inline asio::awaitable<typename basic_http_client<T>::response_type>
  basic_http_client<T>::
  probe (const string_type& url)
  {
    request_type req (http_method::get, url);
    prepare (req);
    co_return co_await request_impl (std::move (req),
                                     body_mode::head,
                                     nullptr,
                                     nullptr,
                                     0);
  }

  template <typename T>
  inline asio::awaitable<typename basic_http_client<T>::response_type>
  basic_http_client<T>::
  stream (request_type req, head_handler on_head, chunk_handler on_chunk)
  {
    prepare (req);
    co_return co_await request_impl (std::move (req),
                                     body_mode::stream,
                                     &on_head,
                                     &on_chunk,
                                     0);
  }
}
