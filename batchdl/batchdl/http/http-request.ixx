namespace batchdl
{
  // The request line only takes the path and query, not the absolute URI, so
  // strip the scheme and authority. A fragment never goes on the wire.
  //
  template <typename S>
  inline typename basic_http_request<S>::string_type
  basic_http_request<S>::
  target () const
  {
    std::size_t p (0);

    if (std::size_t n (url.find ("://")); n != string_type::npos)
      p = n + 3;

    std::size_t b (url.find_first_of ("/?", p));
    if (b == string_type::npos)
      return string_type ("/");

    string_type r (url.substr (b));

    if (std::size_t f (r.find ('#')); f != string_type::npos)
      r.erase (f);

    if (r.empty () || r[0] == '?')
      r.insert (0, 1, '/');

    return r;
  }

  template <typename S>
  inline typename basic_http_request<S>::string_type
  basic_http_request<S>::
  host () const
  {
    std::size_t p (0);

    if (std::size_t n (url.find ("://")); n != string_type::npos)
      p = n + 3;

    std::size_t n (url.find_first_of ("/?#:", p));
    if (n == string_type::npos)
      n = url.size ();

    return url.substr (p, n - p);
  }

  template <typename S>
  inline void basic_http_request<S>::
  normalize ()
  {
    // Required by HTTP/1.1. The value is the URL authority, so an explicit
    // port is carried along.
    //
    if (!has_header (string_type ("Host")))
    {
      std::size_t p (0);

      if (std::size_t n (url.find ("://")); n != string_type::npos)
        p = n + 3;

      std::size_t n (url.find_first_of ("/?#", p));
      if (n == string_type::npos)
        n = url.size ();

      string_type h (url.substr (p, n - p));
      if (!h.empty ())
        set_header (string_type ("Host"), std::move (h));
    }
  }
}
