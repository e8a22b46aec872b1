#include <charconv>

namespace batchdl
{
  // Note that we use std::from_chars for locale-independent parsing and
  // require the whole value to be consumed: "12abc" is not a length.
  //
  template <typename S, typename B>
  inline std::optional<std::uint64_t> basic_http_response<S, B>::
  content_length () const
  {
    auto v (get_header (string_type ("Content-Length")));

    if (!v || v->empty ())
      return std::nullopt;

    std::uint64_t n (0);
    const char* e (v->data () + v->size ());
    auto r (std::from_chars (v->data (), e, n));

    if (r.ec == std::errc () && r.ptr == e)
      return n;

    return std::nullopt;
  }

  template <typename S, typename B>
  inline std::optional<content_range> basic_http_response<S, B>::
  range () const
  {
    auto v (get_header (string_type ("Content-Range")));
    return v ? parse_content_range (*v) : std::nullopt;
  }
}
