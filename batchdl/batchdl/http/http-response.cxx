#include <batchdl/http/http-response.hxx>

#include <charconv>

using namespace std;

namespace batchdl
{
  static optional<uint64_t>
  parse_number (const string& s)
  {
    if (s.empty ())
      return nullopt;

    uint64_t n (0);
    const char* e (s.data () + s.size ());
    auto r (from_chars (s.data (), e, n));

    if (r.ec != errc () || r.ptr != e)
      return nullopt;

    return n;
  }

  // bytes <first>-<last>/<complete|*>
  // bytes */<complete>
  //
  optional<content_range>
  parse_content_range (const string& v)
  {
    if (v.compare (0, 6, "bytes ") != 0)
      return nullopt;

    string s (v.substr (6));

    size_t sl (s.find ('/'));
    if (sl == string::npos)
      return nullopt;

    string span (s.substr (0, sl));
    string total (s.substr (sl + 1));

    content_range r;

    if (total != "*")
    {
      r.complete = parse_number (total);
      if (!r.complete)
        return nullopt;
    }

    if (span != "*")
    {
      size_t d (span.find ('-'));
      if (d == string::npos)
        return nullopt;

      r.first = parse_number (span.substr (0, d));
      r.last = parse_number (span.substr (d + 1));

      if (!r.first || !r.last || *r.last < *r.first)
        return nullopt;
    }
    else if (!r.complete)
      return nullopt;

    return r;
  }
}
