#include <batchdl/progress/progress-format.hxx>

#include <cmath>
#include <iomanip>
#include <sstream>
#include <algorithm>
#include <filesystem>

using namespace std;

namespace batchdl
{
  string
  format_bytes (uint64_t b)
  {
    if (b < 1000)
      return to_string (b) + " B";

    static const char* u[] = {"B", "KB", "MB", "GB", "TB", "PB", "EB"};
    static const size_t n (sizeof (u) / sizeof (*u));

    double v (static_cast<double> (b));
    size_t i (0);

    while (v >= 1000.0 && i < n - 1)
    {
      v /= 1000.0;
      ++i;
    }

    ostringstream o;
    o << fixed << setprecision (2) << v << ' ' << u[i];
    return o.str ();
  }

  string
  format_speed (float bps)
  {
    return format_bytes (static_cast<uint64_t> (max (bps, 0.0f))) + "/s";
  }

  string
  format_duration (int s)
  {
    ostringstream o;

    if (s < 60)
      o << s << 's';
    else if (s < 3600)
      o << s / 60 << 'm' << setfill ('0') << setw (2) << s % 60 << 's';
    else
    {
      // Past an hour the seconds are noise.
      //
      o << s / 3600 << 'h' << setfill ('0') << setw (2) << (s % 3600) / 60
        << 'm';
    }

    return o.str ();
  }

  string
  format_count (uint64_t n)
  {
    if (n < 1000)
      return to_string (n);

    ostringstream o;
    o << fixed << setprecision (1);

    if (n < 1000000)
      o << n / 1e3 << 'K';
    else if (n < 1000000000)
      o << n / 1e6 << 'M';
    else
      o << n / 1e9 << 'B';

    return o.str ();
  }

  string
  format_bar (float r, int w, bool ind)
  {
    string s ("[");

    if (ind)
    {
      for (int i (0); i < w; ++i)
        s += (i == w / 2 ? '>' : ' ');
    }
    else
    {
      int f (static_cast<int> (round (r * w)));
      f = min (max (f, 0), w);

      for (int i (0); i < w; ++i)
      {
        if      (i <  f - 1) s += '=';
        else if (i == f - 1) s += '>';
        else                 s += ' ';
      }
    }

    s += ']';
    return s;
  }

  string
  truncate_label (const string& n, size_t max)
  {
    if (n.size () <= max)
      return n;

    filesystem::path p (n);
    string ext (p.extension ().string ());
    string stem (p.stem ().string ());

    size_t avail (max > ext.size () + 3 ? max - ext.size () - 3 : 0);

    if (avail > 0 && stem.size () > avail)
      return "..." + stem.substr (stem.size () - avail) + ext;

    return max > 3 ? n.substr (0, max - 3) + "..." : n.substr (0, max);
  }

  string
  shorten_message (const string& m, size_t max)
  {
    if (m.size () <= max)
      return m;

    return max > 3 ? m.substr (0, max - 3) + "..." : m.substr (0, max);
  }
}
