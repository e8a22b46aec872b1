#include <batchdl/selection/series-selection.hxx>

#include <cctype>
#include <cstdio>
#include <charconv>
#include <algorithm>
#include <unordered_map>

using namespace std;

namespace batchdl
{
  static string
  trim (const string& s)
  {
    size_t b (s.find_first_not_of (" \t\r\n"));

    if (b == string::npos)
      return string ();

    size_t e (s.find_last_not_of (" \t\r\n"));
    return s.substr (b, e - b + 1);
  }

  static void
  add_unique (vector<remote_file>& r,
              unordered_map<string, size_t>& seen,
              vector<remote_file> fs)
  {
    for (remote_file& f: fs)
    {
      auto i (seen.find (f.filename));

      if (i != seen.end ())
        r[i->second] = move (f);
      else
      {
        seen.emplace (f.filename, r.size ());
        r.push_back (move (f));
      }
    }
  }

  selection_result
  parse_selection (const string& line, const vector<selectable_entry>& es)
  {
    string c (trim (line));
    transform (c.begin (), c.end (), c.begin (),
               [] (unsigned char x) {return tolower (x);});

    selection_result r;
    unordered_map<string, size_t> seen;

    auto skip ([&r] (const selectable_entry& e)
    {
      r.warnings.push_back ("skipping incomplete series: " + e.label ());
    });

    if (c == "none")
      return r;

    if (c == "all")
    {
      for (const selectable_entry& e: es)
      {
        if (e.complete ())
          add_unique (r.files, seen, e.files ());
        else
          skip (e);
      }

      return r;
    }

    // Validate the whole line before taking anything from it.
    //
    vector<size_t> picks;

    for (size_t b (0); b <= c.size ();)
    {
      size_t e (c.find (',', b));
      if (e == string::npos)
        e = c.size ();

      string t (trim (c.substr (b, e - b)));
      b = e + 1;

      if (t.empty ())
        continue;

      size_t n (0);
      auto [p, ec] = from_chars (t.data (), t.data () + t.size (), n);

      if (ec != errc () || p != t.data () + t.size () ||
          n == 0 || n > es.size ())
        throw invalid_selection ("invalid input: '" + t + "'. please enter " +
                                 "numbers from 1 to " + to_string (es.size ()));

      picks.push_back (n - 1);
    }

    for (size_t i: picks)
    {
      const selectable_entry& e (es[i]);

      if (e.complete ())
        add_unique (r.files, seen, e.files ());
      else
        skip (e);
    }

    return r;
  }

  vector<remote_file>
  prompt_selection (const vector<selectable_entry>& es, istream& in,
                    ostream& out)
  {
    out << "\nAvailable GGUF files/series for download:\n";

    for (size_t i (0); i != es.size (); ++i)
    {
      char n[16];
      snprintf (n, sizeof (n), "%3zu. ", i + 1);
      out << n << es[i].label () << '\n';
    }

    out << "---" << endl;

    for (;;)
    {
      out << "Enter numbers (e.g., 1,3), 'all' (listed GGUFs), or 'none': "
          << flush;

      string l;
      if (!getline (in, l))
      {
        out << endl;
        throw ios_base::failure ("unable to read selection from stdin");
      }

      try
      {
        selection_result r (parse_selection (l, es));

        for (const string& w: r.warnings)
          out << "warning: " << w << '\n';

        return move (r.files);
      }
      catch (const invalid_selection& e)
      {
        out << "error: " << e.what () << endl;
      }
    }
  }
}
