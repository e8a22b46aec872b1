#include <batchdl/selection/series-classifier.hxx>

#include <map>
#include <regex>
#include <cctype>
#include <utility>
#include <algorithm>

#include <batchdl/progress/progress-format.hxx>

using namespace std;

namespace batchdl
{
  // selectable_entry
  //
  string selectable_entry::
  label () const
  {
    if (const series_group* g = get_if<series_group> (&value_))
    {
      string r ("Series: " + g->base + " (" + to_string (g->parts.size ()) +
                " parts, " + format_bytes (g->total_size) + ")");

      if (!g->complete ())
        r += " (INCOMPLETE: " + to_string (g->parts.size ()) + '/' +
             to_string (g->declared_total) + " parts)";

      return r;
    }

    const standalone_file& f (get<standalone_file> (value_));
    return "File: " + f.file.file.filename + " (" +
           format_bytes (f.file.size) + ")";
  }

  bool selectable_entry::
  complete () const noexcept
  {
    if (const series_group* g = get_if<series_group> (&value_))
      return g->complete ();

    return true;
  }

  vector<remote_file> selectable_entry::
  files () const
  {
    vector<remote_file> r;

    if (const series_group* g = get_if<series_group> (&value_))
    {
      for (const sized_file& p: g->parts)
        r.push_back (p.file);
    }
    else
      r.push_back (get<standalone_file> (value_).file.file);

    return r;
  }

  optional<series_part_name>
  parse_series_name (const string& n)
  {
    static const regex re (R"(^(.*?)-(\d{5})-of-(\d{5})\.gguf$)");

    smatch m;
    if (!regex_match (n, m, re))
      return nullopt;

    return series_part_name {m[1].str (),
                             static_cast<size_t> (stoul (m[2].str ())),
                             static_cast<size_t> (stoul (m[3].str ()))};
  }

  vector<selectable_entry>
  classify_files (const vector<remote_file>& fs, const size_map& sizes)
  {
    map<pair<string, size_t>, series_group> groups;
    vector<selectable_entry> r;

    for (const remote_file& f: fs)
    {
      auto i (sizes.find (f.url));
      uint64_t s (i != sizes.end () ? i->second : 0);

      if (optional<series_part_name> p = parse_series_name (f.filename))
      {
        series_group& g (groups[make_pair (p->base, p->total)]);

        if (g.parts.empty ())
        {
          g.base = p->base;
          g.declared_total = p->total;
        }

        g.parts.push_back (sized_file {f, s});
        g.total_size += s;
      }
      else
        r.emplace_back (standalone_file {sized_file {f, s}});
    }

    for (auto& gp: groups)
    {
      series_group& g (gp.second);

      sort (g.parts.begin (), g.parts.end (),
            [] (const sized_file& x, const sized_file& y)
            {
              return x.file.filename < y.file.filename;
            });

      r.emplace_back (move (g));
    }

    // Labels are computed once rather than on every comparison.
    //
    vector<pair<string, size_t>> keys;
    keys.reserve (r.size ());

    for (size_t i (0); i != r.size (); ++i)
      keys.emplace_back (r[i].label (), i);

    sort (keys.begin (), keys.end ());

    vector<selectable_entry> sorted;
    sorted.reserve (r.size ());

    for (const auto& k: keys)
      sorted.push_back (move (r[k.second]));

    return sorted;
  }

  vector<remote_file>
  filter_gguf (vector<remote_file> fs)
  {
    auto gguf ([] (const remote_file& f)
    {
      const string& n (f.filename);

      if (n.size () < 5)
        return false;

      string e (n.substr (n.size () - 5));
      transform (e.begin (), e.end (), e.begin (),
                 [] (unsigned char c) {return tolower (c);});

      return e == ".gguf";
    });

    fs.erase (remove_if (fs.begin (), fs.end (),
                         [&gguf] (const remote_file& f) {return !gguf (f);}),
              fs.end ());

    return fs;
  }
}
