#include <batchdl/download/download-path.hxx>

#include <chrono>
#include <sstream>
#include <filesystem>

using namespace std;

namespace batchdl
{
  namespace fs = filesystem;

  // Last segment of the URL path, query and fragment excluded.
  //
  static string
  url_filename (const string& url)
  {
    string p (url);

    if (size_t i = p.find ("://"); i != string::npos)
    {
      size_t s (p.find ('/', i + 3));
      p = s != string::npos ? p.substr (s) : string ();
    }

    if (size_t i = p.find_first_of ("?#"); i != string::npos)
      p.resize (i);

    size_t s (p.rfind ('/'));
    return s != string::npos ? p.substr (s + 1) : p;
  }

  static bool
  plausible_extension (const string& e)
  {
    // With the leading dot.
    //
    return e.size () > 1 && e.size () < 8 &&
           e.find_first_of ("?=&/\\*\"<>|") == string::npos;
  }

  resolved_name
  resolve_filename (const string& url, const optional<string>& pref)
  {
    resolved_name r;
    string n;

    if (pref)
    {
      fs::path c (fs::path (*pref).lexically_normal ());

      // "dir/" normalizes to "dir/" with an empty file name.
      //
      if (!c.has_filename () && c.has_parent_path () &&
          c.parent_path () != c.root_path ())
        c = c.parent_path ();

      bool up (false);
      for (const fs::path& e: c)
      {
        if (e == "..")
        {
          up = true;
          break;
        }
      }

      if (c.is_absolute () || c.has_root_path () || up)
      {
        string b (c.filename ().string ());

        if (b == "..")
          b.clear ();

        r.warnings.push_back ("preferred name '" + *pref + "' (cleaned to '" +
                              c.string () + "') is absolute or attempts " +
                              "path traversal; using only its base name");
        n = b;
      }
      else
        n = c.string ();
    }
    else
      n = url_filename (url);

    if (n.empty () || n == "." || n == "/" || n[0] == '?')
    {
      using namespace chrono;

      auto ns (duration_cast<nanoseconds> (
                 system_clock::now ().time_since_epoch ()).count ());

      ostringstream o;
      o << "download_" << hex << ns;

      string e (fs::path (n).extension ().string ());
      o << (plausible_extension (e) ? e : string (".file"));

      string f (o.str ());

      r.warnings.push_back ("could not determine a valid filename for URL '" +
                            url + "'; using fallback " + f);
      n = f;
    }

    r.name = move (n);
    return r;
  }

  string
  sanitize_filename (const string& s)
  {
    string r (s);

    for (char& c: r)
    {
      switch (c)
      {
      case '/': case '\\': case ':': case '*': case '?':
      case '"': case '<':  case '>': case '|':
        c = '_';
        break;
      default:
        break;
      }
    }

    return r;
  }

  string
  repo_id_to_safe_path (const string& id)
  {
    string s (id);

    for (const char* p: {"https://huggingface.co/", "http://huggingface.co/"})
    {
      string x (p);
      if (s.compare (0, x.size (), x) == 0)
        s.erase (0, x.size ());
    }

    size_t i (s.find ('/'));

    if (i == string::npos)
      return "hf_" + sanitize_filename (s);

    size_t j (s.find ('/', i + 1));

    string owner (s.substr (0, i));
    string repo (s.substr (i + 1, j == string::npos ? string::npos : j - i - 1));

    return sanitize_filename (owner) + '_' + sanitize_filename (repo);
  }
}
