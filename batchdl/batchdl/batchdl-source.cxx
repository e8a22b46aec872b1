#include <batchdl/batchdl-source.hxx>

#include <set>
#include <fstream>
#include <stdexcept>

#include <batchdl/diagnostics.hxx>
#include <batchdl/download/download-path.hxx>

using namespace std;

namespace batchdl
{
  source_kind
  validate_sources (const source_request& r)
  {
    size_t n (0);
    source_kind k (source_kind::urls);

    if (!r.urls.empty ())  {++n; k = source_kind::urls;}
    if (r.file)            {++n; k = source_kind::file;}
    if (r.repository)      {++n; k = source_kind::repository;}
    if (r.model)           {++n; k = source_kind::model;}

    if (n == 0)
      throw invalid_argument (
        "no download source provided; specify URLs, --file, --hf, or --model "
        "(see --help)");

    if (n > 1)
      throw invalid_argument (
        "URLs, --file, --hf, and --model are mutually exclusive");

    return k;
  }

  vector<string>
  parse_url_list (istream& is)
  {
    vector<string> r;

    for (string l; getline (is, l); )
    {
      size_t b (l.find_first_not_of (" \t\r\n"));

      if (b == string::npos)
        continue;

      size_t e (l.find_last_not_of (" \t\r\n"));
      l = l.substr (b, e - b + 1);

      if (l[0] == '#')
        continue;

      r.push_back (move (l));
    }

    return r;
  }

  vector<string>
  read_url_list (const fs::path& p)
  {
    ifstream is (p);

    if (!is)
      throw runtime_error ("unable to read URL file '" + p.string () + "'");

    vector<string> r (parse_url_list (is));

    if (is.bad ())
      throw runtime_error ("unable to read URL file '" + p.string () + "'");

    trace (trace_level::debug,
           "read " + to_string (r.size ()) + " URL(s) from " + p.string ());

    return r;
  }

  const map<string, string>&
  model_registry ()
  {
    static const map<string, string> r {
      {"qwen3-0.6b",
       "https://huggingface.co/Qwen/Qwen3-4B-GGUF/resolve/main/"
       "Qwen3-4B-Q4_K_M.gguf?download=true"},
      {"qwen3-1.7b",
       "https://huggingface.co/Qwen/Qwen3-8B-GGUF/resolve/main/"
       "Qwen3-8B-Q4_K_M.gguf?download=true"},
      {"qwen3-4b",
       "https://huggingface.co/Qwen/Qwen3-4B-GGUF/resolve/main/"
       "Qwen3-4B-Q4_K_M.gguf?download=true"},
      {"qwen3-8b",
       "https://huggingface.co/Qwen/Qwen3-8B-GGUF/resolve/main/"
       "Qwen3-8B-Q4_K_M.gguf?download=true"},
      {"qwen3-16b",
       "https://huggingface.co/Qwen/Qwen3-16B-GGUF/resolve/main/"
       "Qwen3-16B-Q4_K_M.gguf?download=true"},
      {"qwen3-32b",
       "https://huggingface.co/Qwen/Qwen3-32B-GGUF/resolve/main/"
       "Qwen3-32B-Q4_K_M.gguf?download=true"},
      {"qwen3-30b-moe",
       "https://huggingface.co/Qwen/Qwen3-16B-GGUF/resolve/main/"
       "Qwen3-16B-Q4_K_M.gguf?download=true"},
      {"gemma3-27b",
       "https://huggingface.co/unsloth/gemma-3-27b-it-GGUF/resolve/main/"
       "gemma-3-27b-it-Q4_0.gguf?download=true"}};

    return r;
  }

  download_item
  resolve_model_alias (const string& a)
  {
    const auto& m (model_registry ());
    auto i (m.find (a));

    if (i == m.end ())
      throw invalid_argument ("model alias '" + a +
                              "' not found in the registry");

    const string& u (i->second);

    string n (u.substr (0, u.find_first_of ("?#")));
    n = n.substr (n.rfind ('/') + 1);

    if (n.empty ())
      n = "download.file";

    return download_item (u, move (n));
  }

  vector<planned_download>
  plan_downloads (const vector<download_item>& items,
                  const fs::path& dir,
                  const plan_warning& warn)
  {
    vector<planned_download> r;
    set<fs::path> taken;

    for (const download_item& i: items)
    {
      resolved_name n (resolve_filename (i.url, i.preferred_name));

      for (const string& w: n.warnings)
        warn (w);

      fs::path t ((dir / n.name).lexically_normal ());

      if (!taken.insert (t).second)
      {
        warn ("skipping " + i.url + ": destination '" + t.string () +
              "' is already used by another download");
        continue;
      }

      trace (trace_level::debug, i.url + " -> " + t.string ());

      r.push_back (planned_download {i, move (t)});
    }

    return r;
  }
}
