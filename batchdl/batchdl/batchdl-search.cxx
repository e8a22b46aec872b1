#include <batchdl/batchdl-search.hxx>

#include <cstdio>
#include <iostream>

#include <batchdl/hf/hf-api.hxx>
#include <batchdl/progress/progress-format.hxx>

using namespace std;

namespace batchdl
{
  void
  print_model_search (ostream& o,
                      const string& q,
                      const vector<hf_model_summary>& ms)
  {
    o << "\n" << "Top " << ms.size () << " model results for \"" << q
      << "\" (sorted by downloads):" << "\n"
      << string (80, '=') << "\n";

    size_t n (0);

    for (const hf_model_summary& m: ms)
    {
      char idx[16];
      snprintf (idx, sizeof (idx), "%2zu", ++n);

      // Task, with the access restrictions, if any, in parentheses.
      //
      string t (m.pipeline_tag ? *m.pipeline_tag : string ("N/A"));
      string a;

      if (m.is_private)
        a = "Private";

      if (!m.gated.empty ())
        a += (a.empty () ? "" : ", ") + m.gated;

      if (!a.empty ())
        t += " (" + a + ")";

      o << idx << ". Model ID: " << m.id << "\n"
        << "    Author: " << m.owner () << "\n"
        << "    Stats: Downloads: " << format_count (m.downloads)
        << " | Likes: " << format_count (m.likes)
        << " | Updated: " << m.updated () << "\n"
        << "    Task: " << t << "\n";

      if (!m.tags.empty ())
      {
        o << "    Tags: ";

        for (size_t i (0); i != m.tags.size () && i != 10; ++i)
          o << (i != 0 ? ", " : "") << m.tags[i];

        o << "\n";
      }

      o << string (40, '-') << "\n";
    }

    o.flush ();
  }

  asio::awaitable<void>
  search_models (http_client& h, const string& q)
  {
    cerr << "info: searching for models matching '" << q
         << "' on Hugging Face..." << endl;

    hf_api<> api (h);
    vector<hf_model_summary> ms (co_await api.search_models (q));

    if (ms.empty ())
    {
      cerr << "info: no models found matching '" << q << "'" << endl;
      co_return;
    }

    print_model_search (cout, q, ms);
  }
}
