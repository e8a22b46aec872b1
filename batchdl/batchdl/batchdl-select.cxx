#include <batchdl/batchdl-select.hxx>

#include <batchdl/diagnostics.hxx>
#include <batchdl/download/download-prescanner.hxx>
#include <batchdl/selection/series-classifier.hxx>
#include <batchdl/selection/series-selection.hxx>

using namespace std;

namespace batchdl
{
  asio::awaitable<vector<remote_file>>
  select_gguf_files (http_client& h,
                     vector<remote_file> files,
                     istream& in,
                     ostream& out)
  {
    out << "info: identifying GGUF files and series for selection" << endl;

    vector<remote_file> gs (filter_gguf (move (files)));

    if (gs.empty ())
    {
      out << "info: no GGUF files found in the repository" << endl;
      co_return vector<remote_file> ();
    }

    out << "info: fetching sizes for " << gs.size () << " GGUF file(s)"
        << endl;

    size_prescanner ps (h);

    ps.set_warning_callback ([&out] (const string& m)
    {
      out << "warning: " << m << endl;
    });

    size_map sizes (co_await ps.scan (prescan_targets (gs)));

    vector<selectable_entry> es (classify_files (gs, sizes));

    trace (trace_level::debug,
           to_string (es.size ()) + " selectable entries from " +
           to_string (gs.size ()) + " GGUF file(s)");

    co_return prompt_selection (es, in, out);
  }
}
