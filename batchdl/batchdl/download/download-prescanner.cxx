#include <batchdl/download/download-prescanner.hxx>

using namespace std;

namespace batchdl
{
  vector<prescan_target>
  prescan_targets (const vector<download_item>& is)
  {
    vector<prescan_target> r;
    r.reserve (is.size ());

    for (const download_item& i: is)
      r.push_back (prescan_target {i.url, i.preferred_name.value_or (i.url)});

    return r;
  }

  vector<prescan_target>
  prescan_targets (const vector<remote_file>& fs)
  {
    vector<prescan_target> r;
    r.reserve (fs.size ());

    for (const remote_file& f: fs)
      r.push_back (prescan_target {f.url, f.filename});

    return r;
  }
}
