#include <batchdl/batchdl-source.hxx>

#include <cassert>
#include <sstream>
#include <iostream>
#include <stdexcept>

using namespace std;
using namespace batchdl;

static void
test_sources ()
{
  source_request r;

  try
  {
    validate_sources (r);
    assert (false);
  }
  catch (const invalid_argument& e)
  {
    assert (string (e.what ()).find ("no download source") != string::npos);
  }

  r.urls = {"https://example.org/a"};
  assert (validate_sources (r) == source_kind::urls);

  r.model = "qwen3-4b";

  try
  {
    validate_sources (r);
    assert (false);
  }
  catch (const invalid_argument& e)
  {
    assert (string (e.what ()).find ("mutually exclusive") != string::npos);
  }

  r.urls.clear ();
  assert (validate_sources (r) == source_kind::model);

  r.model = nullopt;
  r.repository = "owner/repo";
  assert (validate_sources (r) == source_kind::repository);

  r.repository = nullopt;
  r.file = "urls.txt";
  assert (validate_sources (r) == source_kind::file);
}

static void
test_url_list ()
{
  istringstream is ("  https://example.org/a  \n"
                    "\n"
                    "# comment\n"
                    "   # indented comment\n"
                    "\t\r\n"
                    "https://example.org/b\r\n");

  vector<string> r (parse_url_list (is));

  assert (r.size () == 2);
  assert (r[0] == "https://example.org/a");
  assert (r[1] == "https://example.org/b");

  try
  {
    read_url_list ("/nonexistent/batchdl/urls.txt");
    assert (false);
  }
  catch (const runtime_error&) {}
}

static void
test_aliases ()
{
  assert (model_registry ().size () == 8);

  download_item i (resolve_model_alias ("gemma3-27b"));
  assert (i.url.find ("gemma-3-27b-it-Q4_0.gguf?download=true") !=
          string::npos);
  assert (i.preferred_name && *i.preferred_name == "gemma-3-27b-it-Q4_0.gguf");

  try
  {
    resolve_model_alias ("no-such-model");
    assert (false);
  }
  catch (const invalid_argument& e)
  {
    assert (string (e.what ()).find ("no-such-model") != string::npos);
  }
}

// Two items resolving to the same destination: the first one wins.
//
static void
test_plan ()
{
  vector<string> ws;
  auto warn ([&ws] (const string& m) {ws.push_back (m);});

  vector<download_item> is {
    download_item ("https://example.org/x/model.bin"),
    download_item ("https://mirror.example.org/y/model.bin?token=1"),
    download_item ("https://example.org/z", string ("../../etc/passwd")),
    download_item ("https://example.org/w", string ("sub/dir/w.bin"))};

  vector<planned_download> r (plan_downloads (is, "out", warn));

  assert (r.size () == 3);
  assert (r[0].target == fs::path ("out/model.bin"));
  assert (r[0].item.url == "https://example.org/x/model.bin");
  assert (r[1].target == fs::path ("out/passwd"));
  assert (r[2].target == fs::path ("out/sub/dir/w.bin"));

  // One for the traversal, one for the collision.
  //
  assert (ws.size () == 2);

  bool collision (false);
  for (const string& w: ws)
    if (w.find ("already used") != string::npos)
      collision = true;

  assert (collision);
}

int
main ()
{
  test_sources ();
  test_url_list ();
  test_aliases ();
  test_plan ();

  cout << "all source tests passed" << endl;
}
