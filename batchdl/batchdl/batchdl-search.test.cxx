#include <batchdl/batchdl-search.hxx>

#include <cassert>
#include <sstream>
#include <iostream>

using namespace std;
using namespace batchdl;

static void
test_print ()
{
  hf_model_summary a;
  a.id = "Qwen/Qwen3-4B-GGUF";
  a.downloads = 1234567;
  a.likes = 950;
  a.last_modified = "2025-05-01T12:34:56.000Z";
  a.pipeline_tag = "text-generation";
  a.gated = "Gated (auto)";
  a.is_private = true;

  for (int i (0); i != 12; ++i)
    a.tags.push_back ("t" + to_string (i));

  hf_model_summary b;
  b.id = "loner";
  b.author = "someone";

  ostringstream o;
  print_model_search (o, "qwen", {a, b});

  string s (o.str ());

  assert (s.find ("Top 2 model results for \"qwen\" (sorted by downloads):") !=
          string::npos);
  assert (s.find (string (80, '=')) != string::npos);
  assert (s.find (" 1. Model ID: Qwen/Qwen3-4B-GGUF\n") != string::npos);
  assert (s.find ("    Author: Qwen\n") != string::npos);
  assert (s.find ("| Updated: 2025-05-01\n") != string::npos);
  assert (s.find ("    Task: text-generation (Private, Gated (auto))\n") !=
          string::npos);

  // At most ten tags.
  //
  assert (s.find ("t9\n") != string::npos);
  assert (s.find ("t10") == string::npos);

  assert (s.find (" 2. Model ID: loner\n") != string::npos);
  assert (s.find ("    Author: someone\n") != string::npos);
  assert (s.find ("    Task: N/A\n") != string::npos);
}

int
main ()
{
  test_print ();

  cout << "all search tests passed" << endl;
}
