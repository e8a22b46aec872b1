#include <batchdl/selection/series-classifier.hxx>

#include <cassert>
#include <iostream>

using namespace std;
using namespace batchdl;

static remote_file
rf (const string& n)
{
  return remote_file {"https://example.org/r/" + n, n};
}

static void
test_parse_name ()
{
  auto p (parse_series_name ("Qwen3-8B-Q4_K_M-00002-of-00005.gguf"));
  assert (p);
  assert (p->base == "Qwen3-8B-Q4_K_M");
  assert (p->index == 2);
  assert (p->total == 5);

  // Base is matched lazily: the last -NNNNN-of-MMMMM is the index.
  //
  p = parse_series_name ("a-00001-of-00002-00001-of-00003.gguf");
  assert (p && p->base == "a-00001-of-00002" && p->total == 3);

  assert (!parse_series_name ("model.gguf"));
  assert (!parse_series_name ("model-0001-of-0003.gguf"));   // Four digits.
  assert (!parse_series_name ("model-00001-of-00003.bin"));
  assert (!parse_series_name ("model-00001-of-00003.gguf.part"));
}

// Two of three parts are an incomplete series; the third completes it.
//
static void
test_completeness ()
{
  vector<remote_file> fs {rf ("model-00001-of-00003.gguf"),
                          rf ("model-00002-of-00003.gguf")};

  size_map sz {{fs[0].url, 1000}, {fs[1].url, 2000}};

  auto es (classify_files (fs, sz));
  assert (es.size () == 1);
  assert (es[0].series ());
  assert (!es[0].complete ());
  assert (es[0].label () ==
          "Series: model (2 parts, 3.00 KB) (INCOMPLETE: 2/3 parts)");

  fs.push_back (rf ("model-00003-of-00003.gguf"));
  sz[fs[2].url] = 500;

  es = classify_files (fs, sz);
  assert (es.size () == 1);
  assert (es[0].complete ());
  assert (es[0].label () == "Series: model (3 parts, 3.50 KB)");

  auto files (es[0].files ());
  assert (files.size () == 3);
  assert (files[0].filename == "model-00001-of-00003.gguf");
  assert (files[2].filename == "model-00003-of-00003.gguf");
}

// A series that declares a different total is a different series, and a
// declared total of zero is never complete.
//
static void
test_grouping ()
{
  vector<remote_file> fs {rf ("m-00001-of-00002.gguf"),
                          rf ("m-00002-of-00002.gguf"),
                          rf ("m-00001-of-00003.gguf"),
                          rf ("z-00000-of-00000.gguf"),
                          rf ("solo.gguf")};

  auto es (classify_files (fs, size_map ()));
  assert (es.size () == 4);

  // Ordered by label: "File: ..." before "Series: ...".
  //
  assert (es[0].label () == "File: solo.gguf (0 B)");
  assert (es[0].complete ());
  assert (es[1].label () == "Series: m (1 parts, 0 B) (INCOMPLETE: 1/3 parts)");
  assert (es[2].label () == "Series: m (2 parts, 0 B)");
  assert (es[2].complete ());
  assert (!es[3].complete ());

  for (size_t i (1); i < es.size (); ++i)
    assert (es[i - 1].label () < es[i].label ());
}

static void
test_filter ()
{
  auto fs (filter_gguf ({rf ("a.gguf"),
                         rf ("b.GGUF"),
                         rf ("README.md"),
                         rf ("gguf"),
                         rf ("dir/c.Gguf")}));

  assert (fs.size () == 3);
  assert (fs[0].filename == "a.gguf");
  assert (fs[1].filename == "b.GGUF");
  assert (fs[2].filename == "dir/c.Gguf");
}

int
main ()
{
  test_parse_name ();
  test_completeness ();
  test_grouping ();
  test_filter ();

  cout << "all classifier tests passed" << endl;
}
