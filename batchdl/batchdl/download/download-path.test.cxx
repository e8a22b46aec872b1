#include <batchdl/download/download-path.hxx>

#include <cassert>
#include <iostream>

using namespace std;
using namespace batchdl;

static void
check (const string& url, const optional<string>& pref, const string& e,
       bool warned = false)
{
  resolved_name r (resolve_filename (url, pref));

  assert (r.name == e);
  assert (r.warnings.empty () != warned);
}

static void
test_preferred ()
{
  check ("https://x.org/a/b.bin", string ("model.gguf"), "model.gguf");
  check ("https://x.org/a/b.bin", string ("sub/./model.gguf"), "sub/model.gguf");
  check ("https://x.org/a/b.bin", string ("sub/x/../model.gguf"),
         "sub/model.gguf");
  check ("https://x.org/a/b.bin", string ("dir/"), "dir");
}

// Never anything that leaves the destination directory.
//
static void
test_traversal ()
{
  check ("https://x.org/f", string ("../../etc/passwd"), "passwd", true);
  check ("https://x.org/f", string ("/etc/passwd"), "passwd", true);
  check ("https://x.org/f", string ("a/../../b.txt"), "b.txt", true);

  // Nothing left of it at all.
  //
  resolved_name r (resolve_filename ("https://x.org/f", string ("..")));
  assert (r.name.compare (0, 9, "download_") == 0);
  assert (r.name.find ('/') == string::npos);
  assert (r.warnings.size () == 2);
}

static void
test_url ()
{
  check ("https://x.org/path/to/file.tar.gz", nullopt, "file.tar.gz");
  check ("https://x.org/file.bin?download=true", nullopt, "file.bin");
  check ("https://x.org/file.bin#frag", nullopt, "file.bin");
  check ("http://x.org:8080/a/b", nullopt, "b");
  check ("file.bin", nullopt, "file.bin");
}

static void
test_fallback ()
{
  for (const char* u: {"https://x.org/", "https://x.org", "https://x.org/d/"})
  {
    resolved_name r (resolve_filename (u, nullopt));

    assert (r.name.compare (0, 9, "download_") == 0);
    assert (r.name.size () > 14);
    assert (r.name.substr (r.name.size () - 5) == ".file");
    assert (r.warnings.size () == 1);
  }
}

static void
test_sanitize ()
{
  assert (sanitize_filename ("a/b\\c:d*e?f\"g<h>i|j") ==
          "a_b_c_d_e_f_g_h_i_j");
  assert (sanitize_filename ("plain-name_1.0") == "plain-name_1.0");

  assert (repo_id_to_safe_path ("unsloth/Qwen3-8B-GGUF") ==
          "unsloth_Qwen3-8B-GGUF");
  assert (repo_id_to_safe_path ("https://huggingface.co/Qwen/Qwen3-4B") ==
          "Qwen_Qwen3-4B");
  assert (repo_id_to_safe_path ("gpt2") == "hf_gpt2");
}

int
main ()
{
  test_preferred ();
  test_traversal ();
  test_url ();
  test_fallback ();
  test_sanitize ();

  cout << "all path tests passed" << endl;
}
