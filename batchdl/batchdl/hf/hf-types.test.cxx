#include <batchdl/hf/hf-types.hxx>
#include <batchdl/hf/hf-endpoint.hxx>

#include <cassert>
#include <iostream>
#include <stdexcept>

using namespace std;
using namespace batchdl;

static void
test_endpoint ()
{
  assert (hf_endpoint::normalize_repo_id ("https://huggingface.co/Qwen/Qwen3-8B/")
          == "Qwen/Qwen3-8B");
  assert (hf_endpoint::normalize_repo_id ("Qwen/Qwen3-8B") == "Qwen/Qwen3-8B");

  assert (hf_endpoint::model_info ("a/b") ==
          "https://huggingface.co/api/models/a/b");

  // Separators between segments stay, everything else reserved is encoded.
  //
  assert (hf_endpoint::resolve ("a/b", "dir/my file+1.gguf") ==
          "https://huggingface.co/a/b/resolve/main/dir/my%20file%2B1.gguf"
          "?download=true");

  assert (hf_endpoint::search ("llama 3") ==
          "https://huggingface.co/api/models?search=llama%203"
          "&sort=downloads&direction=-1&limit=20&full=true");

  assert (hf_endpoint::url_encode ("A-z_0.9~") == "A-z_0.9~");
  assert (hf_endpoint::url_encode ("/?&=") == "%2F%3F%26%3D");
}

static void
test_repository_files ()
{
  json::value jv (json::parse (R"({
    "id": "o/r",
    "siblings": [
      {"rfilename": "README.md"},
      {"rfilename": "q/model-00001-of-00002.gguf"},
      {"other": 1}
    ]
  })"));

  auto fs (hf_api_traits::parse_repository_files (jv, "o/r"));

  assert (fs.size () == 2);
  assert (fs[0].filename == "README.md");
  assert (fs[0].url ==
          "https://huggingface.co/o/r/resolve/main/README.md?download=true");
  assert (fs[1].filename == "q/model-00001-of-00002.gguf");
  assert (fs[1].url == "https://huggingface.co/o/r/resolve/main/q/"
                       "model-00001-of-00002.gguf?download=true");

  bool thrown (false);
  try
  {
    hf_api_traits::parse_repository_files (json::parse (R"({"id":"x"})"), "x");
  }
  catch (const runtime_error&)
  {
    thrown = true;
  }
  assert (thrown);
}

static void
test_models ()
{
  json::value jv (json::parse (R"([
    {"id": "org/a", "author": "org", "downloads": 1234567, "likes": 42,
     "lastModified": "2024-05-06T07:08:09.000Z",
     "tags": ["gguf", "text-generation"], "pipeline_tag": "text-generation",
     "private": false, "gated": false},
    {"modelId": "solo/b", "downloads": 3, "private": true, "gated": "manual",
     "lastModified": "2023-01-02T00:00:00.000Z"},
    {"id": "c/d", "gated": true, "pipeline_tag": null}
  ])"));

  auto ms (hf_api_traits::parse_models (jv));
  assert (ms.size () == 3);

  assert (ms[0].id == "org/a");
  assert (ms[0].owner () == "org");
  assert (ms[0].downloads == 1234567 && ms[0].likes == 42);
  assert (ms[0].updated () == "2024-05-06");
  assert (ms[0].tags.size () == 2);
  assert (ms[0].pipeline_tag && *ms[0].pipeline_tag == "text-generation");
  assert (!ms[0].is_private && ms[0].gated.empty ());

  assert (ms[1].id == "solo/b");
  assert (ms[1].owner () == "solo");
  assert (ms[1].is_private);
  assert (ms[1].gated == "Gated (manual)");

  assert (ms[2].gated == "Gated");
  assert (!ms[2].pipeline_tag);
}

int
main ()
{
  test_endpoint ();
  test_repository_files ();
  test_models ();

  cout << "all hf tests passed" << endl;
}
