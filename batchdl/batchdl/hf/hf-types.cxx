#include <batchdl/hf/hf-types.hxx>

#include <cctype>
#include <stdexcept>
#include <algorithm>

#include <batchdl/hf/hf-endpoint.hxx>

using namespace std;

namespace batchdl
{
  string hf_model_summary::
  owner () const
  {
    if (author && !author->empty ())
      return *author;

    return id.substr (0, id.find ('/'));
  }

  string hf_model_summary::
  updated () const
  {
    return last_modified.substr (0, 10);
  }

  vector<hf_api_traits::file_type> hf_api_traits::
  parse_repository_files (const json::value& jv, const string& repo)
  {
    vector<file_type> r;

    if (!jv.is_object ())
      throw runtime_error ("invalid model info: expected object");

    const auto& obj (jv.as_object ());

    if (!obj.contains ("siblings") || !obj.at ("siblings").is_array ())
      throw runtime_error ("invalid model info: no file listing");

    for (const auto& s: obj.at ("siblings").as_array ())
    {
      if (!s.is_object ())
        continue;

      const auto& so (s.as_object ());

      if (!so.contains ("rfilename"))
        continue;

      string n (json::value_to<string> (so.at ("rfilename")));
      r.push_back (file_type {hf_endpoint::resolve (repo, n), n});
    }

    return r;
  }

  hf_api_traits::model_type hf_api_traits::
  parse_model (const json::value& jv)
  {
    model_type m;

    if (!jv.is_object ())
      return m;

    const auto& obj (jv.as_object ());

    // Search results carry both; older payloads only modelId.
    //
    if (obj.contains ("id"))
      m.id = json::value_to<string> (obj.at ("id"));
    else if (obj.contains ("modelId"))
      m.id = json::value_to<string> (obj.at ("modelId"));

    if (obj.contains ("author") && obj.at ("author").is_string ())
      m.author = json::value_to<string> (obj.at ("author"));

    if (obj.contains ("downloads") && obj.at ("downloads").is_number ())
      m.downloads = json::value_to<uint64_t> (obj.at ("downloads"));

    if (obj.contains ("likes") && obj.at ("likes").is_number ())
      m.likes = json::value_to<uint64_t> (obj.at ("likes"));

    if (obj.contains ("lastModified") && obj.at ("lastModified").is_string ())
      m.last_modified = json::value_to<string> (obj.at ("lastModified"));

    if (obj.contains ("tags") && obj.at ("tags").is_array ())
    {
      for (const auto& t: obj.at ("tags").as_array ())
        if (t.is_string ())
          m.tags.push_back (json::value_to<string> (t));
    }

    if (obj.contains ("pipeline_tag") && obj.at ("pipeline_tag").is_string ())
      m.pipeline_tag = json::value_to<string> (obj.at ("pipeline_tag"));

    if (obj.contains ("private") && obj.at ("private").is_bool ())
      m.is_private = obj.at ("private").as_bool ();

    // Either a boolean or the gating mode.
    //
    if (obj.contains ("gated"))
    {
      const json::value& g (obj.at ("gated"));

      if (g.is_bool () && g.as_bool ())
        m.gated = "Gated";
      else if (g.is_string ())
      {
        string s (json::value_to<string> (g));
        transform (s.begin (), s.end (), s.begin (),
                   [] (unsigned char c) {return tolower (c);});

        if (s == "auto")
          m.gated = "Gated (auto)";
        else if (s == "manual")
          m.gated = "Gated (manual)";
      }
    }

    return m;
  }

  vector<hf_api_traits::model_type> hf_api_traits::
  parse_models (const json::value& jv)
  {
    vector<model_type> r;

    if (!jv.is_array ())
      throw runtime_error ("invalid search results: expected array");

    for (const auto& m: jv.as_array ())
      r.push_back (parse_model (m));

    return r;
  }
}
