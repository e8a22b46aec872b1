#pragma once

#include <string>
#include <cstdio>

namespace batchdl
{
  // Hugging Face endpoint builder.
  //
  class hf_endpoint
  {
  public:
    static constexpr const char* site = "https://huggingface.co";

    // Strip an optional site prefix from a repository id.
    //
    static std::string
    normalize_repo_id (std::string id)
    {
      for (const char* p: {"https://huggingface.co/", "http://huggingface.co/"})
      {
        std::string x (p);
        if (id.compare (0, x.size (), x) == 0)
          id.erase (0, x.size ());
      }

      while (!id.empty () && id.back () == '/')
        id.pop_back ();

      return id;
    }

    // Repository metadata, including the file listing.
    //
    static std::string
    model_info (const std::string& repo)
    {
      return std::string (site) + "/api/models/" + repo;
    }

    // Download URL of a file of the main branch. Each path segment is
    // percent-encoded.
    //
    static std::string
    resolve (const std::string& repo, const std::string& path)
    {
      std::string r (std::string (site) + '/' + repo + "/resolve/main/");

      for (std::size_t b (0);;)
      {
        std::size_t e (path.find ('/', b));
        r += url_encode (path.substr (b, e == std::string::npos
                                         ? std::string::npos
                                         : e - b));
        if (e == std::string::npos)
          break;

        r += '/';
        b = e + 1;
      }

      return r + "?download=true";
    }

    // Model search, most downloaded first.
    //
    static std::string
    search (const std::string& query, std::size_t limit = 20)
    {
      return std::string (site) + "/api/models?search=" + url_encode (query) +
             "&sort=downloads&direction=-1&limit=" + std::to_string (limit) +
             "&full=true";
    }

    // Percent-encode everything except the RFC 3986 unreserved characters.
    //
    static std::string
    url_encode (const std::string& s)
    {
      std::string r;
      r.reserve (s.size ());

      for (unsigned char c: s)
      {
        if ((c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
            (c >= '0' && c <= '9') ||
            c == '-' || c == '_' || c == '.' || c == '~')
          r += static_cast<char> (c);
        else
        {
          char b[4];
          std::snprintf (b, sizeof (b), "%%%02X", c);
          r += b;
        }
      }

      return r;
    }
  };
}
