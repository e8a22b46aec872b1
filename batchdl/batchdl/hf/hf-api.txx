#include <stdexcept>

#include <batchdl/diagnostics.hxx>

namespace batchdl
{
  template <typename T>
  asio::awaitable<std::vector<typename hf_api<T>::file_type>> hf_api<T>::
  repository_files (const std::string& repo)
  {
    std::string id (hf_endpoint::normalize_repo_id (repo));

    if (id.empty ())
      throw std::invalid_argument ("empty repository id");

    std::string u (hf_endpoint::model_info (id));
    trace (trace_level::debug, "fetching repository info from " + u);

    json::value jv (co_await client_.get_json (u));
    auto r (traits_type::parse_repository_files (jv, id));

    trace (trace_level::debug,
           "found " + std::to_string (r.size ()) + " file(s) in " + id);

    co_return r;
  }

  template <typename T>
  asio::awaitable<std::vector<typename hf_api<T>::model_type>> hf_api<T>::
  search_models (const std::string& q)
  {
    std::string u (hf_endpoint::search (q));
    trace (trace_level::debug, "searching models: " + u);

    json::value jv (co_await client_.get_json (u));
    co_return traits_type::parse_models (jv);
  }
}
