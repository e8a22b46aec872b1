#pragma once

#include <string>
#include <cstdint>
#include <utility>
#include <ostream>
#include <optional>
#include <stdexcept>
#include <filesystem>
#include <unordered_map>

namespace batchdl
{
  namespace fs = std::filesystem;

  enum class download_state
  {
    pending,     // Not started yet
    downloading, // Transfer in progress
    completed,   // Successfully completed
    failed       // Failed with error
  };

  inline std::ostream&
  operator<< (std::ostream& os, download_state s)
  {
    switch (s)
    {
    case download_state::pending:     return os << "pending";
    case download_state::downloading: return os << "downloading";
    case download_state::completed:   return os << "completed";
    case download_state::failed:      return os << "failed";
    }
    return os;
  }

  // One file to download: where from and, optionally, what to call it.
  //
  struct download_item
  {
    std::string url;
    std::optional<std::string> preferred_name;

    download_item () = default;

    explicit
    download_item (std::string u, std::optional<std::string> n = std::nullopt)
      : url (std::move (u)), preferred_name (std::move (n)) {}
  };

  // File of a remote repository: its download URL and its path within the
  // repository.
  //
  struct remote_file
  {
    std::string url;
    std::string filename;
  };

  // URL to discovered size in bytes (0 = unknown).
  //
  using size_map = std::unordered_map<std::string, std::uint64_t>;

  enum class failure_kind
  {
    directory,   // Destination directory could not be created.
    transport,   // Connection, TLS, or stream failure (including timeouts).
    http_status, // Unexpected response status.
    range,       // Partial content that does not continue the local file.
    incomplete,  // Stream ended before the known size was reached.
    io           // Local file could not be opened or written.
  };

  inline std::ostream&
  operator<< (std::ostream& os, failure_kind k)
  {
    switch (k)
    {
    case failure_kind::directory:   return os << "directory";
    case failure_kind::transport:   return os << "transport";
    case failure_kind::http_status: return os << "http status";
    case failure_kind::range:       return os << "range";
    case failure_kind::incomplete:  return os << "incomplete";
    case failure_kind::io:          return os << "io";
    }
    return os;
  }

  // Failure of a single transfer.
  //
  class download_failure: public std::runtime_error
  {
  public:
    download_failure (failure_kind k, const std::string& what)
      : std::runtime_error (what), kind_ (k) {}

    failure_kind
    kind () const noexcept
    {
      return kind_;
    }

  private:
    failure_kind kind_;
  };

  // Download error information, as recorded on a failed task.
  //
  struct download_error
  {
    std::string message;
    std::string url;
    std::optional<failure_kind> kind; // Absent for foreign exceptions.

    download_error () = default;

    download_error (std::string msg,
                    std::string u = "",
                    std::optional<failure_kind> k = std::nullopt)
      : message (std::move (msg)),
        url (std::move (u)),
        kind (k)
    {
    }

    bool
    empty () const
    {
      return message.empty ();
    }
  };

  inline std::ostream&
  operator<< (std::ostream& os, const download_error& e)
  {
    os << e.message;
    if (!e.url.empty ())
      os << " [url: " << e.url << "]";
    return os;
  }
}
