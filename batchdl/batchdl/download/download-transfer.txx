#include <fstream>
#include <iostream>
#include <system_error>

#include <boost/system/system_error.hpp>

#include <batchdl/diagnostics.hxx>

namespace batchdl
{
  namespace detail
  {
    // Size of the local file, 0 if it does not exist.
    //
    inline std::uint64_t
    local_size (const fs::path& p)
    {
      std::error_code ec;

      if (!fs::exists (p, ec))
        return 0;

      std::uintmax_t n (fs::file_size (p, ec));

      if (ec)
        throw download_failure (failure_kind::io,
                                "unable to stat '" + p.string () + "': " +
                                ec.message ());

      return static_cast<std::uint64_t> (n);
    }
  }

  template <typename C>
  asio::awaitable<void>
  transfer (C& client,
            download_task& task,
            progress_counter& entry,
            progress_counter& overall,
            transfer_warning warn)
  {
    using response_type = typename C::response_type;
    using request_type = typename C::request_type;

    const fs::path& p (task.target);
    const std::string& url (task.item.url);

    task.state.store (download_state::downloading);

    // Destination directory.
    //
    if (p.has_parent_path ())
    {
      std::error_code ec;
      fs::create_directories (p.parent_path (), ec);

      if (ec)
        throw download_failure (failure_kind::directory,
                                "unable to create directory '" +
                                p.parent_path ().string () + "': " +
                                ec.message ());
    }

    std::uint64_t l (detail::local_size (p));
    std::uint64_t t (task.expected_size);

    // Already complete. Nothing was counted for this task yet, so the whole
    // size goes to the overall counter.
    //
    if (t > 0 && l >= t)
    {
      trace (trace_level::info,
             "skipping " + p.string () + ", already complete");

      entry.set_length (t);
      entry.advance_to (t);
      overall.add (t);

      task.state.store (download_state::completed);
      co_return;
    }

    request_type req (http_method::get, url);

    if (l > 0)
    {
      trace (trace_level::debug,
             "resuming " + p.string () + " from byte " + std::to_string (l));
      req.set_range_from (l);
    }

    std::ofstream out;
    bool accepted (false); // Local file re-validated as complete.

    // A task of unknown size contributed nothing to the overall length, so
    // it extends it by whatever it learns: the reported length or, failing
    // that, the bytes it has.
    //
    std::uint64_t counted (0); // Contributed to the overall length.
    std::uint64_t have (0);    // Of this task in the overall position.

    auto extend = [&] (std::uint64_t n)
    {
      if (t == 0 && n > counted)
      {
        overall.grow_length (n - counted);
        counted = n;
      }
    };

    auto on_head = [&] (const response_type& r)
    {
      if (r.is_partial ())
      {
        auto cr (r.range ());

        if (!cr || !cr->first || *cr->first != l)
          throw download_failure (failure_kind::range,
                                  "server resumed at unexpected offset");

        out.open (p, std::ios::binary | std::ios::app);

        if (!out)
          throw download_failure (failure_kind::io,
                                  "unable to open '" + p.string () + "'");

        if (t == 0)
        {
          if (cr->complete)
          {
            entry.set_length (*cr->complete);
            extend (*cr->complete);
          }
          else if (auto n = r.content_length ())
          {
            entry.set_length (l + *n);
            extend (l + *n);
          }
        }

        // The bytes on disk are kept, so they count now.
        //
        extend (l);
        entry.advance_to (l);
        overall.add (l);
        have = l;
      }
      else if (r.is_success ())
      {
        if (l > 0)
        {
          std::string m ("server does not support resume for " + url +
                         "; starting from beginning");

          trace (trace_level::warning, m);

          if (warn)
            warn (m);
          else
            std::cerr << "warning: " << m << std::endl;
        }

        out.open (p, std::ios::binary | std::ios::trunc);

        if (!out)
          throw download_failure (failure_kind::io,
                                  "unable to open '" + p.string () + "'");

        if (t == 0)
        {
          if (auto n = r.content_length ())
          {
            entry.set_length (*n);
            extend (*n);
          }
        }
      }
      else if (r.status == http_status::range_not_satisfiable && l > 0)
      {
        // Only reachable with an unknown size (a known one would have taken
        // the shortcut above). The server tells us its size, and if that is
        // what we have, we have it all.
        //
        auto cr (r.range ());

        if (t == 0 && cr && !cr->first && cr->complete && *cr->complete == l)
        {
          accepted = true;

          extend (l);
          entry.set_length (l);
          entry.advance_to (l);
          overall.add (l);
          return;
        }

        throw download_failure (failure_kind::range,
                                "server rejected resume at byte " +
                                std::to_string (l));
      }
      else
        throw download_failure (failure_kind::http_status,
                                "server returned " + to_string (r.status));
    };

    auto on_chunk = [&] (const char* d, std::size_t n)
    {
      // Body of a 416 we accepted.
      //
      if (!out.is_open ())
        return;

      out.write (d, static_cast<std::streamsize> (n));

      if (!out)
        throw download_failure (failure_kind::io,
                                "unable to write to '" + p.string () + "'");

      have += n;
      extend (have);

      entry.add (n);
      overall.add (n);
      task.downloaded_bytes.fetch_add (n);
    };

    try
    {
      co_await client.stream (std::move (req), on_head, on_chunk);
    }
    catch (const download_failure&)
    {
      throw;
    }
    catch (const boost::system::system_error& e)
    {
      throw download_failure (failure_kind::transport, e.what ());
    }

    if (out.is_open ())
    {
      out.close ();

      if (!out)
        throw download_failure (failure_kind::io,
                                "unable to write to '" + p.string () + "'");
    }

    if (!accepted)
    {
      std::uint64_t f (detail::local_size (p));

      if (t > 0 && f < t)
        throw download_failure (failure_kind::incomplete,
                                "incomplete transfer: expected " +
                                std::to_string (t) + " bytes, got " +
                                std::to_string (f));

      trace (trace_level::info,
             "downloaded " + p.string () + " (" + std::to_string (f) +
             " bytes)");
    }

    task.state.store (download_state::completed);
  }
}
