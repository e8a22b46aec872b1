#pragma once

#include <map>
#include <string>
#include <vector>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <charconv>
#include <algorithm>

#include <boost/asio.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

// Loopback HTTP server for the transfer tests.
//
// Runs on the same io_context as the code under test, serves in-memory
// content, and records what it was asked. Every connection carries a single
// exchange and is then closed, which is also how the client behaves.
//
namespace batchdl
{
  namespace test
  {
    namespace asio  = boost::asio;
    namespace beast = boost::beast;
    namespace http  = beast::http;

    using tcp = asio::ip::tcp;

    struct served_file
    {
      std::string content;

      // Honor "Range: bytes=N-" with 206 (or 416 past the end). Otherwise
      // the full content is sent with 200.
      //
      bool ranges = true;

      // Answer HEAD. Otherwise HEAD gets 405.
      //
      bool head = true;

      // Send Content-Length. Otherwise GET bodies are chunked and HEAD has
      // no length.
      //
      bool length = true;

      // Cut the GET body to this many bytes (Content-Length matches the cut
      // body, so the exchange itself is well-formed).
      //
      std::optional<std::size_t> truncate;

      // Wait this long before answering a GET.
      //
      std::chrono::milliseconds delay {0};

      // Wait this long between the GET response head and its body.
      //
      std::chrono::milliseconds stall {0};

      // Reply with this status and an empty body instead of the content.
      //
      unsigned status = 200;

      // Claim this first byte in the Content-Range of a 206. The body still
      // starts at the requested offset.
      //
      std::optional<std::uint64_t> range_start;

      // Claim this complete length in the "bytes */N" of a 416.
      //
      std::optional<std::uint64_t> range_total;
    };

    struct recorded_request
    {
      http::verb  method;
      std::string target;
      std::string range;
      std::string authorization;
      std::string user_agent;
    };

    class http_test_server
    {
    public:
      explicit
      http_test_server (asio::io_context& ioc)
        : ioc_ (ioc),
          acceptor_ (ioc, tcp::endpoint (asio::ip::make_address ("127.0.0.1"),
                                         0))
      {
        asio::co_spawn (ioc_, accept_loop (), asio::detached);
      }

      http_test_server (const http_test_server&) = delete;
      http_test_server& operator= (const http_test_server&) = delete;

      // The host may be any name that resolves to the loopback address, so
      // that two URLs can reach us under different hosts.
      //
      std::string
      url (const std::string& path,
           const std::string& host = "127.0.0.1") const
      {
        return "http://" + host + ':' +
               std::to_string (acceptor_.local_endpoint ().port ()) + path;
      }

      void
      serve (const std::string& path, served_file f)
      {
        files_[path] = std::move (f);
      }

      void
      redirect (const std::string& from, const std::string& location)
      {
        redirects_[from] = location;
      }

      // Stop accepting. Connections in progress run to completion, after
      // which the io_context runs out of work.
      //
      void
      stop ()
      {
        beast::error_code ec;
        acceptor_.close (ec);
      }

      const std::vector<recorded_request>&
      requests () const noexcept
      {
        return requests_;
      }

      std::size_t
      count (http::verb m, const std::string& target) const
      {
        return static_cast<std::size_t> (
          std::count_if (requests_.begin (), requests_.end (),
                         [&] (const recorded_request& r)
          {
            return r.method == m && r.target == target;
          }));
      }

      std::size_t
      count (const std::string& target) const
      {
        return static_cast<std::size_t> (
          std::count_if (requests_.begin (), requests_.end (),
                         [&] (const recorded_request& r)
          {
            return r.target == target;
          }));
      }

      // Highest number of GET exchanges observed in flight at once.
      //
      std::size_t
      peak_concurrency () const noexcept
      {
        return peak_;
      }

    private:
      asio::awaitable<void>
      accept_loop ()
      {
        for (;;)
        {
          beast::error_code ec;
          tcp::socket s (
            co_await acceptor_.async_accept (
              asio::redirect_error (asio::use_awaitable, ec)));

          if (ec)
            co_return; // Closed by stop().

          asio::co_spawn (ioc_, session (std::move (s)), asio::detached);
        }
      }

      asio::awaitable<void>
      session (tcp::socket sock)
      {
        beast::tcp_stream s (std::move (sock));

        // The client may legitimately hang up early: a probe reads the head
        // only and a timed out transfer abandons the body.
        //
        try
        {
          beast::flat_buffer b;
          http::request<http::string_body> req;
          co_await http::async_read (s, b, req, asio::use_awaitable);

          co_await respond (s, req);
        }
        catch (const boost::system::system_error&)
        {
        }

        beast::error_code ec;
        s.socket ().shutdown (tcp::socket::shutdown_send, ec);
      }

      struct active_guard
      {
        std::size_t& active;

        active_guard (std::size_t& a, std::size_t& peak)
          : active (a)
        {
          peak = std::max (peak, ++active);
        }

        ~active_guard ()
        {
          --active;
        }
      };

      asio::awaitable<void>
      respond (beast::tcp_stream& s, const http::request<http::string_body>& req)
      {
        std::string target (req.target ());

        requests_.push_back (
          recorded_request {req.method (),
                            target,
                            std::string (req[http::field::range]),
                            std::string (req[http::field::authorization]),
                            std::string (req[http::field::user_agent])});

        if (auto i (redirects_.find (target)); i != redirects_.end ())
        {
          http::response<http::string_body> res (http::status::found, 11);
          res.set (http::field::location, i->second);
          res.keep_alive (false);
          res.prepare_payload ();
          co_await http::async_write (s, res, asio::use_awaitable);
          co_return;
        }

        auto i (files_.find (target));

        if (i == files_.end () || i->second.status != 200)
        {
          unsigned st (i == files_.end () ? 404 : i->second.status);

          http::response<http::string_body> res (
            static_cast<http::status> (st), 11);
          res.keep_alive (false);
          res.prepare_payload ();
          co_await http::async_write (s, res, asio::use_awaitable);
          co_return;
        }

        const served_file& f (i->second);

        if (req.method () == http::verb::head)
        {
          http::response<http::empty_body> res (
            f.head ? http::status::ok : http::status::method_not_allowed, 11);
          res.keep_alive (false);

          if (f.head && f.length)
            res.set (http::field::content_length,
                     std::to_string (f.content.size ()));

          // Without a Content-Length the head of a 200 would promise a body
          // until EOF.
          //
          if (!f.head || !f.length)
            res.set (http::field::content_length, "0");

          http::response_serializer<http::empty_body> sr (res);
          co_await http::async_write_header (s, sr, asio::use_awaitable);
          co_return;
        }

        active_guard g (active_, peak_);

        if (f.delay.count () != 0)
        {
          asio::steady_timer t (ioc_, f.delay);
          co_await t.async_wait (asio::use_awaitable);
        }

        http::response<http::string_body> res (http::status::ok, 11);
        res.keep_alive (false);
        res.body () = f.content;

        std::optional<std::uint64_t> from (parse_range (req));

        if (f.ranges && from)
        {
          std::uint64_t n (f.content.size ());

          if (*from >= n)
          {
            res.result (http::status::range_not_satisfiable);
            res.set (http::field::content_range,
                     "bytes */" + std::to_string (f.range_total
                                                  ? *f.range_total
                                                  : n));
            res.body ().clear ();
          }
          else
          {
            res.result (http::status::partial_content);
            res.set (http::field::content_range,
                     "bytes " +
                     std::to_string (f.range_start ? *f.range_start : *from) +
                     '-' +
                     std::to_string (n - 1) + '/' + std::to_string (n));
            res.body () = f.content.substr (*from);
          }
        }

        if (f.truncate && *f.truncate < res.body ().size ())
          res.body ().resize (*f.truncate);

        if (f.length)
          res.prepare_payload ();
        else
          res.chunked (true);

        http::response_serializer<http::string_body> sr (res);
        co_await http::async_write_header (s, sr, asio::use_awaitable);

        if (f.stall.count () != 0)
        {
          asio::steady_timer t (ioc_, f.stall);
          co_await t.async_wait (asio::use_awaitable);
        }

        co_await http::async_write (s, sr, asio::use_awaitable);
      }

      static std::optional<std::uint64_t>
      parse_range (const http::request<http::string_body>& req)
      {
        std::string v (req[http::field::range]);

        if (v.compare (0, 6, "bytes=") != 0 || v.back () != '-')
          return std::nullopt;

        std::uint64_t n (0);
        const char* b (v.data () + 6);
        const char* e (v.data () + v.size () - 1);
        auto r (std::from_chars (b, e, n));

        if (r.ec != std::errc () || r.ptr != e)
          return std::nullopt;

        return n;
      }

    private:
      asio::io_context& ioc_;
      tcp::acceptor acceptor_;

      std::map<std::string, served_file> files_;
      std::map<std::string, std::string> redirects_;

      std::vector<recorded_request> requests_;

      std::size_t active_ = 0;
      std::size_t peak_ = 0;
    };
  }
}
