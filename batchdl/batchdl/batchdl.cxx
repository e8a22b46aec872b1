#include <memory>
#include <string>
#include <vector>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <filesystem>

#include <unistd.h>

#include <boost/asio.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>

#include <batchdl/diagnostics.hxx>
#include <batchdl/batchdl-options.hxx>
#include <batchdl/batchdl-source.hxx>
#include <batchdl/batchdl-search.hxx>
#include <batchdl/batchdl-select.hxx>
#include <batchdl/batchdl-download.hxx>
#include <batchdl/batchdl-progress.hxx>

#include <batchdl/http/http.hxx>
#include <batchdl/hf/hf-api.hxx>
#include <batchdl/download/download-path.hxx>

#include <batchdl/version.hxx>

using namespace std;
namespace fs = filesystem;
namespace asio = boost::asio;

namespace batchdl
{
  // Aggregates the settings derived from the command line and the
  // environment, so we can pass them around as a single unit.
  //
  struct runtime_context
  {
    source_request  source;
    source_kind     kind;
    fs::path        output_root;
    size_t          concurrency;
    bool            select;
    bool            render;
    string          token;
    uint32_t        read_timeout; // Seconds, 0 = none.
  };

  static http_client_traits<>
  client_traits (const runtime_context& ctx)
  {
    http_client_traits<> r;
    r.read_timeout = timeout_milliseconds (ctx.read_timeout);
    r.bearer_token = ctx.token;
    return r;
  }

  // Main controller of a download run.
  //
  class batchdl_controller
  {
  public:
    batchdl_controller (asio::io_context& ioc, runtime_context ctx)
      : ioc_ (ioc),
        ctx_ (move (ctx)),
        http_ (ioc_, client_traits (ctx_)),
        progress_ (ioc_)
    {
    }

    asio::awaitable<int>
    run ()
    {
      fs::path dir (ctx_.output_root);
      vector<download_item> items (co_await collect_items (dir));

      if (items.empty ())
      {
        progress_.info ("no files to download");
        co_return 0;
      }

      vector<planned_download> ps (
        plan_downloads (items,
                        dir,
                        [this] (const string& m) {progress_.warning (m);}));

      error_code ec;
      fs::create_directories (dir, ec);

      if (ec)
        throw runtime_error ("unable to create directory '" + dir.string () +
                             "': " + ec.message ());

      download_coordinator dc (http_, progress_, ctx_.concurrency);

      for (planned_download& p: ps)
        dc.queue_download (move (p));

      size_t failed (co_await dc.execute_all (dir, ctx_.render));

      co_return failed != 0 ? 1 : 0;
    }

  private:
    // Gather the items of the selected source and adjust the destination
    // directory to it.
    //
    asio::awaitable<vector<download_item>>
    collect_items (fs::path& dir)
    {
      vector<download_item> r;

      switch (ctx_.kind)
      {
      case source_kind::model:
        {
          r.push_back (resolve_model_alias (*ctx_.source.model));
          dir /= sanitize_filename (*ctx_.source.model);
          break;
        }
      case source_kind::repository:
        {
          const string& repo (*ctx_.source.repository);

          progress_.info ("fetching file list from Hugging Face repository: " +
                          repo);

          hf_api<> api (http_);
          vector<remote_file> files (co_await api.repository_files (repo));

          if (files.empty ())
          {
            progress_.info ("no files found in the repository");
            break;
          }

          if (ctx_.select)
            files = co_await select_gguf_files (http_,
                                                move (files),
                                                cin,
                                                cerr);

          for (remote_file& f: files)
            r.emplace_back (move (f.url), move (f.filename));

          dir /= repo_id_to_safe_path (repo);
          break;
        }
      case source_kind::file:
        {
          for (string& u: read_url_list (*ctx_.source.file))
            r.emplace_back (move (u));
          break;
        }
      case source_kind::urls:
        {
          for (const string& u: ctx_.source.urls)
            r.emplace_back (u);
          break;
        }
      }

      co_return r;
    }

    asio::io_context& ioc_;
    runtime_context ctx_;
    http_client http_;
    progress_coordinator progress_;
  };

  static void
  print_usage (ostream& o, const options& opt)
  {
    o << "usage: batchdl [options] <url>..." << "\n"
      << "       batchdl [options] --file <path>" << "\n"
      << "       batchdl [options] --hf <repo> [--select]" << "\n"
      << "       batchdl [options] --model <alias>" << "\n"
      << "       batchdl [options] model search <query>..." << "\n"
      << "options:" << "\n";

    opt.print_usage (o);

    o << "model aliases:" << "\n";

    for (const auto& a: model_registry ())
      o << "  " << a.first << "\n";
  }

  static asio::awaitable<int>
  search_command (http_client& h, string q)
  {
    co_await search_models (h, q);
    co_return 0;
  }

  // Run the coroutine to completion and return its exit code, reporting an
  // escaped exception as an error.
  //
  static int
  run_main (asio::io_context& ioc, asio::awaitable<int> a)
  {
    int exit_code (0);

    asio::co_spawn (
      ioc,
      move (a),
      [&exit_code, &ioc] (exception_ptr ex, int r)
      {
        exit_code = r;
        if (ex)
        {
          try { rethrow_exception (ex); }
          catch (const exception& e)
          {
            cerr << "error: " << e.what () << "\n";
            trace (trace_level::error, e.what ());
            exit_code = 1;
          }
        }
        ioc.stop ();
      });

    ioc.run ();
    return exit_code;
  }
}

int
main (int argc, char* argv[])
{
  using namespace std;
  using namespace batchdl;

  try
  {
    // Options and positional arguments may be interleaved.
    //
    options opt;
    vector<string> args;

    cli::argv_scanner scan (argc, argv);

    while (scan.more ())
    {
      opt.parse (scan, cli::unknown_mode::fail, cli::unknown_mode::stop);

      if (scan.more ())
        args.push_back (scan.next ());
    }

    // Handle --version.
    //
    if (opt.version ())
    {
      cout << "batchdl " << BATCHDL_VERSION_ID << "\n";
      return 0;
    }

    // Handle --help.
    //
    if (opt.help ())
    {
      print_usage (cout, opt);
      return 0;
    }

    if (opt.debug ())
    {
      open_trace ("log.log");
      trace (trace_level::debug,
             "batchdl " BATCHDL_VERSION_ID " debug log enabled");
    }

    runtime_context ctx;

    if (opt.token ())
    {
      const char* t (getenv ("HF_TOKEN"));

      if (t == nullptr || *t == '\0')
        cerr << "warning: --token is specified but HF_TOKEN is not set or "
             << "is empty" << endl;
      else
        ctx.token = t;
    }

    if (opt.concurrency () == 0)
      throw invalid_argument ("concurrency must be greater than 0");

    ctx.concurrency = opt.concurrency ();
    ctx.read_timeout = opt.read_timeout ();
    ctx.output_root = fs::path (opt.output_dir ());
    ctx.select = opt.select ();

    // The display redraws in place, which only makes sense on a terminal.
    //
    ctx.render = !opt.no_progress () &&
                 isatty (STDOUT_FILENO) && isatty (STDERR_FILENO);

    asio::io_context ioc;

    // Handle the model search command.
    //
    if (!args.empty () && args[0] == "model")
    {
      if (args.size () < 2 || args[1] != "search")
        throw invalid_argument ("unknown model command; expected "
                                "'model search <query>...'");

      if (args.size () < 3)
        throw invalid_argument ("missing search query");

      string q;
      for (size_t i (2); i != args.size (); ++i)
        q += (i != 2 ? " " : "") + args[i];

      http_client http (ioc, client_traits (ctx));

      return run_main (ioc, search_command (http, move (q)));
    }

    // Map the source options to our context.
    //
    ctx.source.urls = move (args);

    if (opt.file_specified ())
      ctx.source.file = opt.file ();

    if (opt.hf_specified ())
      ctx.source.repository = opt.hf ();

    if (opt.model_specified ())
      ctx.source.model = opt.model ();

    ctx.kind = validate_sources (ctx.source);

    if (ctx.select && ctx.kind != source_kind::repository)
      cerr << "warning: --select has no effect without --hf" << endl;

    batchdl_controller controller (ioc, move (ctx));
    return run_main (ioc, controller.run ());
  }
  catch (const cli::exception& ex)
  {
    cerr << "error: " << ex.what () << "\n";
    return 1;
  }
  catch (const exception& ex)
  {
    cerr << "error: " << ex.what () << "\n";
    return 1;
  }
}
