#include <batchdl/download/download-transfer.hxx>

#include <batchdl/http/http-test-server.hxx>

#include <cassert>
#include <fstream>
#include <sstream>
#include <iostream>
#include <exception>

#include <unistd.h>

using namespace std;
using namespace batchdl;
using namespace batchdl::test;

// Every scenario runs a fresh io_context with its own loopback server and
// scratch directory. The server is stopped once the transfer has finished
// so that run() returns.
//

static fs::path
scratch (const string& n)
{
  fs::path d (fs::temp_directory_path () /
              ("batchdl-transfer-" + n + '-' + to_string (getpid ())));
  fs::remove_all (d);
  fs::create_directories (d);
  return d;
}

static string
pattern (size_t n)
{
  string s;
  s.reserve (n);

  for (size_t i (0); i != n; ++i)
    s += static_cast<char> ('a' + i % 26);

  return s;
}

static string
read_file (const fs::path& p)
{
  ifstream i (p, ios::binary);
  ostringstream o;
  o << i.rdbuf ();
  return o.str ();
}

static void
write_file (const fs::path& p, const string& s)
{
  ofstream o (p, ios::binary | ios::trunc);
  o << s;
}

struct outcome
{
  optional<failure_kind> failure;
  vector<string> warnings;
};

// Run a transfer of the task against the server.
//
static outcome
run (asio::io_context& ioc,
     http_test_server& srv,
     download_task& t,
     progress_counter& entry,
     progress_counter& overall,
     uint32_t read_timeout = 5000)
{
  http_client_traits<> tr;
  tr.read_timeout = read_timeout;
  http_client c (ioc, tr);

  outcome r;
  exception_ptr ep;

  transfer_warning warn ([&r] (const string& m) {r.warnings.push_back (m);});

  asio::co_spawn (ioc,
                  transfer (c, t, entry, overall, warn),
                  [&] (exception_ptr e)
  {
    ep = e;
    srv.stop ();
  });

  ioc.run ();

  if (ep)
  {
    try
    {
      rethrow_exception (ep);
    }
    catch (const download_failure& e)
    {
      r.failure = e.kind ();
    }
  }

  return r;
}

// A local file of the known size is complete: no request at all, and the
// full size shows on both counters.
//
static void
test_already_complete ()
{
  asio::io_context ioc;
  http_test_server srv (ioc);

  string body (pattern (1000));
  srv.serve ("/f.bin", served_file {body});

  fs::path d (scratch ("complete"));
  write_file (d / "f.bin", body);

  download_task t (download_item (srv.url ("/f.bin")), d / "f.bin", 1000);
  progress_counter e (1000), o (1000);

  outcome r (run (ioc, srv, t, e, o));

  assert (!r.failure);
  assert (srv.requests ().empty ());
  assert (t.completed ());
  assert (e.position () == 1000);
  assert (o.position () == 1000);
  assert (read_file (d / "f.bin") == body);

  fs::remove_all (d);
}

static void
test_fresh ()
{
  asio::io_context ioc;
  http_test_server srv (ioc);

  string body (pattern (100000));
  srv.serve ("/f.bin", served_file {body});

  fs::path d (scratch ("fresh"));

  // The destination directory does not exist yet.
  //
  download_task t (download_item (srv.url ("/f.bin")),
                   d / "sub" / "dir" / "f.bin",
                   body.size ());
  progress_counter e (body.size ()), o (body.size ());

  outcome r (run (ioc, srv, t, e, o));

  assert (!r.failure);
  assert (r.warnings.empty ());
  assert (t.completed ());
  assert (read_file (d / "sub" / "dir" / "f.bin") == body);
  assert (e.position () == body.size ());
  assert (o.position () == body.size ());
  assert (t.downloaded_bytes.load () == body.size ());

  assert (srv.requests ().size () == 1);
  assert (srv.requests ()[0].range.empty ());

  fs::remove_all (d);
}

// Exactly one range request starting at the partial size, and the result
// is the full content with nothing lost or repeated at the seam.
//
static void
test_resume ()
{
  asio::io_context ioc;
  http_test_server srv (ioc);

  string body (pattern (50000));
  srv.serve ("/f.bin", served_file {body});

  fs::path d (scratch ("resume"));
  write_file (d / "f.bin", body.substr (0, 12345));

  download_task t (download_item (srv.url ("/f.bin")), d / "f.bin",
                   body.size ());
  progress_counter e (body.size ()), o (body.size ());

  outcome r (run (ioc, srv, t, e, o));

  assert (!r.failure);
  assert (r.warnings.empty ());
  assert (read_file (d / "f.bin") == body);

  assert (srv.requests ().size () == 1);
  assert (srv.requests ()[0].range == "bytes=12345-");

  // The resumed bytes count on the overall counter, once.
  //
  assert (o.position () == body.size ());
  assert (e.position () == body.size ());
  assert (t.downloaded_bytes.load () == body.size () - 12345);

  fs::remove_all (d);
}

// A server that ignores the range gets a fresh download, never the new
// content appended to the stale partial file.
//
static void
test_resume_refused ()
{
  asio::io_context ioc;
  http_test_server srv (ioc);

  string body (pattern (30000));
  served_file f {body};
  f.ranges = false;
  srv.serve ("/f.bin", f);

  fs::path d (scratch ("refused"));
  write_file (d / "f.bin", string (5000, 'x'));

  download_task t (download_item (srv.url ("/f.bin")), d / "f.bin",
                   body.size ());
  progress_counter e (body.size ()), o (body.size ());

  outcome r (run (ioc, srv, t, e, o));

  assert (!r.failure);
  assert (r.warnings.size () == 1);
  assert (r.warnings[0].find ("does not support resume") != string::npos);
  assert (read_file (d / "f.bin") == body);

  assert (srv.requests ().size () == 1);
  assert (srv.requests ()[0].range == "bytes=5000-");

  // The discarded bytes were never counted.
  //
  assert (o.position () == body.size ());

  fs::remove_all (d);
}

// A body shorter than the known size is a failure even though the exchange
// itself completed.
//
static void
test_incomplete ()
{
  asio::io_context ioc;
  http_test_server srv (ioc);

  string body (pattern (20000));
  served_file f {body};
  f.truncate = 15000;
  srv.serve ("/f.bin", f);

  fs::path d (scratch ("incomplete"));

  download_task t (download_item (srv.url ("/f.bin")), d / "f.bin",
                   body.size ());
  progress_counter e (body.size ()), o (body.size ());

  outcome r (run (ioc, srv, t, e, o));

  assert (r.failure && *r.failure == failure_kind::incomplete);
  assert (!t.completed ());

  // The partial file stays for the next run.
  //
  assert (fs::file_size (d / "f.bin") == 15000);

  fs::remove_all (d);
}

// Unknown size: the length comes from the response and there is no
// completeness check.
//
static void
test_unknown_size ()
{
  asio::io_context ioc;
  http_test_server srv (ioc);

  string body (pattern (7777));
  served_file f {body};
  f.length = false;
  srv.serve ("/f.bin", f);

  fs::path d (scratch ("unknown"));

  download_task t (download_item (srv.url ("/f.bin")), d / "f.bin", 0);
  progress_counter e, o;

  outcome r (run (ioc, srv, t, e, o));

  assert (!r.failure);
  assert (t.completed ());
  assert (read_file (d / "f.bin") == body);
  assert (o.position () == body.size ());
  assert (o.length () == body.size ());

  fs::remove_all (d);
}

// Unknown size and a local file that already has everything: the server
// answers the range with 416 and its size, which matches.
//
static void
test_unknown_size_complete ()
{
  asio::io_context ioc;
  http_test_server srv (ioc);

  string body (pattern (4096));
  srv.serve ("/f.bin", served_file {body});

  fs::path d (scratch ("revalidate"));
  write_file (d / "f.bin", body);

  download_task t (download_item (srv.url ("/f.bin")), d / "f.bin", 0);
  progress_counter e, o;

  outcome r (run (ioc, srv, t, e, o));

  assert (!r.failure);
  assert (t.completed ());
  assert (srv.requests ().size () == 1);
  assert (srv.requests ()[0].range == "bytes=4096-");
  assert (read_file (d / "f.bin") == body);
  assert (e.read ().position == 4096 && e.read ().length == 4096);
  assert (o.read ().position == 4096 && o.read ().length == 4096);

  fs::remove_all (d);
}

// A 206 that claims to start anywhere but at the local size would splice
// the wrong bytes onto the file.
//
static void
test_resume_wrong_offset ()
{
  asio::io_context ioc;
  http_test_server srv (ioc);

  string body (pattern (1000));
  served_file f {body};
  f.range_start = 0;
  srv.serve ("/f.bin", f);

  fs::path d (scratch ("offset"));
  write_file (d / "f.bin", body.substr (0, 300));

  download_task t (download_item (srv.url ("/f.bin")), d / "f.bin", 1000);
  progress_counter e (1000), o (1000);

  outcome r (run (ioc, srv, t, e, o));

  assert (r.failure && *r.failure == failure_kind::range);
  assert (!t.completed ());
  assert (srv.requests ()[0].range == "bytes=300-");

  // The partial file is left alone and nothing was counted.
  //
  assert (read_file (d / "f.bin") == body.substr (0, 300));
  assert (o.position () == 0);

  fs::remove_all (d);
}

// Unknown size and a 416 whose complete length is not the local size: the
// local file cannot be trusted as complete.
//
static void
test_unknown_size_mismatch ()
{
  asio::io_context ioc;
  http_test_server srv (ioc);

  string body (pattern (4096));
  served_file f {body};
  f.range_total = 5000;
  srv.serve ("/f.bin", f);

  fs::path d (scratch ("mismatch"));
  write_file (d / "f.bin", body);

  download_task t (download_item (srv.url ("/f.bin")), d / "f.bin", 0);
  progress_counter e, o;

  outcome r (run (ioc, srv, t, e, o));

  assert (r.failure && *r.failure == failure_kind::range);
  assert (!t.completed ());
  assert (srv.requests ().size () == 1);
  assert (read_file (d / "f.bin") == body);
  assert (o.position () == 0);

  fs::remove_all (d);
}

static void
test_not_found ()
{
  asio::io_context ioc;
  http_test_server srv (ioc);

  fs::path d (scratch ("missing"));

  download_task t (download_item (srv.url ("/nope")), d / "nope", 0);
  progress_counter e, o;

  outcome r (run (ioc, srv, t, e, o));

  assert (r.failure && *r.failure == failure_kind::http_status);
  assert (!fs::exists (d / "nope"));

  fs::remove_all (d);
}

static void
test_directory_failure ()
{
  asio::io_context ioc;
  http_test_server srv (ioc);

  srv.serve ("/f.bin", served_file {pattern (10)});

  // A regular file where the directory should be.
  //
  fs::path d (scratch ("dir"));
  write_file (d / "blocker", "x");

  download_task t (download_item (srv.url ("/f.bin")),
                   d / "blocker" / "f.bin",
                   10);
  progress_counter e (10), o (10);

  outcome r (run (ioc, srv, t, e, o));

  assert (r.failure && *r.failure == failure_kind::directory);
  assert (srv.requests ().empty ());

  fs::remove_all (d);
}

// A body that stops arriving trips the idle timeout.
//
static void
test_stall ()
{
  asio::io_context ioc;
  http_test_server srv (ioc);

  served_file f {pattern (1000)};
  f.stall = chrono::milliseconds (1500);
  srv.serve ("/f.bin", f);

  fs::path d (scratch ("stall"));

  download_task t (download_item (srv.url ("/f.bin")), d / "f.bin", 1000);
  progress_counter e (1000), o (1000);

  outcome r (run (ioc, srv, t, e, o, 200));

  assert (r.failure && *r.failure == failure_kind::transport);
  assert (!t.completed ());

  fs::remove_all (d);
}

int
main ()
{
  test_already_complete ();
  test_fresh ();
  test_resume ();
  test_resume_refused ();
  test_incomplete ();
  test_unknown_size ();
  test_unknown_size_complete ();
  test_resume_wrong_offset ();
  test_unknown_size_mismatch ();
  test_not_found ();
  test_directory_failure ();
  test_stall ();

  cout << "all transfer tests passed" << endl;
}
