#include <batchdl/download/download-prescanner.hxx>

#include <batchdl/http/http-test-server.hxx>

#include <cassert>
#include <iostream>
#include <exception>

using namespace std;
using namespace batchdl;
using namespace batchdl::test;

template <typename F>
static void
run (asio::io_context& ioc, http_test_server& srv, F f)
{
  exception_ptr ep;

  asio::co_spawn (ioc, f (), [&] (exception_ptr e)
  {
    ep = e;
    srv.stop ();
  });

  ioc.run ();

  if (ep)
    rethrow_exception (ep);
}

// HEAD when it works, a GET head when it does not, and 0 when neither
// yields a length.
//
static void
test_sources ()
{
  asio::io_context ioc;
  http_test_server srv (ioc);

  srv.serve ("/head", served_file {string (1234, 'h')});

  served_file nohead {string (4321, 'g')};
  nohead.head = false;
  srv.serve ("/nohead", nohead);

  served_file nolen {string (99, 'n')};
  nolen.length = false;
  srv.serve ("/nolen", nolen);

  http_client c (ioc);
  size_prescanner ps (c);

  vector<string> warnings;
  ps.set_warning_callback ([&warnings] (const string& m)
  {
    warnings.push_back (m);
  });

  size_t last_done (0), last_total (0);
  ps.set_progress_callback ([&] (size_t d, size_t t)
  {
    assert (d == last_done + 1);
    last_done = d;
    last_total = t;
  });

  vector<download_item> is {
    download_item (srv.url ("/head")),
    download_item (srv.url ("/nohead"), string ("nohead.bin")),
    download_item (srv.url ("/nolen")),
    download_item (srv.url ("/missing"), string ("missing.bin"))};

  size_map m;

  run (ioc, srv, [&] () -> asio::awaitable<void>
  {
    m = co_await ps.scan (prescan_targets (is));
  });

  assert (m.size () == 4);
  assert (m[srv.url ("/head")] == 1234);
  assert (m[srv.url ("/nohead")] == 4321);
  assert (m[srv.url ("/nolen")] == 0);
  assert (m[srv.url ("/missing")] == 0);

  assert (ps.failures () == 2);
  assert (warnings.size () == 2);
  assert (warnings[0].find ("'missing.bin'") != string::npos ||
          warnings[1].find ("'missing.bin'") != string::npos);

  assert (last_done == 4 && last_total == 4);

  // The sized HEAD needed no GET.
  //
  assert (srv.count (http::verb::get, "/head") == 0);
  assert (srv.count (http::verb::get, "/nohead") == 1);
}

// After five warnings there is one notice and then silence, while every
// failure is still counted.
//
static void
test_suppression ()
{
  asio::io_context ioc;
  http_test_server srv (ioc);

  http_client c (ioc);
  size_prescanner ps (c);

  vector<string> warnings;
  ps.set_warning_callback ([&warnings] (const string& m)
  {
    warnings.push_back (m);
  });

  vector<remote_file> fs;
  for (size_t i (0); i != 30; ++i)
    fs.push_back (remote_file {srv.url ("/gone" + to_string (i)),
                               "gone" + to_string (i)});

  size_map m;

  run (ioc, srv, [&] () -> asio::awaitable<void>
  {
    m = co_await ps.scan (prescan_targets (fs));
  });

  assert (m.size () == 30);
  assert (ps.failures () == 30);
  assert (warnings.size () == 6);

  for (size_t i (0); i != 5; ++i)
    assert (warnings[i].find ("could not get size") != string::npos);

  assert (warnings[5] == "more size errors suppressed");
}

int
main ()
{
  test_sources ();
  test_suppression ();

  cout << "all prescanner tests passed" << endl;
}
