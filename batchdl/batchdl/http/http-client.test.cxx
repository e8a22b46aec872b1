#include <batchdl/http/http.hxx>

#include <batchdl/http/http-test-server.hxx>

#include <cassert>
#include <iostream>
#include <stdexcept>
#include <exception>

using namespace std;
using namespace batchdl;
using namespace batchdl::test;

// Fetch the URL with a bearer token and the given connect timeout, and
// return the buffered response.
//
static http_response
fetch (asio::io_context& ioc,
       http_test_server& srv,
       const string& url,
       uint32_t connect_timeout = 20000)
{
  http_client_traits<> tr;
  tr.bearer_token = "secret";
  tr.connect_timeout = connect_timeout;
  http_client c (ioc, tr);

  http_response r;
  exception_ptr ep;

  asio::co_spawn (ioc,
                  c.get (url),
                  [&] (exception_ptr e, http_response v)
  {
    ep = e;
    r = move (v);
    srv.stop ();
  });

  ioc.run ();

  if (ep)
    rethrow_exception (ep);

  return r;
}

// A redirect within the same host keeps the token.
//
static void
test_token_same_host ()
{
  asio::io_context ioc;
  http_test_server srv (ioc);

  srv.redirect ("/a", srv.url ("/b"));
  srv.serve ("/b", served_file {"payload"});

  http_response r (fetch (ioc, srv, srv.url ("/a")));

  assert (r.status == http_status::ok);
  assert (r.body && *r.body == "payload");

  const auto& rs (srv.requests ());
  assert (rs.size () == 2);
  assert (rs[0].authorization == "Bearer secret");
  assert (rs[1].target == "/b");
  assert (rs[1].authorization == "Bearer secret");
}

// A redirect to another host drops the token. The second host is the same
// server reached by name.
//
static void
test_token_cross_host ()
{
  asio::io_context ioc;
  http_test_server srv (ioc);

  srv.redirect ("/a", srv.url ("/b", "localhost"));
  srv.serve ("/b", served_file {"payload"});

  http_response r (fetch (ioc, srv, srv.url ("/a"), 5000));

  assert (r.status == http_status::ok);
  assert (r.body && *r.body == "payload");

  const auto& rs (srv.requests ());
  assert (rs.size () == 2);
  assert (rs[0].authorization == "Bearer secret");
  assert (rs[1].target == "/b");
  assert (rs[1].authorization.empty ());
}

// Nothing listens on the port of a closed server.
//
static void
test_connect_refused ()
{
  asio::io_context ioc;
  http_test_server srv (ioc);

  string url (srv.url ("/a"));
  srv.stop ();

  try
  {
    fetch (ioc, srv, url, 5000);
    assert (false);
  }
  catch (const boost::system::system_error&)
  {
  }

  assert (srv.requests ().empty ());
}

static void
test_timeout_milliseconds ()
{
  assert (timeout_milliseconds (0) == 0);
  assert (timeout_milliseconds (60) == 60000);
  assert (timeout_milliseconds (4294967) == 4294967000u);

  // Past the range of the millisecond count.
  //
  for (uint64_t s: {uint64_t (4294968), uint64_t (4294967295)})
  {
    try
    {
      timeout_milliseconds (s);
      assert (false);
    }
    catch (const invalid_argument&)
    {
    }
  }
}

int
main ()
{
  test_timeout_milliseconds ();
  test_token_same_host ();
  test_token_cross_host ();
  test_connect_refused ();

  cout << "all client tests passed" << endl;
}
