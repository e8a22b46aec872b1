#include <batchdl/http/http-response.hxx>

#include <cassert>
#include <iostream>

using namespace std;
using namespace batchdl;

static void
test_content_range ()
{
  {
    auto r (parse_content_range ("bytes 100-199/1000"));
    assert (r && *r->first == 100 && *r->last == 199 && *r->complete == 1000);
  }

  // Unknown complete length.
  //
  {
    auto r (parse_content_range ("bytes 0-99/*"));
    assert (r && *r->first == 0 && !r->complete);
  }

  // The 416 form.
  //
  {
    auto r (parse_content_range ("bytes */4096"));
    assert (r && !r->first && !r->last && *r->complete == 4096);
  }

  assert (!parse_content_range ("items 0-1/2"));
  assert (!parse_content_range ("bytes */*"));
  assert (!parse_content_range ("bytes 10-5/100"));
  assert (!parse_content_range ("bytes 5/100"));
  assert (!parse_content_range ("bytes x-y/100"));
}

int
main ()
{
  test_content_range ();

  cout << "all response tests passed" << endl;
}
