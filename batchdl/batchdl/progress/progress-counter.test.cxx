#include <batchdl/progress/progress-counter.hxx>

#include <thread>
#include <vector>
#include <cassert>
#include <iostream>

using namespace std;
using namespace batchdl;

static void
test_clamp ()
{
  progress_counter c (100);

  c.add (60);
  assert (c.position () == 60);

  c.add (60);
  assert (c.position () == 100);

  // Never backwards.
  //
  c.advance_to (10);
  assert (c.position () == 100);

  // Never below the position.
  //
  c.set_length (50);
  assert (c.length () == 100);

  progress_sample s (c.read ());
  assert (s.position == 100 && s.length == 100 && s.ratio () == 1.0f);
}

static void
test_unknown_length ()
{
  progress_counter c;

  c.add (1000);
  c.advance_to (500);
  assert (c.position () == 1000);
  assert (c.read ().ratio () == 0.0f);

  c.set_length (4000);
  c.advance_to (5000);
  assert (c.position () == 4000);
}

// Concurrent increments are neither lost nor pushed past the length.
//
// Shares discovered late extend the length rather than replace it, even
// when several of them race.
//
static void
test_grow_length ()
{
  {
    progress_counter c (100);

    c.add (100);
    c.grow_length (50);
    assert (c.length () == 150);

    c.add (80);
    assert (c.position () == 150);

    c.grow_length (0);
    assert (c.length () == 150);
  }

  {
    progress_counter c;

    c.grow_length (10);
    assert (c.length () == 10);
  }

  {
    progress_counter c (1000);

    vector<thread> ts;

    for (size_t i (0); i != 4; ++i)
      ts.emplace_back ([&c]
      {
        for (size_t j (0); j != 1000; ++j)
        {
          c.grow_length (1);
          c.add (1);
        }
      });

    for (thread& t: ts)
      t.join ();

    assert (c.length () == 5000);
    assert (c.position () == 4000);
  }
}

static void
test_concurrent ()
{
  {
    progress_counter c;
    vector<thread> ts;

    for (int i (0); i != 8; ++i)
      ts.emplace_back ([&c]
      {
        for (int j (0); j != 10000; ++j)
          c.add (3);
      });

    for (thread& t: ts)
      t.join ();

    assert (c.position () == 8 * 10000 * 3);
  }

  {
    progress_counter c (100000);
    vector<thread> ts;

    for (int i (0); i != 8; ++i)
      ts.emplace_back ([&c]
      {
        for (int j (0); j != 10000; ++j)
        {
          c.add (7);
          progress_sample s (c.read ());
          assert (s.position <= s.length);
        }
      });

    for (thread& t: ts)
      t.join ();

    assert (c.position () == 100000);
  }
}

int
main ()
{
  test_clamp ();
  test_unknown_length ();
  test_grow_length ();
  test_concurrent ();

  cout << "all counter tests passed" << endl;
}
