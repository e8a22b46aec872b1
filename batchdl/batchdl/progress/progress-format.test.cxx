#include <batchdl/progress/progress-format.hxx>

#include <cassert>
#include <iostream>

using namespace std;
using namespace batchdl;

static void
test_bytes ()
{
  assert (format_bytes (0) == "0 B");
  assert (format_bytes (999) == "999 B");
  assert (format_bytes (1500) == "1.50 KB");
  assert (format_bytes (2500000) == "2.50 MB");
  assert (format_bytes (4370000000ULL) == "4.37 GB");

  assert (format_speed (1500.0f) == "1.50 KB/s");
  assert (format_speed (-1.0f) == "0 B/s");
}

static void
test_duration ()
{
  assert (format_duration (5) == "5s");
  assert (format_duration (90) == "1m30s");
  assert (format_duration (3725) == "1h02m");
}

static void
test_count ()
{
  assert (format_count (950) == "950");
  assert (format_count (12345) == "12.3K");
  assert (format_count (4500000) == "4.5M");
  assert (format_count (1200000000) == "1.2B");
}

static void
test_bar ()
{
  assert (format_bar (0.0f, 4, false) == "[    ]");
  assert (format_bar (0.5f, 4, false) == "[=>  ]");
  assert (format_bar (1.0f, 4, false) == "[===>]");
  assert (format_bar (0.0f, 4, true) == "[  > ]");
}

static void
test_truncate ()
{
  assert (truncate_label ("short.gguf", 30) == "short.gguf");

  // The extension survives, the start of the name goes.
  //
  string l (truncate_label ("a-very-long-model-name-00001-of-00003.gguf", 20));
  assert (l.size () == 20);
  assert (l.compare (0, 3, "...") == 0);
  assert (l.compare (l.size () - 5, 5, ".gguf") == 0);

  assert (shorten_message ("connection refused", 40) == "connection refused");

  string m (shorten_message (string (100, 'x'), 40));
  assert (m.size () == 40 && m.compare (37, 3, "...") == 0);
}

int
main ()
{
  test_bytes ();
  test_duration ();
  test_count ();
  test_bar ();
  test_truncate ();

  cout << "all format tests passed" << endl;
}
