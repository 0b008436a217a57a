#include "resplite/proto/line.hh"
#include "resplite/proto/resp.hh"
#include <string>
#include <string.h>
#include <assert.h>

static uint8_t const *bytes(char const *s) { return (uint8_t const *)s; }

// expects OutOfBounds, returns the reported offset
static size_t line_oob(char const *s, size_t &cursor) {
  std::string out;
  RespError err;
  bool ok = extract_line(bytes(s), strlen(s), cursor, out, err);
  assert(!ok);
  assert(err.code == RESP_ERR_OUT_OF_BOUNDS);
  return err.offset;
}

static void test_line_bounds() {
  size_t cursor = 0;
  // empty buffer, cursor untouched
  assert(line_oob("", cursor) == 0);
  assert(cursor == 0);
  // single byte
  cursor = 0;
  assert(line_oob("O", cursor) == 1);
  assert(cursor == 1);
  // cursor too advanced
  cursor = 1;
  assert(line_oob("OK", cursor) == 2);
  assert(cursor == 2);
  // cursor past the end
  cursor = 5;
  assert(line_oob("OK", cursor) == 5);
  assert(cursor == 5);
}

static void test_line_no_terminator() {
  size_t cursor = 0;
  assert(line_oob("OK", cursor) == 2);
  assert(cursor == 2);
  // half terminator
  cursor = 0;
  assert(line_oob("OK\r", cursor) == 3);
  assert(cursor == 3);
  // '\n' without '\r'
  cursor = 0;
  assert(line_oob("OK\n", cursor) == 3);
  assert(cursor == 3);
  // swapped order
  cursor = 0;
  assert(line_oob("OK\n\r", cursor) == 4);
  assert(cursor == 4);
}

static void test_line_found() {
  std::string out;
  RespError err;
  size_t cursor = 0;
  assert(extract_line(bytes("OK\r\n"), 4, cursor, out, err));
  assert(out == "OK");
  assert(cursor == 4);

  // empty line
  cursor = 0;
  assert(extract_line(bytes("\r\n"), 2, cursor, out, err));
  assert(out.empty());
  assert(cursor == 2);

  // repeated extraction from the same buffer
  char const *s = "a\rb\r\ncd\r\n\r";
  size_t n = strlen(s);
  cursor = 0;
  assert(extract_line(bytes(s), n, cursor, out, err));
  assert(out == "a\rb");
  assert(cursor == 5);
  assert(extract_line(bytes(s), n, cursor, out, err));
  assert(out == "cd");
  assert(cursor == 9);
  assert(!extract_line(bytes(s), n, cursor, out, err));
  assert(err.code == RESP_ERR_OUT_OF_BOUNDS);
  assert(err.offset == n);
  assert(cursor == n);
}

// terminator at relative offset k returns k bytes and moves k+2
static void test_line_offsets() {
  for (size_t start = 0; start < 4; start++) {
    for (size_t k = 0; k < 16; k++) {
      std::string s(start, 'x');
      s += std::string(k, 'y') + "\r\n" + "tail";
      std::string out;
      RespError err;
      size_t cursor = start;
      assert(extract_line(bytes(s.c_str()), s.size(), cursor, out, err));
      assert(out == std::string(k, 'y'));
      assert(cursor == start + k + 2);
    }
  }
}

static void test_line_str() {
  std::string out;
  RespError err;
  size_t cursor = 0;
  assert(extract_line_str(bytes("h\xc3\xa9llo\r\n"), 8, cursor, out, err));
  assert(out == "h\xc3\xa9llo");

  cursor = 0;
  assert(!extract_line_str(bytes("\xff\xfe\r\n"), 4, cursor, out, err));
  assert(err.code == RESP_ERR_INVALID_ENCODING);
  assert(cursor == 4);  // advanced past the line anyway
}

static void test_extract_bytes() {
  std::string out;
  RespError err;
  size_t cursor = 1;
  assert(extract_bytes(bytes("xabc"), 4, cursor, 3, out, err));
  assert(out == "abc");
  assert(cursor == 4);

  cursor = 1;
  assert(!extract_bytes(bytes("xab"), 3, cursor, 5, out, err));
  assert(err.code == RESP_ERR_OUT_OF_BOUNDS);
  assert(err.offset == 6);
  assert(cursor == 1);
}

static void test_expect_sigil() {
  RespError err;
  size_t cursor = 0;
  assert(!expect_sigil('+', bytes("*OK\r\n"), 5, cursor, err));
  assert(err.code == RESP_ERR_WRONG_TYPE);
  assert(cursor == 0);

  assert(expect_sigil('*', bytes("*OK\r\n"), 5, cursor, err));
  assert(cursor == 1);

  cursor = 5;
  assert(!expect_sigil('+', bytes("*OK\r\n"), 5, cursor, err));
  assert(err.code == RESP_ERR_WRONG_TYPE);
  assert(cursor == 5);
}

static bool valid(char const *s) {
  return utf8_valid(bytes(s), strlen(s));
}

static void test_utf8() {
  assert(valid(""));
  assert(valid("plain ascii"));
  assert(valid("\xc3\xa9"));              // U+00E9
  assert(valid("\xe2\x82\xac"));          // U+20AC
  assert(valid("\xf0\x9f\x98\x80"));      // U+1F600
  assert(!valid("\x80"));                 // stray continuation
  assert(!valid("\xc0\xaf"));             // overlong
  assert(!valid("\xe0\x80\xaf"));         // overlong
  assert(!valid("\xed\xa0\x80"));         // surrogate
  assert(!valid("\xf4\x90\x80\x80"));     // > U+10FFFF
  assert(!valid("\xe2\x82"));             // truncated
  assert(!valid("\xc3("));                // bad continuation
}

int main() {
  test_line_bounds();
  test_line_no_terminator();
  test_line_found();
  test_line_offsets();
  test_line_str();
  test_extract_bytes();
  test_expect_sigil();
  test_utf8();
  return 0;
}
