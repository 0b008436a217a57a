#pragma once

#include <stdint.h>
#include <stddef.h>
#include <string>

// RESP subset
//  simple string          bulk string                     null
// +---+------+------+    +---+-----+------+------+------+  +---+----+------+
// | + | text | \r\n |    | $ | len | \r\n | data | \r\n |  | $ | -1 | \r\n |
// +---+------+------+    +---+-----+------+------+------+  +---+----+------+

// upper bound of unread bytes a peer may leave pending
size_t const k_max_msg = 32 << 20;

uint8_t const k_sigil_simple_str = '+';
uint8_t const k_sigil_bulk_str   = '$';

// value types
enum RESP_TYPE {
  RESP_NULL       = 0,  // bulk string with length -1
  RESP_SIMPLE_STR = 1,
  RESP_BULK_STR   = 2,
};

// decoded value, owns its text
struct RespValue {
  uint32_t type = RESP_NULL;
  std::string str;  // unused for RESP_NULL
};

RespValue resp_null();
RespValue resp_simple_str(std::string const &s);
RespValue resp_bulk_str(std::string const &s);

bool operator==(RespValue const &a, RespValue const &b);
bool operator!=(RespValue const &a, RespValue const &b);

// error codes for RespError
enum RESP_ERR_CODE {
  RESP_OK                      = 0,
  RESP_ERR_OUT_OF_BOUNDS       = 1,  // offset
  RESP_ERR_WRONG_TYPE          = 2,  // sigil mismatch
  RESP_ERR_UNKNOWN             = 3,  // unrecognized sigil
  RESP_ERR_INVALID_ENCODING    = 4,  // not UTF-8
  RESP_ERR_INVALID_LENGTH      = 5,  // length line is not an integer
  RESP_ERR_LENGTH_OUT_OF_RANGE = 6,  // length
};

struct RespError {
  uint32_t code = RESP_OK;
  size_t offset = 0;   // RESP_ERR_OUT_OF_BOUNDS only
  int64_t length = 0;  // RESP_ERR_LENGTH_OUT_OF_RANGE only
};

std::string resp_err_str(RespError const &err);

// Decode one value starting at `cursor`.
// On success the cursor is moved past the consumed bytes. On failure `err`
// is filled and the cursor stays where the scan stopped.
bool resp_decode(uint8_t const *data, size_t size, size_t &cursor,
                 RespValue &out, RespError &err);

struct Buffer;
void out_null(Buffer &buf);
void out_simple_str(Buffer &buf, char const *s, size_t size);
void out_bulk_str(Buffer &buf, char const *s, size_t size);

void resp_encode(Buffer &buf, RespValue const &val);
std::string resp_encode_str(RespValue const &val);
