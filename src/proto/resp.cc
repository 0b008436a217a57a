#include "resplite/proto/resp.hh"
#include "resplite/proto/line.hh"
#include <errno.h>
#include <stdlib.h>
#include <string.h>
#include <sstream>

RespValue resp_null() {
  return RespValue();
}

RespValue resp_simple_str(std::string const &s) {
  RespValue val;
  val.type = RESP_SIMPLE_STR;
  val.str = s;
  return val;
}

RespValue resp_bulk_str(std::string const &s) {
  RespValue val;
  val.type = RESP_BULK_STR;
  val.str = s;
  return val;
}

bool operator==(RespValue const &a, RespValue const &b) {
  if (a.type != b.type) {
    return false;
  }
  return a.type == RESP_NULL || a.str == b.str;
}

bool operator!=(RespValue const &a, RespValue const &b) {
  return !(a == b);
}

std::string resp_err_str(RespError const &err) {
  std::ostringstream os;
  switch (err.code) {
  case RESP_OK:
    os << "ok";
    break;
  case RESP_ERR_OUT_OF_BOUNDS:
    os << "out of bounds at index " << err.offset;
    break;
  case RESP_ERR_WRONG_TYPE:
    os << "wrong type";
    break;
  case RESP_ERR_UNKNOWN:
    os << "unknown format";
    break;
  case RESP_ERR_INVALID_ENCODING:
    os << "invalid encoding";
    break;
  case RESP_ERR_INVALID_LENGTH:
    os << "invalid length";
    break;
  case RESP_ERR_LENGTH_OUT_OF_RANGE:
    os << "length out of range: " << err.length;
    break;
  default:
    os << "bad error code " << err.code;
    break;
  }
  return os.str();
}

// strict base-10: optional '-', then digits only
static bool str2int(std::string const &s, int64_t &out) {
  if (s.empty() || !(s[0] == '-' || (s[0] >= '0' && s[0] <= '9'))) {
    return false;
  }
  char *endp = NULL;
  errno = 0;
  out = strtoll(s.c_str(), &endp, 10);
  return errno == 0 && endp != s.c_str() && endp == s.c_str() + s.size();
}

// +<text>\r\n
static bool decode_simple_str(uint8_t const *data, size_t size, size_t &cursor,
                              RespValue &out, RespError &err) {
  if (!expect_sigil(k_sigil_simple_str, data, size, cursor, err)) {
    return false;
  }
  std::string text;
  if (!extract_line_str(data, size, cursor, text, err)) {
    return false;
  }
  out.type = RESP_SIMPLE_STR;
  out.str.swap(text);
  return true;
}

// $<len>\r\n<data>\r\n  or  $-1\r\n
static bool decode_bulk_str(uint8_t const *data, size_t size, size_t &cursor,
                            RespValue &out, RespError &err) {
  if (!expect_sigil(k_sigil_bulk_str, data, size, cursor, err)) {
    return false;
  }
  std::string line;
  if (!extract_line_str(data, size, cursor, line, err)) {
    return false;
  }
  int64_t len = 0;
  if (!str2int(line, len)) {
    err.code = RESP_ERR_INVALID_LENGTH;
    return false;
  }
  if (len == -1) {
    out.type = RESP_NULL;
    out.str.clear();
    return true;
  }
  if (len < -1) {
    err.code = RESP_ERR_LENGTH_OUT_OF_RANGE;
    err.length = len;
    return false;
  }
  std::string text;
  if (!extract_bytes(data, size, cursor, (size_t)len, text, err)) {
    return false;
  }
  if (!utf8_valid((uint8_t const *)text.data(), text.size())) {
    err.code = RESP_ERR_INVALID_ENCODING;
    return false;
  }
  // the trailing terminator is skipped, not checked
  if (size - cursor < 2) {
    err.code = RESP_ERR_OUT_OF_BOUNDS;
    err.offset = size;
    return false;
  }
  cursor += 2;
  out.type = RESP_BULK_STR;
  out.str.swap(text);
  return true;
}

bool resp_decode(uint8_t const *data, size_t size, size_t &cursor,
                 RespValue &out, RespError &err) {
  err = RespError();
  if (cursor >= size) {
    err.code = RESP_ERR_UNKNOWN;
    return false;
  }
  switch (data[cursor]) {
  case k_sigil_simple_str:
    return decode_simple_str(data, size, cursor, out, err);
  case k_sigil_bulk_str:
    return decode_bulk_str(data, size, cursor, out, err);
  default:
    err.code = RESP_ERR_UNKNOWN;
    return false;
  }
}
