#include "resplite/proto/line.hh"
#include "resplite/proto/resp.hh"

static bool out_of_bounds(RespError &err, size_t offset) {
  err.code = RESP_ERR_OUT_OF_BOUNDS;
  err.offset = offset;
  return false;
}

bool extract_line(uint8_t const *data, size_t size, size_t &cursor,
                  std::string &out, RespError &err) {
  if (cursor >= size) {
    return out_of_bounds(err, cursor);
  }
  // too short to ever hold a terminator
  if (size - cursor < 2) {
    cursor = size;
    return out_of_bounds(err, cursor);
  }
  for (size_t i = cursor + 1; i < size; i++) {
    if (data[i - 1] == '\r' && data[i] == '\n') {
      out.assign((char const *)data + cursor, i - 1 - cursor);
      cursor = i + 1;
      return true;
    }
  }
  // a lone '\r' at the end or a bare '\n' ends up here
  cursor = size;
  return out_of_bounds(err, cursor);
}

bool extract_line_str(uint8_t const *data, size_t size, size_t &cursor,
                      std::string &out, RespError &err) {
  if (!extract_line(data, size, cursor, out, err)) {
    return false;
  }
  if (!utf8_valid((uint8_t const *)out.data(), out.size())) {
    err.code = RESP_ERR_INVALID_ENCODING;
    return false;
  }
  return true;
}

bool extract_bytes(uint8_t const *data, size_t size, size_t &cursor,
                   size_t n, std::string &out, RespError &err) {
  if (cursor > size || n > size - cursor) {
    return out_of_bounds(err, cursor + n);
  }
  out.assign((char const *)data + cursor, n);
  cursor += n;
  return true;
}

bool expect_sigil(uint8_t expected, uint8_t const *data, size_t size,
                  size_t &cursor, RespError &err) {
  if (cursor >= size || data[cursor] != expected) {
    err.code = RESP_ERR_WRONG_TYPE;
    return false;
  }
  cursor++;
  return true;
}

// well-formed UTF-8 per RFC 3629: no overlongs, no surrogates, <= U+10FFFF
bool utf8_valid(uint8_t const *data, size_t size) {
  size_t i = 0;
  while (i < size) {
    uint8_t c = data[i];
    if (c < 0x80) {
      i++;
      continue;
    }
    size_t n = 0;         // continuation bytes
    uint8_t lo = 0x80;    // bounds of the 2nd byte
    uint8_t hi = 0xbf;
    if (c >= 0xc2 && c <= 0xdf) {
      n = 1;
    } else if (c >= 0xe0 && c <= 0xef) {
      n = 2;
      if (c == 0xe0) lo = 0xa0;
      if (c == 0xed) hi = 0x9f;
    } else if (c >= 0xf0 && c <= 0xf4) {
      n = 3;
      if (c == 0xf0) lo = 0x90;
      if (c == 0xf4) hi = 0x8f;
    } else {
      return false;
    }
    if (size - i <= n) {
      return false;  // truncated sequence
    }
    if (data[i + 1] < lo || data[i + 1] > hi) {
      return false;
    }
    for (size_t k = 2; k <= n; k++) {
      if ((data[i + k] & 0xc0) != 0x80) {
        return false;
      }
    }
    i += n + 1;
  }
  return true;
}
