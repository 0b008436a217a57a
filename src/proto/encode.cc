#include "resplite/proto/resp.hh"
#include "resplite/proto/buffer.hh"
#include <string>

static void buf_append_crlf(Buffer &buf) {
  buf.append((uint8_t const *)"\r\n", 2);
}

void out_null(Buffer &buf) {
  buf.append((uint8_t const *)"$-1\r\n", 5);
}

void out_simple_str(Buffer &buf, char const *s, size_t size) {
  buf.append_u8(k_sigil_simple_str);        // sigil
  buf.append((uint8_t const *)s, size);     // text
  buf_append_crlf(buf);
}

void out_bulk_str(Buffer &buf, char const *s, size_t size) {
  buf.append_u8(k_sigil_bulk_str);          // sigil
  buf.append_str(std::to_string(size));     // len
  buf_append_crlf(buf);
  buf.append((uint8_t const *)s, size);     // data
  buf_append_crlf(buf);
}

void resp_encode(Buffer &buf, RespValue const &val) {
  switch (val.type) {
  case RESP_SIMPLE_STR:
    return out_simple_str(buf, val.str.data(), val.str.size());
  case RESP_BULK_STR:
    return out_bulk_str(buf, val.str.data(), val.str.size());
  case RESP_NULL:
  default:
    return out_null(buf);
  }
}

std::string resp_encode_str(RespValue const &val) {
  Buffer buf(val.str.size() + 32);
  resp_encode(buf, val);
  return buf.readable_str();
}
