#include "resplite/proto/buffer.hh"
#include <string.h>
#include <algorithm>

// move the unread bytes into `new_buf` (may be `buf` itself) at offset 0
static void relocate(Buffer &b, std::vector<uint8_t> &new_buf) {
  size_t const unread_len = b.readable_size();
  if (unread_len) {
    memmove(new_buf.data(), b.buf.data() + b.readable_begin, unread_len);
  }
  b.readable_begin = 0;
  b.writable_begin = unread_len;
}

void Buffer::ensure_writable(size_t ensure_size) {
  if (writable_size() >= ensure_size) {
    return;
  }
  // solution 1: move the readable data(not consumed yet) to the front
  if (readable_begin + writable_size() >= ensure_size) {
    relocate(*this, buf);
    return;
  }
  // solution 2: resize the buffer
  size_t new_cap = std::max(capacity() * 2, readable_size() + ensure_size);
  std::vector<uint8_t> new_buf(new_cap);
  relocate(*this, new_buf);
  buf.swap(new_buf);
}

void Buffer::append(uint8_t const *data, size_t n) {
  if (n == 0) {
    return;
  }
  ensure_writable(n);
  memcpy(writable_data(), data, n);
  writable_begin += n;
}

void Buffer::consume(size_t n) {
  n = std::min(n, readable_size());
  readable_begin += n;
  if (readable_begin >= writable_begin) {
    // all consumed, reset
    readable_begin = 0;
    writable_begin = 0;
  }
}

void Buffer::shrink_if_wasteful(size_t hard_min) {
  size_t const unread_len = readable_size();
  if (capacity() > std::max(hard_min, unread_len * 4)) {
    std::vector<uint8_t> new_buf(std::max(hard_min, unread_len * 2));
    relocate(*this, new_buf);
    buf.swap(new_buf);
  }
}
