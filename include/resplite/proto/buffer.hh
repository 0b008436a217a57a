#pragma once

#include <vector>
#include <string>
#include <stdint.h>
#include <stddef.h>

// FIFO byte queue: bytes are appended at the back and consumed from the front
struct Buffer {
  std::vector<uint8_t> buf;
  size_t readable_begin = 0;
  size_t writable_begin = 0;

  explicit Buffer(size_t init_cap = 4096) { buf.resize(init_cap); }

  // actual size of the buffer, also upper bound of writable data
  size_t          capacity()      const { return buf.size(); }
  size_t          readable_size() const { return writable_begin - readable_begin; }
  size_t          writable_size() const { return capacity() - writable_begin; }
  uint8_t const * readable_data() const { return buf.data() + readable_begin; }
  uint8_t       * writable_data()       { return buf.data() + writable_begin; }

  void ensure_writable(size_t ensure_size);

  void append(uint8_t const *data, size_t n);
  void append_u8(uint8_t data) { append(&data, 1); }
  void append_str(std::string const &s) {
    append((uint8_t const *)s.data(), s.size());
  }

  void consume(size_t n);

  void shrink_if_wasteful(size_t hard_min = 4096);

  // copy of the readable region
  std::string readable_str() const {
    return std::string((char const *)readable_data(), readable_size());
  }
};
