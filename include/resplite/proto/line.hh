#pragma once

#include <stdint.h>
#include <stddef.h>
#include <string>

struct RespError;

// Low level extraction primitives. Every function reads `data[0, size)`
// starting at `cursor` and moves `cursor` forward by what it consumed.

// bytes up to the next "\r\n", cursor ends right after the terminator
bool extract_line(uint8_t const *data, size_t size, size_t &cursor,
                  std::string &out, RespError &err);
// same as extract_line(), the line must also be valid UTF-8
bool extract_line_str(uint8_t const *data, size_t size, size_t &cursor,
                      std::string &out, RespError &err);
// exactly n raw bytes, cursor untouched on failure
bool extract_bytes(uint8_t const *data, size_t size, size_t &cursor,
                   size_t n, std::string &out, RespError &err);
// consume one byte if it equals `expected`
bool expect_sigil(uint8_t expected, uint8_t const *data, size_t size,
                  size_t &cursor, RespError &err);

bool utf8_valid(uint8_t const *data, size_t size);
