#pragma once

#include <stdint.h>
#include <string>

#include "resplite/proto/resp.hh"

struct Buffer;

// encode `val` and write it out
int32_t send_value(int fd, RespValue const &val);
// read until one complete value decodes from `rbuf`, consume it
int32_t read_value(int fd, Buffer &rbuf, RespValue &out);
// "(nil)", "(str) text" or "(bulk) text"
std::string format_value(RespValue const &val);
