#pragma once

#include <stdint.h>
#include <string>

uint16_t const k_default_port = 6379;

struct Config {
  std::string host = "127.0.0.1";  // IPv4 dotted quad
  uint16_t port = k_default_port;
  int first_arg = 1;  // index of the first non-option argument
};

// parse `-h host -p port`, 0 on success, -1 with `err` set otherwise
int32_t parse_config(int argc, char **argv, Config &cfg, std::string &err);
bool parse_port(char const *s, uint16_t &out);
