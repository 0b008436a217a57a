#include "resplite/common/config.hh"
#include <arpa/inet.h>
#include <sys/socket.h>
#include <errno.h>
#include <stdlib.h>
#include <unistd.h>

bool parse_port(char const *s, uint16_t &out) {
  if (!s || *s < '0' || *s > '9') {
    return false;
  }
  char *endp = NULL;
  errno = 0;
  unsigned long v = strtoul(s, &endp, 10);
  if (errno || *endp != '\0' || v == 0 || v > 65535) {
    return false;
  }
  out = (uint16_t)v;
  return true;
}

int32_t parse_config(int argc, char **argv, Config &cfg, std::string &err) {
  optind = 1;  // allow repeated calls
  opterr = 0;
  int opt = 0;
  while ((opt = getopt(argc, argv, "+h:p:")) != -1) {
    switch (opt) {
    case 'h': {
      struct in_addr addr = {};
      if (inet_pton(AF_INET, optarg, &addr) != 1) {
        err = std::string("bad host: ") + optarg;
        return -1;
      }
      cfg.host = optarg;
      break;
    }
    case 'p':
      if (!parse_port(optarg, cfg.port)) {
        err = std::string("bad port: ") + optarg;
        return -1;
      }
      break;
    default:
      err = "unknown option or missing value";
      return -1;
    }
  }
  cfg.first_arg = optind;
  return 0;
}
