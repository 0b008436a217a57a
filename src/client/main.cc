#include <arpa/inet.h>
#include <netinet/ip.h>
#include <stdint.h>
#include <stdio.h>
#include <string.h>
#include <sys/socket.h>
#include <unistd.h>
#include <string>
#include <vector>

#include "resplite/client/api.hh"
#include "resplite/common/config.hh"
#include "resplite/common/log.hh"
#include "resplite/proto/buffer.hh"

static void usage(char const *prog) {
  fprintf(stderr, "usage: %s [-h host] [-p port] [arg...]\n", prog);
}

int main(int argc, char **argv) {
  Config cfg;
  std::string err;
  if (parse_config(argc, argv, cfg, err) < 0) {
    msg(err.c_str());
    usage(argv[0]);
    return 1;
  }

  // one bulk string per argument, PING when there are none
  std::vector<RespValue> reqs;
  for (int i = cfg.first_arg; i < argc; i++) {
    reqs.push_back(resp_bulk_str(argv[i]));
  }
  if (reqs.empty()) {
    reqs.push_back(resp_simple_str("PING"));
  }

  int fd = socket(AF_INET, SOCK_STREAM, 0);
  if (fd < 0) {
    die("socket()");
  }
  struct sockaddr_in addr = {};
  addr.sin_family = AF_INET;
  addr.sin_port = htons(cfg.port);
  if (inet_pton(AF_INET, cfg.host.c_str(), &addr.sin_addr) != 1) {
    die("inet_pton()");
  }
  int rv = connect(fd, (struct sockaddr const *)&addr, sizeof(addr));
  if (rv) {
    die("connect()");
  }

  Buffer rbuf;
  int status = 0;
  for (RespValue const &req : reqs) {
    RespValue res;
    if (send_value(fd, req) < 0 || read_value(fd, rbuf, res) < 0) {
      status = 1;
      break;
    }
    printf("%s\n", format_value(res).c_str());
  }
  close(fd);
  return status;
}
