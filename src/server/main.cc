#include <arpa/inet.h>
#include <errno.h>
#include <netinet/ip.h>
#include <stdint.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <sys/socket.h>
#include <unistd.h>
#include <sys/epoll.h>
#include <string>
#include <vector>

#include "resplite/common/config.hh"
#include "resplite/common/log.hh"
#include "resplite/common/net.hh"
#include "resplite/server/conn.hh"

static void usage(char const *prog) {
  fprintf(stderr, "usage: %s [-h host] [-p port]\n", prog);
}

int main(int argc, char **argv) {
  Config cfg;
  std::string err;
  if (parse_config(argc, argv, cfg, err) < 0 || cfg.first_arg != argc) {
    msg(err.empty() ? "unexpected argument" : err.c_str());
    usage(argv[0]);
    return 1;
  }

  // the listening socket
  int fd = socket(AF_INET, SOCK_STREAM, 0);
  if (fd < 0) {
    die("socket()");
  }
  int val = 1;
  setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &val, sizeof(val));

  struct sockaddr_in addr = {};
  addr.sin_family = AF_INET;
  addr.sin_port = htons(cfg.port);
  if (inet_pton(AF_INET, cfg.host.c_str(), &addr.sin_addr) != 1) {
    die("inet_pton()");
  }
  int rv = bind(fd, (struct sockaddr const *)&addr, sizeof(addr));
  if (rv) {
    die("bind()");
  }
  fd_set_nb(fd);
  rv = listen(fd, SOMAXCONN);
  if (rv) {
    die("listen()");
  }
  fprintf(stderr, "listening on %s:%u\n", cfg.host.c_str(), cfg.port);

  g_data.epoll_fd = epoll_create1(EPOLL_CLOEXEC);
  if (g_data.epoll_fd < 0) {
    die("epoll_create1()");
  }
  struct epoll_event ev = {};
  ev.data.fd = fd;
  ev.events = EPOLLIN | EPOLLERR;
  if (epoll_ctl(g_data.epoll_fd, EPOLL_CTL_ADD, fd, &ev) < 0) {
    die("epoll_ctl(ADD listen)");
  }

  std::vector<struct epoll_event> events(1024);

  // the event loop
  while (true) {
    int n = epoll_wait(g_data.epoll_fd, events.data(), (int)events.size(), -1);
    if (n < 0 && errno == EINTR) {
      continue;  // not an error
    }
    if (n < 0) {
      die("epoll_wait()");
    }
    for (int i = 0; i < n; i++) {
      int evfd = events[i].data.fd;
      uint32_t ready_mask = events[i].events;
      if (evfd == fd) {
        if (ready_mask & EPOLLIN) {
          (void)handle_accept(fd);
        }
        continue;
      }
      Conn *conn = (evfd >= 0 && (size_t)evfd < g_data.fd2conn.size()) ? g_data.fd2conn[evfd] : NULL;
      if (!conn) {
        continue;
      }
      if ((ready_mask & EPOLLIN) && conn->want_read) {
        handle_read(conn);
      }
      if ((ready_mask & EPOLLOUT) && conn->want_write && !conn->want_close) {
        handle_write(conn);
      }
      // close the socket from socket error or application logic
      if ((ready_mask & (EPOLLERR | EPOLLHUP)) || conn->want_close) {
        conn_destroy(conn);
      }
    }
  } // the event loop
  return 0;
}
