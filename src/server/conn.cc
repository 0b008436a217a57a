#include "resplite/server/conn.hh"
#include "resplite/common/log.hh"
#include "resplite/common/net.hh"
#include "resplite/proto/resp.hh"
#include <arpa/inet.h>
#include <sys/socket.h>
#include <errno.h>
#include <stdio.h>
#include <sys/epoll.h>
#include <unistd.h>
#include <assert.h>
#include <string>

ServerData g_data;

void conn_destroy(Conn *conn) {
  if (g_data.epoll_fd >= 0) {
    (void)epoll_ctl(g_data.epoll_fd, EPOLL_CTL_DEL, conn->fd, NULL);
  }
  (void)close(conn->fd);
  g_data.fd2conn[conn->fd] = NULL;
  delete conn;
}

void conn_update_events(Conn *conn) {
  if (g_data.epoll_fd < 0) {
    return;
  }
  struct epoll_event ev = {};
  ev.data.fd = conn->fd;
  ev.events = EPOLLERR;
  if (conn->want_read) {
    ev.events |= EPOLLIN;
  }
  if (conn->want_write) {
    ev.events |= EPOLLOUT;
  }
  if (epoll_ctl(g_data.epoll_fd, EPOLL_CTL_MOD, conn->fd, &ev) < 0) {
    msg_errno("epoll_ctl(MOD)");
    conn->want_close = true;
  }
}

// application callback when the listening socket is ready
int32_t handle_accept(int fd) {
  struct sockaddr_in client_addr = {};
  socklen_t addr_len = sizeof(client_addr);
  int connfd = accept(fd, (struct sockaddr *)&client_addr, &addr_len);
  if (connfd < 0) {
    if (errno != EAGAIN) {
      msg_errno("accept() error");
    }
    return -1;
  }
  char ip[INET_ADDRSTRLEN] = {};
  inet_ntop(AF_INET, &client_addr.sin_addr, ip, sizeof(ip));
  fprintf(stderr, "new client from %s:%u\n", ip, ntohs(client_addr.sin_port));

  fd_set_nb(connfd);
  Conn *conn = new Conn();
  conn->fd = connfd;
  conn->want_read = true;
  if (g_data.fd2conn.size() <= (size_t)conn->fd) {
    g_data.fd2conn.resize(conn->fd + 1);
  }
  assert(!g_data.fd2conn[conn->fd]);
  g_data.fd2conn[conn->fd] = conn;

  struct epoll_event ev = {};
  ev.data.fd = connfd;
  ev.events = EPOLLIN | EPOLLERR;
  if (epoll_ctl(g_data.epoll_fd, EPOLL_CTL_ADD, connfd, &ev) < 0) {
    msg_errno("epoll_ctl(ADD conn)");
    conn_destroy(conn);
    return -1;
  }
  return 0;
}

// process 1 frame if the incoming buffer holds a complete one
bool try_process_one_request(Conn *conn) {
  Buffer &in = conn->incoming;
  if (in.readable_size() == 0) {
    return false;  // want read
  }
  size_t cursor = 0;
  RespValue val;
  RespError err;
  if (!resp_decode(in.readable_data(), in.readable_size(), cursor, val, err)) {
    if (err.code == RESP_ERR_OUT_OF_BOUNDS) {
      // incomplete frame, wait for more bytes unless it can never fit
      if (in.readable_size() > k_max_msg) {
        msg("request too large");
        conn->want_close = true;
      }
      return false;
    }
    fprintf(stderr, "bad request: %s\n", resp_err_str(err).c_str());
    conn->want_close = true;
    return false;  // want close
  }
  out_simple_str(conn->outgoing, "PONG", 4);
  // application logic done, remove the frame from the incoming buffer
  in.consume(cursor);
  return true;
}

// single best-effort write, the connection is about to be destroyed
static void flush_before_close(Conn *conn) {
  if (conn->outgoing.readable_size() == 0) {
    return;
  }
  ssize_t rv = write(conn->fd, conn->outgoing.readable_data(), conn->outgoing.readable_size());
  if (rv < 0) {
    if (errno != EAGAIN) {
      msg_errno("write() error");
    }
    return;
  }
  conn->outgoing.consume((size_t)rv);
}

void handle_read(Conn *conn) {
  uint8_t buf[64 * 1024];
  ssize_t rv = read(conn->fd, buf, sizeof(buf));
  if (rv < 0 && (errno == EAGAIN || errno == EINTR)) {
    return;  // actually not ready
  }
  // handle IO error
  if (rv < 0) {
    msg_errno("read() error");
    conn->want_close = true;
    return;
  }
  // handle EOF
  if (rv == 0) {
    if (conn->incoming.readable_size() == 0) {
      msg("client closed");
    } else {
      msg("unexpected EOF");
    }
    conn->want_close = true;
    return;
  }
  conn->incoming.append(buf, (size_t)rv);
  // pipelined frames are answered in order
  while (try_process_one_request(conn)) {}
  if (conn->incoming.readable_size() == 0) {
    conn->incoming.shrink_if_wasteful();
  }
  if (conn->want_close) {
    // replies to the frames before the bad one still go out
    flush_before_close(conn);
    return;
  }
  if (conn->outgoing.readable_size() > 0) {  // has a response
    conn->want_read = false;
    conn->want_write = true;
    // The socket is likely ready to write in a request-response protocol,
    // try to write it without waiting for the next iteration.
    return handle_write(conn);
  }
}

// application callback when the socket is writable
void handle_write(Conn *conn) {
  assert(conn->outgoing.readable_size() > 0);
  ssize_t rv = write(conn->fd, conn->outgoing.readable_data(), conn->outgoing.readable_size());
  if (rv < 0 && (errno == EAGAIN || errno == EINTR)) {
    conn_update_events(conn);
    return;  // actually not ready
  }
  if (rv < 0) {
    msg_errno("write() error");
    conn->want_close = true;
    return;
  }
  conn->outgoing.consume((size_t)rv);
  if (conn->outgoing.readable_size() == 0) {  // all data written
    conn->want_write = false;
    conn->want_read = true;
    conn->outgoing.shrink_if_wasteful(1u << 20);
  }
  conn_update_events(conn);
}
