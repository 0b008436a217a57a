#pragma once

#include <stdint.h>
#include <vector>

#include "resplite/proto/buffer.hh"

struct Conn {
  int fd = -1;
  // application's intention, for the event loop
  bool want_read = false;
  bool want_write = false;
  bool want_close = false;
  // buffered input and output, owned by this connection only
  Buffer incoming;
  Buffer outgoing;
};

struct ServerData {
  // a map of all client connections, keyed by fd
  std::vector<Conn *> fd2conn;
  // epoll instance fd
  int epoll_fd = -1;
};
extern ServerData g_data;

int32_t handle_accept(int fd);
void handle_read(Conn *conn);
void handle_write(Conn *conn);
void conn_destroy(Conn *conn);
// sync the epoll interest set with want_read/want_write
void conn_update_events(Conn *conn);

// decode frames from `conn->incoming` and queue replies
bool try_process_one_request(Conn *conn);
