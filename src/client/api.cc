#include "resplite/client/api.hh"
#include "resplite/common/log.hh"
#include "resplite/common/net.hh"
#include "resplite/proto/buffer.hh"
#include <errno.h>
#include <stdio.h>
#include <unistd.h>

int32_t send_value(int fd, RespValue const &val) {
  std::string wire = resp_encode_str(val);
  if (wire.size() > k_max_msg) {
    msg("request too large");
    return -1;
  }
  return write_all(fd, wire.data(), wire.size());
}

int32_t read_value(int fd, Buffer &rbuf, RespValue &out) {
  while (true) {
    if (rbuf.readable_size() > 0) {
      size_t cursor = 0;
      RespError err;
      if (resp_decode(rbuf.readable_data(), rbuf.readable_size(), cursor, out, err)) {
        rbuf.consume(cursor);
        return 0;
      }
      if (err.code != RESP_ERR_OUT_OF_BOUNDS) {
        fprintf(stderr, "bad response: %s\n", resp_err_str(err).c_str());
        return -1;
      }
      if (rbuf.readable_size() > k_max_msg) {
        msg("response too large");
        return -1;
      }
    }
    // incomplete, read more
    uint8_t tmp[4096];
    ssize_t rv = read(fd, tmp, sizeof(tmp));
    if (rv < 0 && errno == EINTR) {
      continue;
    }
    if (rv < 0) {
      msg_errno("read() error");
      return -1;
    }
    if (rv == 0) {
      msg("EOF");
      return -1;
    }
    rbuf.append(tmp, (size_t)rv);
  }
}

std::string format_value(RespValue const &val) {
  switch (val.type) {
  case RESP_SIMPLE_STR:
    return "(str) " + val.str;
  case RESP_BULK_STR:
    return "(bulk) " + val.str;
  default:
    return "(nil)";
  }
}
