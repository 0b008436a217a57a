#include "resplite/common/log.hh"
#include <stdio.h>
#include <errno.h>
#include <stdlib.h>
#include <string.h>

void msg(char const *msg) { fprintf(stderr, "%s\n", msg); }
void msg_errno(char const *msg) {
  int err = errno;
  fprintf(stderr, "[%d] %s: %s\n", err, msg, strerror(err));
}
void die(char const *msg) {
  int err = errno;
  fprintf(stderr, "[%d] %s\n", err, msg);
  abort();
}
