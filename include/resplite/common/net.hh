#pragma once

#include <stdint.h>
#include <stddef.h>

void fd_set_nb(int fd);

// blocking write, 0 on success, -1 on error
int32_t write_all(int fd, char const *buf, size_t n);
