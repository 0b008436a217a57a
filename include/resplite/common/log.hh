#pragma once

// stderr logging
void msg(char const *msg);
void msg_errno(char const *msg);
// log and abort, for unrecoverable setup failures only
[[noreturn]] void die(char const *msg);
