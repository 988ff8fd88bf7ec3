#pragma once
#include "result.hpp"

// SIGINT handling for the blocking loop. The handler sets a flag and writes
// one byte into a self-pipe so a poll() wait can see the interrupt next to
// its input fd.

Result install_interrupt_handler();   // idempotent
bool interrupt_requested();
int interrupt_fd();                   // read end of the self-pipe, -1 before install
void reset_interrupt();               // clear the flag, drain the pipe
