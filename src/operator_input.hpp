#pragma once
#include <string>

#include "result.hpp"

// Line reader over a file descriptor (stdin in production). Waits on the
// input fd and the interrupt self-pipe together.
class OperatorInput {
    int fd;
    std::string pending;   // bytes read past the last returned line
    bool eof{false};

public:
    explicit OperatorInput(int fd);

    // One line without its trailing '\n'. EndOfInput once the fd is drained.
    Result read_line(std::string& line);
};
