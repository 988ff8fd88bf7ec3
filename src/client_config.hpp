#pragma once
#include <ostream>
#include <string>

// Where the client connects. Defaults: localhost:8080.
struct ClientConfig {
    std::string host = "localhost";
    int         port = 8080;
};

enum class ParseStatus { Run, Help, Error };

// Parses [--host <name>] [--port <n>] [--help]. Problems go to err.
ParseStatus parse_args(int argc, char** argv, ClientConfig& cfg, std::ostream& err);
void print_usage(const char* prog, std::ostream& out);
