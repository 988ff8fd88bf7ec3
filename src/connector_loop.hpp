#pragma once
#include <memory>
#include <ostream>

#include "client_config.hpp"
#include "operator_input.hpp"
#include "tcp_connector.hpp"

enum class LoopState {
    Connecting,
    AwaitingInput,
    Sending,
    ClosedNormal,        // "exit" or end of input, connection closed
    ClosedError,         // send/read failure, connection left as is
    ClosedInterrupted    // SIGINT, connection left as is
};

// Connects once, then forwards operator lines to the peer until exit,
// error or interrupt. All notices go to `out`.
class ConnectorLoop {
    ClientConfig cfg;
    std::ostream& out;
    std::unique_ptr<TCPConnector> conn;
    LoopState st{LoopState::Connecting};

    LoopState finish(LoopState terminal);

public:
    ConnectorLoop(const ClientConfig& cfg, std::ostream& out);

    // nullptr when the connection could not be made
    TCPConnector* connect();
    LoopState run(OperatorInput& input);

    LoopState state() const { return st; }
    TCPConnector* connection() const { return conn.get(); }
};

bool is_exit_command(const std::string& line);
