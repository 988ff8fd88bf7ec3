#include "connector_loop.hpp"
#include <algorithm>
#include <cctype>

namespace {
    // ---- Operator-facing text ----
    const char* PROMPT           = "Enter message to send (or 'exit' to quit): ";
    const char* EXIT_NOTICE      = "Exiting...";
    const char* INTERRUPT_NOTICE = "Interrupted by user, closing connection.";
    const std::string EXIT_WORD  = "exit";
} // anonymous namespace

bool is_exit_command(const std::string& line) {
    auto not_space = [](unsigned char c) { return !std::isspace(c); };
    auto first = std::find_if(line.begin(), line.end(), not_space);
    auto last  = std::find_if(line.rbegin(), line.rend(), not_space).base();
    if (first >= last) return false;

    std::string word(first, last);
    std::transform(word.begin(), word.end(), word.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return word == EXIT_WORD;
}

ConnectorLoop::ConnectorLoop(const ClientConfig& cfg_, std::ostream& out_)
    : cfg(cfg_), out(out_) {}

TCPConnector* ConnectorLoop::connect() {
    st = LoopState::Connecting;
    conn = std::make_unique<TCPConnector>(cfg.host, cfg.port);

    Result r = conn->open_connection();
    if (!r.is_ok()) {
        out << "Error connecting to server: " << r.reason << std::endl;
        conn.reset();
        return nullptr;
    }
    out << "Connected to " << cfg.host << ":" << cfg.port << std::endl;
    st = LoopState::AwaitingInput;
    return conn.get();
}

LoopState ConnectorLoop::finish(LoopState terminal) {
    st = terminal;
    return st;
}

LoopState ConnectorLoop::run(OperatorInput& input) {
    if (!conn || !conn->is_open()) {
        out << "Error sending data: not connected" << std::endl;
        return finish(LoopState::ClosedError);
    }

    std::string line;
    for (;;) {
        st = LoopState::AwaitingInput;
        out << PROMPT << std::flush;

        Result r = input.read_line(line);
        switch (r.outcome) {
            case Outcome::Success:
                break;
            case Outcome::Interrupted:
                out << INTERRUPT_NOTICE << std::endl;
                return finish(LoopState::ClosedInterrupted);
            case Outcome::EndOfInput:
                out << "\n";
                line = EXIT_WORD;
                break;
            case Outcome::Failure:
                out << "\nError reading input: " << r.reason << std::endl;
                return finish(LoopState::ClosedError);
        }

        if (is_exit_command(line)) {
            out << EXIT_NOTICE << std::endl;
            conn->close_connection();
            return finish(LoopState::ClosedNormal);
        }

        st = LoopState::Sending;
        r = conn->send_all(line);
        if (r.outcome == Outcome::Interrupted) {
            out << INTERRUPT_NOTICE << std::endl;
            return finish(LoopState::ClosedInterrupted);
        }
        if (!r.is_ok()) {
            out << "Error sending data: " << r.reason << std::endl;
            return finish(LoopState::ClosedError);
        }
    }
}
