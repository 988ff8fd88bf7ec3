#include "client_config.hpp"
#include <stdexcept>

namespace {
    constexpr int PORT_MIN = 1;
    constexpr int PORT_MAX = 65535;

    bool parse_port(const std::string& s, int& port) {
        size_t used = 0;
        int v = 0;
        try {
            v = std::stoi(s, &used);
        } catch (const std::exception&) {
            return false;
        }
        if (used != s.size() || v < PORT_MIN || v > PORT_MAX) return false;
        port = v;
        return true;
    }
} // anonymous namespace

void print_usage(const char* prog, std::ostream& out) {
    out << "usage: " << prog << " [--host <name>] [--port <" << PORT_MIN << "-" << PORT_MAX << ">]\n"
        << "  defaults: --host localhost --port 8080\n";
}

ParseStatus parse_args(int argc, char** argv, ClientConfig& cfg, std::ostream& err) {
    for (int i = 1; i < argc; ++i) {
        std::string k = argv[i];

        auto need = [&](const char* flag) -> const char* {
            if (++i >= argc) { err << "missing value for " << flag << "\n"; return nullptr; }
            return argv[i];
        };

        if (k == "--help" || k == "-h") return ParseStatus::Help;
        else if (k == "--host") {
            const char* v = need("--host"); if (!v) return ParseStatus::Error;
            if (*v == '\0') { err << "--host must not be empty\n"; return ParseStatus::Error; }
            cfg.host = v;
        }
        else if (k == "--port") {
            const char* v = need("--port"); if (!v) return ParseStatus::Error;
            if (!parse_port(v, cfg.port)) { err << "invalid port: " << v << "\n"; return ParseStatus::Error; }
        }
        else { err << "unknown flag: " << k << "\n"; return ParseStatus::Error; }
    }
    return ParseStatus::Run;
}
