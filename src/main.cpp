#include <iostream>
#include <unistd.h>

#include "client_config.hpp"
#include "connector_loop.hpp"
#include "interrupt_signal.hpp"
#include "operator_input.hpp"

int main(int argc, char* argv[]) {
    ClientConfig config;
    switch (parse_args(argc, argv, config, std::cerr)) {
        case ParseStatus::Help:
            print_usage(argv[0], std::cout);
            return 0;
        case ParseStatus::Error:
            print_usage(argv[0], std::cerr);
            return 2;
        case ParseStatus::Run:
            break;
    }

    ConnectorLoop loop(config, std::cout);
    if (!loop.connect()) return 0;

    Result r = install_interrupt_handler();
    if (!r.is_ok()) {
        std::cout << "Error installing interrupt handler: " << r.reason << std::endl;
        return 0;
    }

    OperatorInput input(STDIN_FILENO);
    loop.run(input);
    return 0;
}
