
#include "emp/employee_service.hpp"
#include "emp/employee_store.hpp"
#include "emp/request_dispatcher.hpp"
#include "logging.hpp"
#include "server_config.hpp"
#include "tcp_server.hpp"
#include <iostream>

#include <spdlog/spdlog.h>


/*
 * Entry point for the server executable.
 * parse CLI args
 * wire store -> service -> dispatcher -> server
 * block until SIGINT/SIGTERM
 */

int main(int argc, char** argv) {
    emp::ServerConfig config;
    try {
        config = emp::parse_args(argc, argv);
    } catch (const emp::ConfigError& e) {
        std::cerr << "error: " << e.what() << "\n\n" << emp::usage();
        return 1;
    }

    if (config.show_help) {
        std::cout << emp::usage();
        return 0;
    }

    int status = 0;
    try {
        emp::init_logging(config.log_level, config.log_file);

        emp::EmployeeStore store;
        emp::EmployeeService service{store};
        if (config.seed)
            emp::seed_sample_employees(service);

        emp::RequestDispatcher dispatcher{service, config.base_path};
        emp::TcpServer server{dispatcher, config.port, config.workers};
        spdlog::info("Serving employees under {} with {} workers", dispatcher.base_path(), config.workers);
        server.start();
    } catch (const std::exception& e) {
        spdlog::critical("Fatal: {}", e.what());
        status = 1;
    }

    spdlog::shutdown();
    return status;
}
