#include <iostream>
#include <vector>
#include <string>
#include "cli/hostcp_cli.hpp"
#include "cli/theme.hpp"

static const char* HOSTCP_VERSION = "0.1.0";

void print_usage() {
    std::cout << theme::section("Usage");
    std::cout << theme::usage_row("hostcp get -r <remote> -l <dir> -H <hosts>",
                                  "Fetch a file from every host");
    std::cout << theme::usage_row("hostcp put -l <file> -r <remote> -H <hosts>",
                                  "Send a file to every host");
    std::cout << theme::usage_row("hostcp setup", "Store user and password");
    std::cout << theme::usage_row("hostcp init-config", "Write ~/.hostcp/config.yaml");
    std::cout << "\n";
    std::cout << theme::dim("    Options: -o/--overwrite  -c/--config <file>  -u/--user <name>\n"
                            "             -p/--port <n>  -v/--verbose\n"
                            "    Hosts are comma separated and may carry :port.\n"
                            "    Fetched files are named <stem>-<peer-ip>.<ext>.")
              << "\n\n";
    std::cout << theme::dim("    hostcp --version        Show version\n"
                            "    hostcp --help           Show this help")
              << "\n\n";
}

int main(int argc, char** argv) {
    try {
        HostcpCLI cli;

        if (argc < 2) {
            print_usage();
            return 1;
        }

        std::string cmd = argv[1];
        std::vector<std::string> rest(argv + 2, argv + argc);

        if (cmd == "--version") {
            std::cout << theme::bold("hostcp") << theme::dim(std::string(" version ") + HOSTCP_VERSION)
                      << "\n";
            return 0;
        } else if (cmd == "--help" || cmd == "-h") {
            print_usage();
            return 0;
        } else if (cmd == "get") {
            return cli.run_transfer(TransferDirection::Fetch, rest);
        } else if (cmd == "put") {
            return cli.run_transfer(TransferDirection::Send, rest);
        } else if (cmd == "setup") {
            return cli.run_setup();
        } else if (cmd == "init-config") {
            return cli.run_init_config();
        }

        std::cout << theme::fail("Unknown command: " + cmd);
        print_usage();
        return 1;
    } catch (const std::exception& e) {
        std::cout << theme::fail(std::string(e.what()));
        return 1;
    }
}
