#pragma once

#include <optional>
#include <string>
#include <vector>
#include <core/types.hpp>

struct CliOptions {
    TransferRequest request;
    std::optional<std::string> config_path;
    std::optional<std::string> user;
    std::optional<int> port;   // overrides server.default_port
    bool verbose = false;
};

// Parse the arguments following "get" / "put".
//   -l, --local <path>      local file (put) or destination directory (get)
//   -r, --remote <path>     remote file (get) or target path (put)
//   -H, --hosts <h1,h2>     target hosts, repeatable
//   -o, --overwrite         replace existing remote files (put)
//   -R, --recursive         rejected: not supported
//   -c, --config <file>     config file (default ~/.hostcp/config.yaml)
//   -u, --user <name>       login user
//   -p, --port <n>          default port for hosts without one
//   -v, --verbose           print progress
Result<CliOptions> parse_transfer_args(TransferDirection direction,
                                       const std::vector<std::string>& args);

class HostcpCLI {
public:
    // Each returns the process exit code
    int run_transfer(TransferDirection direction, const std::vector<std::string>& args);
    int run_setup();
    int run_init_config();
};
