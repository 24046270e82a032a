#include "hostcp_cli.hpp"
#include "theme.hpp"
#include <core/config.hpp>
#include <core/credentials.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <platform/platform.hpp>
#include <ssh/auth.hpp>
#include <transfer/connection_pool.hpp>
#include <transfer/naming.hpp>
#include <transfer/report.hpp>
#include <transfer/transfer_orchestrator.hpp>
#include <iostream>
#include <mutex>

Result<CliOptions> parse_transfer_args(TransferDirection direction,
                                       const std::vector<std::string>& args) {
    CliOptions opts;
    opts.request.direction = direction;

    auto value_of = [&](size_t& i, const std::string& flag) -> Result<std::string> {
        if (i + 1 >= args.size()) {
            return Result<std::string>::Err("Missing value for " + flag, ErrorKind::Config);
        }
        return Result<std::string>::Ok(args[++i]);
    };

    for (size_t i = 0; i < args.size(); i++) {
        const std::string& a = args[i];

        if (a == "-o" || a == "--overwrite") {
            opts.request.overwrite = true;
        } else if (a == "-R" || a == "--recursive") {
            opts.request.recursive = true;
        } else if (a == "-v" || a == "--verbose") {
            opts.verbose = true;
        } else if (a == "-l" || a == "--local" || a == "-r" || a == "--remote" ||
                   a == "-H" || a == "--hosts" || a == "-c" || a == "--config" ||
                   a == "-u" || a == "--user" || a == "-p" || a == "--port") {
            auto v = value_of(i, a);
            if (v.is_err()) return propagate<CliOptions>(v);

            if (a == "-l" || a == "--local") {
                opts.request.local_path = v.value;
            } else if (a == "-r" || a == "--remote") {
                opts.request.remote_path = v.value;
            } else if (a == "-H" || a == "--hosts") {
                for (auto& h : split_list(v.value, ',')) opts.request.hosts.push_back(h);
            } else if (a == "-c" || a == "--config") {
                opts.config_path = v.value;
            } else if (a == "-u" || a == "--user") {
                opts.user = v.value;
            } else {
                auto port = parse_port(v.value);
                if (port.is_err()) return propagate<CliOptions>(port);
                opts.port = port.value;
            }
        } else {
            return Result<CliOptions>::Err("Unknown option: " + a, ErrorKind::Config);
        }
    }

    if (opts.request.local_path.empty()) {
        return Result<CliOptions>::Err("Missing --local path", ErrorKind::Config);
    }
    if (opts.request.remote_path.empty()) {
        return Result<CliOptions>::Err("Missing --remote path", ErrorKind::Config);
    }
    if (opts.request.hosts.empty()) {
        return Result<CliOptions>::Err("Missing --hosts", ErrorKind::Config);
    }
    return Result<CliOptions>::Ok(opts);
}

int HostcpCLI::run_transfer(TransferDirection direction, const std::vector<std::string>& args) {
    auto parsed = parse_transfer_args(direction, args);
    if (parsed.is_err()) {
        std::cout << theme::fail(parsed.error);
        return 1;
    }
    const CliOptions& opts = parsed.value;

    auto config_result = opts.config_path ? Config::load(*opts.config_path)
                                          : Config::load_default();
    if (config_result.is_err()) {
        std::cout << theme::fail(config_result.error);
        return 1;
    }
    Config config = config_result.value;
    if (opts.user) config.set_user(*opts.user);
    if (opts.port) config.set_default_port(*opts.port);

    hostcp_log(fmt::format("cli: {} local={} remote={} hosts={}",
                           direction == TransferDirection::Fetch ? "get" : "put",
                           opts.request.local_path, opts.request.remote_path,
                           opts.request.hosts.size()));

    PoolOptions pool_opts;
    pool_opts.default_port = config.server().default_port;
    pool_opts.timeout = config.server().timeout;
    pool_opts.host_key_policy = config.server().host_key_policy;

    ConnectionPool pool(pool_opts);
    ConfigAuthProvider auth(config.auth(), CredentialManager::instance());
    TransferOrchestrator orchestrator(pool, auth, config.transfer().max_size);

    std::mutex out_mutex;
    if (opts.verbose) {
        orchestrator.set_status_callback([&out_mutex](const std::string& msg) {
            std::lock_guard<std::mutex> lock(out_mutex);
            std::cout << theme::log(msg) << std::flush;
        });
    }
    orchestrator.set_error_sink([&out_mutex](const HostFailure& failure) {
        std::lock_guard<std::mutex> lock(out_mutex);
        std::cerr << format_failure(failure) << "\n" << std::flush;
    });

    auto result = orchestrator.run(opts.request);
    if (result.is_err()) {
        std::cout << theme::fail(fmt::format("[{}] {}", error_kind_name(result.kind), result.error));
        return 1;
    }

    const TransferReport& report = result.value;
    print_report(report, std::cout);
    return report.all_succeeded() ? 0 : 1;
}

int HostcpCLI::run_setup() {
    auto& creds = CredentialManager::instance();
    std::cout << theme::section("Store credentials");

    std::cout << "    User: " << std::flush;
    std::string user;
    std::getline(std::cin, user);
    trim(user);
    if (user.empty()) {
        std::cout << theme::fail("User cannot be empty");
        return 1;
    }

    std::string password = platform::read_secret("    Password (empty to skip): ");

    auto set_user = creds.set("user", user);
    if (set_user.is_err()) {
        std::cout << theme::fail(set_user.error);
        return 1;
    }
    if (!password.empty()) {
        auto set_pass = creds.set("password", password);
        if (set_pass.is_err()) {
            std::cout << theme::fail(set_pass.error);
            return 1;
        }
    }

    std::cout << theme::ok("Saved to " + creds.path().string());
    return 0;
}

int HostcpCLI::run_init_config() {
    bool existed = config_exists();
    auto result = create_default_config();
    if (result.is_err()) {
        std::cout << theme::fail(result.error);
        return 1;
    }
    if (existed) {
        std::cout << theme::info("Config already exists: " + get_config_path().string());
    } else {
        std::cout << theme::ok("Wrote " + get_config_path().string());
    }
    return 0;
}
