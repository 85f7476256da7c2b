#include <wrtpoll/config.hpp>
#include <wrtpoll/router.hpp>

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/async.h>
#include <spdlog/fmt/fmt.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <chrono>
#include <cstdlib>
#include <exception>
#include <limits>
#include <thread>

static void init_logging(const std::string& log_level, const std::string& log_file) {
    spdlog::init_thread_pool(8192, 1);
    auto lvl = spdlog::level::info;
    if (log_level == "trace") {
        lvl = spdlog::level::trace;
    } else if (log_level == "debug") {
        lvl = spdlog::level::debug;
    } else if (log_level == "info") {
        lvl = spdlog::level::info;
    } else if (log_level == "warning") {
        lvl = spdlog::level::warn;
    } else if (log_level == "error") {
        lvl = spdlog::level::err;
    } else if (log_level == "off") {
        lvl = spdlog::level::off;
    }
    if (!log_file.empty()) {
        auto logger = spdlog::create_async<spdlog::sinks::basic_file_sink_mt>("logfile", log_file);
        logger->set_level(lvl);
        spdlog::set_default_logger(std::move(logger));
    } else {
        auto logger = spdlog::create_async<spdlog::sinks::stderr_color_sink_mt>("console");
        logger->set_level(lvl);
        spdlog::set_default_logger(std::move(logger));
    }
}

static int print_devices(Router& router) {
    for (const auto& [mac, device] : router.connected_devices()) {
        fmt::print("{} {} {}\n", mac, device.ip.value_or("-"), device.name.value_or("-"));
    }
    return 0;
}

static int print_totals(Router& router) {
    auto totals = router.totals(false);
    if (!totals) {
        spdlog::error("could not read interface counters");
        return 1;
    }
    fmt::print("rx {} tx {}\n", totals->rx, totals->tx);
    return 0;
}

static int print_rates(Router& router, float interval, int count) {
    const auto period = std::chrono::duration_cast<std::chrono::steady_clock::duration>(std::chrono::duration<float>(interval));
    router.current_rates(false);
    for (int i = 0; count == 0 || i < count; ++i) {
        std::this_thread::sleep_for(period);
        auto rates = router.current_rates_human_readable(false);
        if (!rates) {
            spdlog::warn("no transfer rate available");
            continue;
        }
        fmt::print("rx {} tx {}\n", rates->first, rates->second);
    }
    return 0;
}

int wrtpoll(int argc, const char* const* argv) {
    Config config;
    std::string log_level{"info"};
    std::string log_file;
    std::string mode{"router"};
    bool telnet = false;
    float interval = 2.0f;
    int count = 5;

    CLI::App app("Wrtpoll");
    app.add_option("-l,--log-level", log_level, "Logging level: trace, debug, info, warning, error, off")->capture_default_str();
    app.add_option("--log-file", log_file, "File to write logs to (stderr if not specified)");
    app.add_option("--host", config.host, "Router address")->required();
    app.add_option("--port", config.port, "Port of the remote shell (22 for ssh, 23 for telnet if not specified)");
    app.add_flag("--telnet", telnet, "Connect over telnet instead of ssh");
    app.add_option("-u,--username", config.username, "Login name");
    app.add_option("-p,--password", config.password, "Login password");
    app.add_option("-k,--ssh-key", config.key_file, "Private key file for ssh authentication")->check(CLI::ExistingFile);
    app.add_option("--mode", mode, "Operating mode of the router")->capture_default_str()->check(CLI::IsMember({"router", "ap"}));
    app.add_flag("--require-ip", config.require_ip, "Only report devices with a known ip address");
    app.add_option("--cache-time", config.cache_window, "Seconds interface counters are reused before being read again")->capture_default_str()->check(CLI::NonNegativeNumber);
    app.add_option("--timeout", config.timeout, "Seconds to wait for the router before giving up (0 waits forever)")->capture_default_str()->check(CLI::Range(0.0f, 86400.0f));

    auto devices_cmd = app.add_subcommand("devices", "List the devices connected to the router");
    auto totals_cmd = app.add_subcommand("totals", "Print the received and transmitted byte totals of the WAN interface");
    auto rates_cmd = app.add_subcommand("rates", "Poll the WAN interface and print transfer rates");
    rates_cmd->add_option("-i,--interval", interval, "Seconds between polls")->capture_default_str()->check(CLI::PositiveNumber);
    rates_cmd->add_option("-c,--count", count, "Number of rates to print (0 polls until interrupted)")->capture_default_str()->check(CLI::Range(0, std::numeric_limits<int>::max()));
    app.require_subcommand(1);

    CLI11_PARSE(app, argc, argv);

    init_logging(log_level, log_file);

    config.transport = telnet ? TransportKind::telnet : TransportKind::ssh;
    config.mode = mode == "ap" ? Mode::access_point : Mode::router;
    if (config.key_file.empty() && config.password.empty()) {
        spdlog::warn("neither a password nor an ssh key was given");
    }
    if (telnet && !config.key_file.empty()) {
        spdlog::warn("ssh key is ignored for telnet connections");
    }

    Router router{config};
    if (app.got_subcommand(devices_cmd)) {
        return print_devices(router);
    } else if (app.got_subcommand(totals_cmd)) {
        return print_totals(router);
    } else if (app.got_subcommand(rates_cmd)) {
        return print_rates(router, interval, count);
    }
    spdlog::error("unknown command");
    return 1;
}

int main(int argc, char** argv) {
    int rc = 1;
    try {
        rc = wrtpoll(argc, argv);
    } catch (const std::exception& e) {
        spdlog::error("{}", e.what());
    }
    spdlog::shutdown();
    return rc;
}
