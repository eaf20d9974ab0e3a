#include <atomic>
#include <cstdint>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <memory>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "config.hpp"
#include "digest.hpp"
#include "interrupt.hpp"
#include "logger.hpp"
#include "networking.hpp"
#include "orchestrator.hpp"
#include "protocol/errors.hpp"
#include "protocol/file_meta.hpp"
#include "retry.hpp"

namespace fs = std::filesystem;

namespace {

struct CliArgs {
    std::vector<std::string> positional;
    std::string config_path;
    std::size_t chunk_size = 0;
    bool verbose = false;
};

void print_usage() {
    std::cerr << "Usage:\n"
              << "  labxfer serve <port> <file>          wait for a peer and send it <file>\n"
              << "  labxfer collect <port> [dir]         wait for a peer and receive one file\n"
              << "  labxfer push <host> <port> <file>    connect and send <file>\n"
              << "  labxfer fetch <host> <port> [dir]    connect and receive one file\n"
              << "Options:\n"
              << "  --config <file.json>   load settings\n"
              << "  --chunk-size <bytes>   body chunk size\n"
              << "  --verbose              log debug messages to the console\n";
}

bool parse_args(int argc, char* argv[], CliArgs& args) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            args.config_path = argv[++i];
        } else if (arg == "--chunk-size" && i + 1 < argc) {
            args.chunk_size = config::parse_chunk_size(argv[++i]);
        } else if (arg == "--verbose") {
            args.verbose = true;
        } else if (arg.rfind("--", 0) == 0) {
            std::cerr << "Unknown option: " << arg << "\n";
            return false;
        } else {
            args.positional.push_back(arg);
        }
    }
    return !args.positional.empty();
}

// Index of the port argument, or 0 if the command line matches no command.
std::size_t port_index(const std::vector<std::string>& positional) {
    const std::string& command = positional[0];
    const std::size_t argn = positional.size();
    if ((command == "serve" && argn == 3) || (command == "collect" && (argn == 2 || argn == 3))) {
        return 1;
    }
    if ((command == "push" && argn == 4) || (command == "fetch" && (argn == 3 || argn == 4))) {
        return 2;
    }
    return 0;
}

std::unique_ptr<logging::Logger> make_logger(const config::AppConfig& cfg, bool verbose) {
    std::vector<std::shared_ptr<logging::Logger>> sinks;
    sinks.push_back(std::make_shared<logging::ConsoleLogger>(verbose ? logging::LogLevel::DEBUG : cfg.log.level));
    if (cfg.log.file) {
        fs::path dir = cfg.log.dir.empty() ? logging::default_log_dir() : fs::path(cfg.log.dir);
        try {
            sinks.push_back(std::make_shared<logging::FileLogger>(cfg.log.name, dir));
        } catch (const std::exception& e) {
            std::cerr << "File logging disabled: " << e.what() << "\n";
        }
    }
    return std::make_unique<logging::TeeLogger>(std::move(sinks));
}

void print_progress(const std::string&, uint64_t done, uint64_t total, double speed_mbps) {
    int percent = (total > 0) ? static_cast<int>((done * 100.0) / total) : 100;
    double speed_bps = speed_mbps * 1024.0 * 1024.0;
    double eta_seconds = (speed_bps > 0) ? ((total - done) / speed_bps) : 0;
    int eta_min = static_cast<int>(eta_seconds) / 60;
    int eta_sec = static_cast<int>(eta_seconds) % 60;

    std::cout << "\r" << percent << "% | "
              << std::fixed << std::setprecision(1) << speed_mbps << " MB/s | "
              << "ETA " << std::setfill('0') << std::setw(2) << eta_min << ":"
              << std::setfill('0') << std::setw(2) << eta_sec << "    " << std::flush;
    if (done == total) {
        std::cout << "\n";
    }
}

void print_receipt(const transfer::ReceivedFile& file) {
    protocol::FileInfo info{file.path.filename().string(), file.size, digest::file_blake2b_hex(file.path)};
    nlohmann::json j = info;
    std::cout << j.dump(2) << "\n";
}

} // namespace

int main(int argc, char* argv[]) {
    CliArgs args;
    unsigned short port = 0;
    try {
        if (!parse_args(argc, argv, args)) {
            print_usage();
            return 2;
        }
        std::size_t index = port_index(args.positional);
        if (index == 0) {
            print_usage();
            return 2;
        }
        port = config::parse_port(args.positional[index]);
    } catch (const config::ConfigError& e) {
        std::cerr << "Invalid argument: " << e.what() << "\n";
        return 2;
    }

    config::AppConfig cfg;
    try {
        if (!args.config_path.empty()) {
            cfg = config::load_config(args.config_path);
        }
    } catch (const config::ConfigError& e) {
        std::cerr << e.what() << "\n";
        return 2;
    }
    if (args.chunk_size > 0) {
        cfg.chunk_size = args.chunk_size;
    }

    std::unique_ptr<logging::Logger> logger = make_logger(cfg, args.verbose);

    std::atomic<bool> cancel{false};
    networking::InterruptWatcher watcher(cancel);
    using ListenerScope = networking::InterruptWatcher::Scope<networking::Listener>;
    using SessionScope = networking::InterruptWatcher::Scope<networking::Session>;

    transfer::TransferOptions options = config::transfer_options(cfg);
    options.progress_cb = print_progress;
    options.cancel_flag = &cancel;

    retry::RetryPolicy policy = config::retry_policy(cfg);
    policy.set_cancel_flag(&cancel);

    auto wait_for_peer = [&]() {
        networking::Listener listener(port);
        ListenerScope scope(watcher, listener);
        logger->info("Listening on port " + std::to_string(listener.port()));
        return listener.accept(*logger);
    };
    auto connect = [&](const std::string& host) {
        if (watcher.interrupted()) {
            throw protocol::TransferCancelled(0);
        }
        return networking::connect_session(host, port, config::connect_options(cfg), *logger);
    };

    const std::string& command = args.positional[0];
    const std::size_t argn = args.positional.size();
    try {
        if (command == "serve") {
            auto session = wait_for_peer();
            SessionScope scope(watcher, *session);
            transfer::FileSender sender(*session, *logger, options);
            sender.send_file(args.positional[2]);
        } else if (command == "collect") {
            fs::path dir = argn == 3 ? fs::path(args.positional[2]) : fs::path(".");
            auto session = wait_for_peer();
            SessionScope scope(watcher, *session);
            transfer::FileReceiver receiver(*session, *logger, options);
            print_receipt(receiver.receive_to_directory(dir));
        } else if (command == "push") {
            const std::string host = args.positional[1];
            const fs::path file = args.positional[3];
            policy.run([&]() {
                auto session = connect(host);
                SessionScope scope(watcher, *session);
                transfer::FileSender sender(*session, *logger, options);
                sender.send_file(file);
            }, *logger, "push " + file.string());
        } else {
            const std::string host = args.positional[1];
            const fs::path dir = argn == 4 ? fs::path(args.positional[3]) : fs::path(".");
            transfer::ReceivedFile file = policy.run([&]() {
                auto session = connect(host);
                SessionScope scope(watcher, *session);
                transfer::FileReceiver receiver(*session, *logger, options);
                return receiver.receive_to_directory(dir);
            }, *logger, "fetch from " + host);
            print_receipt(file);
        }
    } catch (const protocol::TransferError& e) {
        if (watcher.interrupted()) {
            std::cerr << "\nInterrupted: " << e.what() << "\n";
        } else {
            std::cerr << "\nTransfer failed: " << e.what() << "\n";
        }
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "\nError: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
