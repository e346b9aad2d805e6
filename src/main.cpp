#include <chrono>
#include <csignal>
#include <cstdint>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <thread>
#include <vector>
#include <boost/asio.hpp>
#include <spdlog/spdlog.h>
#include "config.hpp"
#include "errors.hpp"
#include "logging.hpp"
#include "networking/interfaces.hpp"
#include "networking/node.hpp"

namespace fs = std::filesystem;
using namespace zipline;

namespace {

constexpr int kExitOk = 0;
constexpr int kExitUsage = 1;
constexpr int kExitRuntime = 2;

void print_usage() {
    std::cerr << "Usage: zipline [--port N] [--dir PATH] [--name NAME] [--config FILE] [--verbose|--trace] <command>\n"
              << "\n"
              << "Commands:\n"
              << "  listen                      Receive transfers until interrupted\n"
              << "  peers [--wait SECONDS]      List devices on the network\n"
              << "  send <peer> <paths...>      Send files and folders\n"
              << "  send-text <peer> <text>     Send a text snippet\n"
              << "\n"
              << "<peer> is address[:port], or part of a discovered device name.\n";
}

struct Options {
    Config config;
    std::string log_level = "info";
    std::string command;
    std::vector<std::string> args;
    int wait_seconds = 5;
};

// Returns nullopt after printing a usage error.
std::optional<Options> parse_args(int argc, char* argv[]) {
    Options options;
    std::optional<std::string> config_file;
    std::optional<int> port;
    std::optional<std::string> dir;
    std::optional<std::string> name;

    int i = 1;
    auto value_of = [&](const std::string& flag) -> std::optional<std::string> {
        if (i + 1 >= argc) {
            std::cerr << "Missing value for " << flag << "\n";
            return std::nullopt;
        }
        return std::string(argv[++i]);
    };

    for (; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--port") {
            auto v = value_of(arg);
            if (!v) return std::nullopt;
            try {
                port = std::stoi(*v);
            } catch (const std::exception&) {
                std::cerr << "Invalid port: " << *v << "\n";
                return std::nullopt;
            }
            if (*port <= 0 || *port > 65535) {
                std::cerr << "Invalid port: " << *v << "\n";
                return std::nullopt;
            }
        } else if (arg == "--dir") {
            auto v = value_of(arg);
            if (!v) return std::nullopt;
            dir = *v;
        } else if (arg == "--name") {
            auto v = value_of(arg);
            if (!v) return std::nullopt;
            name = *v;
        } else if (arg == "--config") {
            auto v = value_of(arg);
            if (!v) return std::nullopt;
            config_file = *v;
        } else if (arg == "--verbose") {
            options.log_level = "debug";
        } else if (arg == "--trace") {
            options.log_level = "trace";
        } else if (arg == "--wait") {
            auto v = value_of(arg);
            if (!v) return std::nullopt;
            try {
                options.wait_seconds = std::stoi(*v);
            } catch (const std::exception&) {
                std::cerr << "Invalid wait: " << *v << "\n";
                return std::nullopt;
            }
        } else if (arg == "-h" || arg == "--help") {
            return std::nullopt;
        } else if (options.command.empty()) {
            options.command = arg;
        } else {
            options.args.push_back(arg);
        }
    }

    if (config_file) {
        try {
            options.config = load_config(*config_file);
        } catch (const ConfigError& e) {
            std::cerr << e.what() << "\n";
            return std::nullopt;
        }
    }
    if (port) options.config.listen_port = static_cast<uint16_t>(*port);
    if (dir) options.config.download_directory = *dir;
    if (name) options.config.device_name = *name;
    if (options.config.download_directory.empty()) {
        options.config.download_directory = fs::current_path().u8string();
    }

    if (options.command == "listen" || options.command == "peers") {
        if (!options.args.empty()) {
            std::cerr << options.command << " takes no arguments\n";
            return std::nullopt;
        }
    } else if (options.command == "send") {
        if (options.args.size() < 2) {
            std::cerr << "send needs a peer and at least one path\n";
            return std::nullopt;
        }
    } else if (options.command == "send-text") {
        if (options.args.size() != 2) {
            std::cerr << "send-text needs a peer and one text argument\n";
            return std::nullopt;
        }
    } else {
        if (!options.command.empty()) std::cerr << "Unknown command: " << options.command << "\n";
        return std::nullopt;
    }
    return options;
}

std::string format_size(int64_t bytes) {
    const char* units[] = {"B", "KB", "MB", "GB", "TB"};
    double value = static_cast<double>(bytes);
    int unit = 0;
    while (value >= 1024.0 && unit < 4) {
        value /= 1024.0;
        ++unit;
    }
    std::ostringstream out;
    out << std::fixed << std::setprecision(unit == 0 ? 0 : 1) << value << " " << units[unit];
    return out.str();
}

void print_peers(const std::vector<models::Peer>& peers) {
    if (peers.empty()) {
        std::cout << "No devices found.\n";
        return;
    }
    for (const auto& peer : peers) {
        std::cout << "  " << std::left << std::setw(32) << peer.display_name()
                  << std::setw(22) << (peer.address + ":" + std::to_string(peer.port))
                  << std::setw(10) << peer.platform << peer.connection_type << "\n";
    }
}

// Blocks until SIGINT or SIGTERM.
void wait_for_signal() {
    boost::asio::io_context io;
    boost::asio::signal_set signals(io, SIGINT, SIGTERM);
    signals.async_wait([](const boost::system::error_code&, int) {});
    io.run();
}

int run_listen(networking::Node& node) {
    node.set_auto_accept(true);
    node.on_peer_found().subscribe([](const models::Peer& peer) {
        std::cout << "+ " << peer.display_name() << " (" << peer.address << ")\n";
    });
    node.on_peer_lost().subscribe([](const models::Peer& peer) {
        std::cout << "- " << peer.display_name() << " (" << peer.address << ")\n";
    });
    node.on_transfer_request.subscribe([](const networking::PendingRequest& request) {
        std::cout << "Incoming from " << request.peer.display_name() << ": "
                  << request.payload.description.value_or("") << " ("
                  << format_size(request.payload.total_size.value_or(0)) << ")\n";
    });
    node.on_text_received().subscribe([](const transfer::TextReceived& text) {
        std::cout << "Text from " << text.peer.display_name() << ":\n" << text.text << "\n";
    });
    node.registry().on_session_completed.subscribe([](const models::TransferSession& session) {
        std::cout << (session.direction == models::TransferDirection::RECEIVING ? "Received " : "Sent ")
                  << session.completed_files << " element(s), " << format_size(session.transferred_size)
                  << " from " << session.peer.display_name() << "\n";
    });
    node.registry().on_session_failed.subscribe([](const models::TransferSession& session) {
        std::cout << "Transfer " << session.id << " " << models::to_string(session.status) << ": "
                  << session.error.value_or("") << "\n";
    });

    std::cout << "Listening as \"" << node.discovery().signature() << "\" on port "
              << node.config().listen_port << ", saving to " << node.config().download_directory << "\n";
    std::cout << "Press Ctrl+C to stop.\n";
    wait_for_signal();
    return kExitOk;
}

int run_peers(networking::Node& node, int wait_seconds) {
    std::cout << "Searching for " << wait_seconds << "s...\n";
    std::this_thread::sleep_for(std::chrono::seconds(wait_seconds));
    print_peers(node.peers());
    return kExitOk;
}

// Waits up to wait_seconds for discovery to turn up a peer matching query.
std::optional<models::Peer> resolve_peer(networking::Node& node, const std::string& query, int wait_seconds) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(wait_seconds);
    while (true) {
        if (auto peer = node.find_peer(query)) return peer;
        if (std::chrono::steady_clock::now() >= deadline) return std::nullopt;
        std::this_thread::sleep_for(std::chrono::milliseconds(250));
    }
}

int report(const models::TransferSession& session) {
    if (session.status == models::TransferStatus::COMPLETED) {
        std::cout << "Sent " << format_size(session.transferred_size) << " to "
                  << session.peer.display_name() << "\n";
        return kExitOk;
    }
    std::cerr << "Transfer " << models::to_string(session.status) << ": " << session.error.value_or("") << "\n";
    return kExitRuntime;
}

int run_send(networking::Node& node, const Options& options) {
    auto peer = resolve_peer(node, options.args[0], options.wait_seconds);
    if (!peer) {
        std::cerr << "No device matching \"" << options.args[0] << "\"\n";
        return kExitRuntime;
    }

    int last_percent = -1;
    auto progress = node.registry().on_session_progress.subscribe([&last_percent](const models::TransferSession& session) {
        int percent = static_cast<int>(session.progress_percentage());
        if (percent == last_percent) return;
        last_percent = percent;
        std::cout << "\r" << percent << "% " << session.current_file_name << std::flush;
    });

    models::TransferSession session;
    try {
        if (options.command == "send-text") {
            session = node.send_text(*peer, options.args[1]);
        } else {
            std::vector<fs::path> paths;
            for (size_t i = 1; i < options.args.size(); ++i) paths.push_back(fs::u8path(options.args[i]));
            session = node.send(*peer, paths);
        }
    } catch (...) {
        node.registry().on_session_progress.unsubscribe(progress);
        throw;
    }
    node.registry().on_session_progress.unsubscribe(progress);
    if (last_percent >= 0) std::cout << "\n";
    return report(session);
}

} // namespace

int main(int argc, char* argv[]) {
    auto options = parse_args(argc, argv);
    if (!options) {
        print_usage();
        return kExitUsage;
    }
    init_logging(options->log_level);

    if (options->command == "listen") {
        auto port = networking::port_availability(options->config.listen_port);
        if (!port.available) {
            std::cerr << "Port " << options->config.listen_port << " is already in use";
            if (!port.conflicting_app.empty()) std::cerr << " by " << port.conflicting_app;
            std::cerr << ". Pick another one with --port.\n";
            return kExitRuntime;
        }
    }

    try {
        networking::Node node(options->config);
        node.start();

        int code = kExitOk;
        if (options->command == "listen") {
            code = run_listen(node);
        } else if (options->command == "peers") {
            code = run_peers(node, options->wait_seconds);
        } else {
            code = run_send(node, *options);
        }
        node.stop();
        return code;
    } catch (const NetworkBindError& e) {
        std::cerr << e.what();
        if (!e.conflicting_app().empty()) std::cerr << " (in use by " << e.conflicting_app() << ")";
        std::cerr << "\n";
        return kExitRuntime;
    } catch (const ConfigError& e) {
        std::cerr << "Configuration error: " << e.what() << "\n";
        return kExitUsage;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return kExitRuntime;
    }
}
