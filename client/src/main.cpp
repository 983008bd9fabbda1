#include "streamdl/download.hpp"
#include "streamdl/helpers.hpp"
#include "streamdl/version.hpp"

#include <iostream>
#include <string>
#include <cerrno>
#include <poll.h>
#include <unistd.h>

#include <chrono>
#include <filesystem>
#include <memory>
#include <optional>
#include <vector>

using namespace streamdl;

constexpr size_t STDIN_BUFF_SIZE = 4 * 1024;
constexpr int POLL_INTERVAL_MS = 200;

struct Args {
    std::string from;
    std::string to;
    std::string config;
    std::optional<std::uint64_t> chunk_size;
    std::optional<std::uint64_t> offset;
    bool resume = false;
};

void print_usage(const char *prog) {
    std::cerr << "Usage: " << prog << " --from <file|host:port> --to <path> [--config <json>] [--chunk-size N] [--resume] [--offset N]" << std::endl;
}

void print_help() {
    std::cout << "Available commands:\n";
    std::cout << "HELP - Show this help message\n";
    std::cout << "STATUS - Show transfer status and bytes written\n";
    std::cout << "PAUSE - Pause the transfer\n";
    std::cout << "RESUME - Resume a paused transfer\n";
    std::cout << "CANCEL - Cancel the transfer and delete the destination file\n";
    std::cout << "EXIT - Stop reading commands and wait for the transfer to end\n";
}

Args parse_args(int argc, char *argv[]) {
    Args args;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        bool has_value = i + 1 < argc;
        if (arg == "--from" && has_value) {
            args.from = argv[++i];
        } else if (arg == "--to" && has_value) {
            args.to = argv[++i];
        } else if (arg == "--config" && has_value) {
            args.config = argv[++i];
        } else if (arg == "--chunk-size" && has_value) {
            args.chunk_size = parse_size(argv[++i]);
        } else if (arg == "--offset" && has_value) {
            args.offset = parse_size(argv[++i]);
        } else if (arg == "--resume") {
            args.resume = true;
        } else {
            throw std::runtime_error("invalid_argument: Unknown or incomplete argument: " + arg);
        }
    }
    if (args.from.empty() || args.to.empty()) {
        throw std::runtime_error("invalid_argument: --from and --to are required");
    }
    return args;
}

std::unique_ptr<InputStream> open_source(const std::string &from) {
    // existing local file wins over host:port
    HostPort hp;
    if (!std::filesystem::exists(from) && parse_host_port(from, hp)) {
        std::cout << "Connecting to " << hp.host << ':' << hp.port << std::endl;
        return FdInputStream::connectTcp(hp.host, hp.port);
    }
    return FdInputStream::openFile(from);
}

void handle_command(const std::string &cmd, Control &ctrl, bool &reading) {
    if (is_cmd(cmd, "HELP")) {
        print_help();
    } else if (is_cmd(cmd, "STATUS")) {
        std::cout << ctrl.status() << " " << ctrl.bytesTransferred() << " bytes" << std::endl;
    } else if (is_cmd(cmd, "PAUSE")) {
        ctrl.pause();
        std::cout << ctrl.status() << std::endl;
    } else if (is_cmd(cmd, "RESUME")) {
        ctrl.resume();
        std::cout << ctrl.status() << std::endl;
    } else if (is_cmd(cmd, "CANCEL")) {
        ctrl.cancel();
        std::cout << ctrl.status() << std::endl;
    } else if (is_cmd(cmd, "EXIT")) {
        std::cout << "Waiting for transfer to end..." << std::endl;
        reading = false;
    } else if (!cmd.empty()) {
        std::cout << "Unknown command: " << cmd << " (type HELP)" << std::endl;
    }
}

void main_loop(Control &ctrl) {
    std::string input_buffer;
    char temp[STDIN_BUFF_SIZE];
    bool reading = true;

    std::cout << "> " << std::flush;
    while (reading && !ctrl.waitFor(std::chrono::milliseconds(0))) {
        pollfd pfd{STDIN_FILENO, POLLIN, 0};
        int ready = ::poll(&pfd, 1, POLL_INTERVAL_MS);
        if (ready < 0) {
            if (errno == EINTR) continue;
            throw std::runtime_error("poll_failed: Failed to poll stdin");
        }
        if (ready == 0) {
            continue;
        }

        ssize_t read_bytes = ::read(STDIN_FILENO, temp, sizeof(temp));
        if (read_bytes < 0) {
            if (errno == EINTR) continue;
            throw std::runtime_error("read_stdin_failed: Failed to read from stdin");
        }
        if (read_bytes == 0) {
            // stdin closed -> just wait for the transfer
            return;
        }
        input_buffer.append(temp, static_cast<size_t>(read_bytes));

        // process complete lines
        size_t pos;
        while (reading && (pos = input_buffer.find('\n')) != std::string::npos) {
            std::string cmd = input_buffer.substr(0, pos);
            input_buffer.erase(0, pos + 1);
            handle_command(cmd, ctrl, reading);
            if (reading) {
                std::cout << "> " << std::flush;
            }
        }
    }
}

int main(int argc, char *argv[]) {
    // Echo full command line once for diagnostics
    std::cout << "[cmd]";
    for (int i = 0; i < argc; ++i) {
        std::cout << " \"" << argv[i] << '"';
    }
    std::cout << std::endl;

    Args args;
    DownloadOptions opts;
    try {
        args = parse_args(argc, argv);
        if (!args.config.empty()) {
            opts = DownloadOptions::load(args.config);
        }
    } catch (const std::exception &e) {
        std::cerr << e.what() << std::endl;
        print_usage(argv[0]);
        return 1;
    }

    // command line flags override the config file
    if (args.chunk_size) {
        opts.chunk_size = static_cast<size_t>(*args.chunk_size);
    }
    if (args.resume) {
        opts.resume_from_offset = true;
    }
    if (args.offset) {
        opts.file_pointer = *args.offset;
    }

    std::cout << "streamdl (version " << version() << ")" << std::endl;

    std::optional<Control> ctrl;
    try {
        auto executor = std::make_shared<InlineExecutor>();
        Download download(args.to, open_source(args.from), executor);
        download.applyOptions(opts)
            .setOnSuccess([](const std::filesystem::path &file) {
                std::cout << "\nOK\nFile downloaded successfully to " << file.string() << std::endl;
            })
            .setOnFailure([](const Failure &failure) {
                std::cerr << "\nERROR: " << failure.error().what() << "\n"
                          << failure.bytesTransferred() << " bytes kept in " << failure.file().string()
                          << ", restart with --resume --offset " << failure.bytesTransferred() << std::endl;
            });
        ctrl.emplace(download.start());
    } catch (const std::exception &e) {
        std::cerr << e.what() << std::endl;
        return 2;
    }

    try {
        main_loop(*ctrl);
    } catch (const std::exception &e) {
        std::cerr << "ERROR: " << e.what() << std::endl;
    }
    ctrl->wait();

    switch (ctrl->status()) {
        case Status::Done:
            return 0;
        case Status::Canceled:
            std::cout << "Transfer canceled, " << ctrl->file().string() << " removed" << std::endl;
            return 3;
        default:
            return 1;
    }
}
