#include "config.h"
#include "event_manager.h"
#include "fs.h"
#include "notifications.h"
#include "peer_directory.h"
#include "transfer_storage.h"
#include <iostream>
#include <string>
#include <thread>
#include <chrono>
#include <sstream>
#include <vector>
#include <memory>

// Main module logging macros
#define LOG_MAIN_DEBUG(message) LOG_DEBUG("main", message)
#define LOG_MAIN_INFO(message)  LOG_INFO("main", message)
#define LOG_MAIN_WARN(message)  LOG_WARN("main", message)
#define LOG_MAIN_ERROR(message) LOG_ERROR("main", message)

using namespace meshshare;

namespace {

/**
 * Engine stand-in that only logs the commands it receives.
 * Events are fed in by hand with the event and replay commands.
 */
class LoggingTransferEngine : public TransferEngine {
public:
    bool finalize(const std::string& transfer_id) override {
        LOG_MAIN_INFO("[engine] finalize " << transfer_id);
        return true;
    }

    bool accept(const std::string& transfer_id, const std::string& destination,
                const std::vector<std::string>& file_ids) override {
        LOG_MAIN_INFO("[engine] accept " << transfer_id << " into " << destination
                      << " (" << (file_ids.empty() ? std::string("all files") : std::to_string(file_ids.size()) + " files") << ")");
        return true;
    }

    bool cancel_file(const std::string& transfer_id, const std::string& file_id) override {
        LOG_MAIN_INFO("[engine] cancel file " << file_id << " of " << transfer_id);
        return true;
    }
};

struct Watcher {
    std::shared_ptr<ProgressChannel> channel;
    std::thread thread;
};

void print_usage(const char* program_name) {
    std::cout << "Usage: " << program_name << " [config_file]\n";
    std::cout << "  config_file: JSON configuration (default: meshshare.json, created if missing)\n";
}

void print_help() {
    std::cout << "\nAvailable commands:\n";
    std::cout << "  help                          - Show this help message\n";
    std::cout << "  event <json>                  - Feed one engine event\n";
    std::cout << "  replay <file>                 - Feed engine events from a file, one JSON document per line\n";
    std::cout << "  list                          - List all transfers\n";
    std::cout << "  show <transfer_id>            - Show a transfer with its files\n";
    std::cout << "  send <transfer_id> <peer> <path> - Register an outgoing transfer\n";
    std::cout << "  accept <transfer_id> [dir] [file...] - Accept an incoming transfer\n";
    std::cout << "  cancel <transfer_id>          - Cancel a transfer\n";
    std::cout << "  cancel_file <transfer_id> <file> - Cancel one file of a transfer\n";
    std::cout << "  status <transfer_id> <code>   - Overwrite the status of a transfer\n";
    std::cout << "  watch <transfer_id>           - Print progress updates of a transfer\n";
    std::cout << "  action <notification_id> <key> - Run a notification action (accept_transfer, cancel_transfer, open_file)\n";
    std::cout << "  quit                          - Exit the program\n";
    std::cout << "Type your command: ";
}

void print_transfer_line(const Transfer& transfer) {
    std::cout << "  " << transfer.id
              << " | " << direction_to_string(transfer.direction)
              << " | " << transfer.peer
              << " | " << status_to_string(transfer.status)
              << " | " << transfer_progress_percent(transfer) << "%"
              << " | " << count_leaves(transfer.files) << " files" << std::endl;
}

void print_transfer_details(const Transfer& transfer) {
    print_transfer_line(transfer);
    std::cout << "  path: " << (transfer.path.empty() ? "-" : transfer.path) << std::endl;
    std::cout << "  size: " << transfer.total_transferred << "/" << transfer.total_size << " bytes"
              << (transfer.finalized ? " (finalized)" : "") << std::endl;
    for (const auto& entry : flatten_files(transfer.files)) {
        if (!entry.node->is_leaf()) {
            std::cout << "    " << entry.path << "/" << std::endl;
            continue;
        }
        std::cout << "    " << entry.path << " [" << status_to_string(entry.node->status) << "] "
                  << entry.node->transferred << "/" << entry.node->size << std::endl;
    }
}

void report(const std::string& what, FileshareError error) {
    if (error == FileshareError::None) {
        LOG_MAIN_INFO(what << ": ok");
    } else {
        LOG_MAIN_ERROR(what << ": " << error_to_string(error));
    }
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    if (argc > 2) {
        print_usage(argv[0]);
        return 1;
    }

    std::string config_path = argc == 2 ? argv[1] : "meshshare.json";

    FileshareConfig config;
    if (!load_config(config_path, config)) {
        LOG_MAIN_WARN("Using default configuration");
    }

    Logger& logger = Logger::getInstance();
    logger.set_log_level(config.log_level);
    if (!config.log_file.empty()) {
        logger.set_log_file_path(config.log_file);
        if (!logger.set_file_logging_enabled(true)) {
            LOG_MAIN_ERROR("Failed to open log file " << config.log_file);
        }
    }

    LOG_MAIN_INFO("=== meshshare ===");
    LOG_MAIN_INFO("Download directory: " << config.download_directory);

    StaticPeerDirectory peers(config.peers);
    JsonFileTransferStorage storage(config.history_file);
    LoggingTransferEngine engine;

    EventManager events(peers, storage, engine, config.progress_channel_capacity);

    std::shared_ptr<NotificationManager> notifications;
    if (config.notifications_enabled) {
        notifications = std::make_shared<NotificationManager>(
            events,
            std::make_shared<LogNotifier>(),
            std::make_shared<LocalFilesystemProbe>(),
            config.download_directory,
            config.effective_size_limit(),
            [](const std::string& path) {
                LOG_MAIN_INFO("Opening " << path);
                return true;
            });
        events.set_notification_sink(notifications);
    }

    std::vector<Watcher> watchers;

    print_help();

    std::string input;
    while (std::getline(std::cin, input)) {
        std::istringstream iss(input);
        std::string command;
        iss >> command;

        if (command.empty()) {
            std::cout << "Type your command: ";
            continue;
        }

        if (command == "quit" || command == "exit") {
            break;
        }
        else if (command == "help") {
            print_help();
            continue;
        }
        else if (command == "event") {
            std::string json;
            std::getline(iss, json);
            if (json.find_first_not_of(' ') == std::string::npos) {
                std::cout << "Usage: event <json>" << std::endl;
            } else {
                events.handle_event(json);
            }
        }
        else if (command == "replay") {
            std::string path;
            iss >> path;
            if (path.empty()) {
                std::cout << "Usage: replay <file>" << std::endl;
            } else if (!file_exists(path)) {
                LOG_MAIN_ERROR("No such file: " << path);
            } else {
                std::istringstream lines(read_file_text_cpp(path));
                std::string line;
                size_t count = 0;
                while (std::getline(lines, line)) {
                    if (line.find_first_not_of(" \t\r") == std::string::npos) {
                        continue;
                    }
                    events.handle_event(line);
                    count++;
                }
                LOG_MAIN_INFO("Replayed " << count << " events from " << path);
            }
        }
        else if (command == "list") {
            auto transfers = events.get_transfers();
            std::cout << "Transfers (" << transfers.size() << "):" << std::endl;
            for (const auto& transfer : transfers) {
                print_transfer_line(transfer);
            }
        }
        else if (command == "show") {
            std::string transfer_id;
            iss >> transfer_id;
            auto transfer = events.get_transfer(transfer_id);
            if (!transfer) {
                std::cout << "Transfer not found: " << transfer_id << std::endl;
            } else {
                print_transfer_details(*transfer);
            }
        }
        else if (command == "send") {
            std::string transfer_id, peer, path;
            iss >> transfer_id >> peer >> path;
            if (path.empty()) {
                std::cout << "Usage: send <transfer_id> <peer> <path>" << std::endl;
            } else {
                report("send " + transfer_id, events.new_outgoing_transfer(transfer_id, peer, path));
            }
        }
        else if (command == "accept") {
            std::string transfer_id, destination, file_id;
            iss >> transfer_id >> destination;
            if (transfer_id.empty()) {
                std::cout << "Usage: accept <transfer_id> [dir] [file...]" << std::endl;
            } else {
                if (destination.empty()) {
                    destination = config.download_directory;
                }
                std::vector<std::string> file_ids;
                while (iss >> file_id) {
                    file_ids.push_back(file_id);
                }
                report("accept " + transfer_id,
                       events.accept_transfer(transfer_id, destination, file_ids, config.effective_size_limit()));
            }
        }
        else if (command == "cancel") {
            std::string transfer_id;
            iss >> transfer_id;
            report("cancel " + transfer_id, events.cancel_transfer(transfer_id));
        }
        else if (command == "cancel_file") {
            std::string transfer_id, file_id;
            iss >> transfer_id >> file_id;
            if (file_id.empty()) {
                std::cout << "Usage: cancel_file <transfer_id> <file>" << std::endl;
            } else {
                report("cancel " + file_id, events.cancel_file(transfer_id, file_id));
            }
        }
        else if (command == "status") {
            std::string transfer_id;
            int64_t code = -1;
            iss >> transfer_id >> code;
            auto status = status_from_code(code);
            if (transfer_id.empty() || !status) {
                std::cout << "Usage: status <transfer_id> <code>" << std::endl;
            } else {
                report("status " + transfer_id, events.set_transfer_status(transfer_id, *status));
            }
        }
        else if (command == "watch") {
            std::string transfer_id;
            iss >> transfer_id;
            auto channel = events.subscribe(transfer_id);
            if (!channel) {
                std::cout << "Transfer not found: " << transfer_id << std::endl;
            } else {
                Watcher watcher;
                watcher.channel = channel;
                watcher.thread = std::thread([channel, transfer_id]() {
                    TransferProgressUpdate update;
                    while (true) {
                        if (channel->pop(update, std::chrono::milliseconds(500))) {
                            LOG_MAIN_INFO("[watch] " << transfer_id << " " << status_to_string(update.status)
                                          << " " << update.transferred_percent << "%");
                        } else if (channel->is_closed()) {
                            break;
                        }
                    }
                });
                watchers.push_back(std::move(watcher));
            }
        }
        else if (command == "action") {
            uint32_t notification_id = 0;
            std::string key;
            iss >> notification_id >> key;
            if (!notifications) {
                std::cout << "Notifications are disabled" << std::endl;
            } else if (key.empty()) {
                std::cout << "Usage: action <notification_id> <key>" << std::endl;
            } else if (!notifications->handle_action(notification_id, key)) {
                LOG_MAIN_WARN("Action " << key << " on notification " << notification_id << " failed");
            }
        }
        else {
            std::cout << "Unknown command: " << command << std::endl;
            std::cout << "Type 'help' for available commands." << std::endl;
        }
        std::cout << "Type your command: ";
    }

    // Clean shutdown
    for (auto& watcher : watchers) {
        watcher.channel->close();
        if (watcher.thread.joinable()) {
            watcher.thread.join();
        }
    }

    LOG_MAIN_INFO("meshshare stopped. Goodbye!");
    return 0;
}
