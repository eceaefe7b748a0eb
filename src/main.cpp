#include <chrono>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "network/discovery.hpp"
#include "network/socket.hpp"
#include "portal_config.hpp"
#include "protocol/error.hpp"
#include "protocol/messages.hpp"
#include "transfer/master.hpp"
#include "transfer/slave_server.hpp"
#include "transfer/task_manager.hpp"
#include "util/channel.hpp"
#include "util/config_parser.hpp"
#include "util/logger.hpp"

namespace {

using portal::util::logger::Logger;

std::mutex g_consoleMutex;

void printLine(const std::string &line)
{
    std::lock_guard<std::mutex> lock(g_consoleMutex);
    std::cout << line << std::endl;
}

void printHelp()
{
    printLine("Commands:\n"
              "  scan [seconds]             listen for receivers announcing on the LAN\n"
              "  devices                    list discovered receivers\n"
              "  connect <index|host:port>  open a connection to a receiver\n"
              "  ping                       ping the connected receiver\n"
              "  send <path>                start sending a file\n"
              "  pause <id> | resume <id> | abort <id>\n"
              "  tasks                      list transfers\n"
              "  serve [stop]               receive files and announce this peer\n"
              "  help | exit");
}

/*
  Session
  --------------------------------
  State behind the interactive prompt: the discovered devices, at most one
  outgoing connection with its tasks, and an optional receiving server.
*/
class Session {
  public:
    explicit Session(const portal::config::PortalConfig& config) : m_config(config) {}

    ~Session() {
        disconnect();
        if (m_server) {
            m_server->stop();
        }
    }

    /// @return false when the prompt should exit.
    bool execute(const std::string& line) {
        std::istringstream iss(line);
        std::string cmd;
        iss >> cmd;
        std::string arg;
        std::getline(iss >> std::ws, arg);

        reportFinishedTasks();

        if (cmd.empty()) {
            return true;
        }
        if (cmd == "exit" || cmd == "quit") {
            return false;
        }

        try {
            if (cmd == "help") {
                printHelp();
            } else if (cmd == "scan") {
                scan(arg);
            } else if (cmd == "devices") {
                listDevices();
            } else if (cmd == "connect") {
                connect(arg);
            } else if (cmd == "ping") {
                requireMaster().ping();
            } else if (cmd == "send") {
                send(arg);
            } else if (cmd == "pause" || cmd == "resume" || cmd == "abort") {
                control(cmd, arg);
            } else if (cmd == "tasks") {
                listTasks();
            } else if (cmd == "serve") {
                serve(arg);
            } else {
                printLine("Unknown command '" + cmd + "', try 'help'.");
            }
        } catch (const portal::protocol::PortalError& ex) {
            printLine(std::string("Error: ") + ex.what());
            if (ex.isConnectionFatal()) {
                disconnect();
            }
        } catch (const std::invalid_argument& ex) {
            printLine(std::string("Invalid argument: ") + ex.what());
        } catch (const std::out_of_range& ex) {
            printLine(std::string("Out of range: ") + ex.what());
        } catch (const std::runtime_error& ex) {
            printLine(std::string("Error: ") + ex.what());
        }
        return true;
    }

  private:
    void scan(const std::string& arg) {
        std::chrono::milliseconds window(m_config.scanTimeoutMillis);
        if (!arg.empty()) {
            window = std::chrono::seconds(std::stoul(arg));
        }
        portal::network::BroadcastListener listener(m_config.discoveryPort);
        printLine("Scanning on udp port " + std::to_string(listener.port()) + " for " +
                  std::to_string(window.count()) + " ms...");
        size_t added = m_devices.scan(listener, window);
        printLine("Found " + std::to_string(added) + " new device(s).");
        listDevices();
    }

    void listDevices() {
        std::vector<portal::network::SocketAddress> devices = m_devices.list();
        if (devices.empty()) {
            printLine("No devices. Run 'scan' first.");
            return;
        }
        for (size_t i = 0; i < devices.size(); ++i) {
            printLine("  [" + std::to_string(i) + "] " + devices[i].toString());
        }
    }

    void connect(const std::string& arg) {
        if (arg.empty()) {
            throw std::invalid_argument("usage: connect <index|host:port>");
        }
        portal::network::SocketAddress target;
        if (arg.find(':') != std::string::npos) {
            target = portal::network::SocketAddress::parse(arg);
        } else {
            std::vector<portal::network::SocketAddress> devices = m_devices.list();
            size_t index = std::stoul(arg);
            if (index >= devices.size()) {
                throw std::out_of_range("no device with index " + arg);
            }
            target = devices[index];
        }

        disconnect();

        portal::transfer::MasterOptions options;
        options.pauseBackoff = std::chrono::milliseconds(m_config.pauseBackoffMillis);
        options.workers = m_config.transferWorkers;
        m_master = portal::transfer::Master::connect(target, options);
        m_tasks = std::make_unique<portal::transfer::TaskManager>(*m_master);

        auto channel = portal::util::makeChannel<portal::protocol::Response>();
        portal::transfer::Master* master = m_master.get();
        m_readerThread = std::thread([master, sink = std::move(channel.first)]() mutable {
            try {
                master->recvResponses(std::move(sink));
            } catch (const portal::protocol::PortalError& ex) {
                Logger::getInstance().error(std::string("[main] Connection lost: ") + ex.what());
            }
        });
        m_printerThread = std::thread([responses = std::move(channel.second)]() mutable {
            while (std::optional<portal::protocol::Response> response = responses.recv()) {
                std::string reason = portal::protocol::failureReason(*response);
                if (!reason.empty()) {
                    printLine("Receiver: " + reason);
                } else if (std::holds_alternative<portal::protocol::Pong>(*response)) {
                    printLine("Receiver: pong");
                }
            }
        });
        printLine("Connected to " + target.toString());
    }

    void disconnect() {
        if (!m_master) {
            return;
        }
        if (m_tasks && m_tasks->pending() > 0) {
            printLine("Aborting " + std::to_string(m_tasks->pending()) + " unfinished task(s).");
        }
        // Dropping the control senders aborts whatever is still running.
        m_tasks.reset();
        m_master->close();
        if (m_readerThread.joinable()) {
            m_readerThread.join();
        }
        if (m_printerThread.joinable()) {
            m_printerThread.join();
        }
        printLine("Disconnected from " + m_master->peer().toString());
        m_master.reset();
    }

    void send(const std::string& path) {
        if (path.empty()) {
            throw std::invalid_argument("usage: send <path>");
        }
        requireMaster();
        uint32_t id = m_tasks->send(path);
        printLine("Task " + std::to_string(id) + " started.");
    }

    void control(const std::string& cmd, const std::string& arg) {
        requireMaster();
        if (arg.empty()) {
            throw std::invalid_argument("usage: " + cmd + " <id>");
        }
        uint32_t id = static_cast<uint32_t>(std::stoul(arg));
        bool accepted = false;
        if (cmd == "pause") {
            accepted = m_tasks->pause(id);
        } else if (cmd == "resume") {
            accepted = m_tasks->resume(id);
        } else {
            accepted = m_tasks->abort(id);
        }
        if (!accepted) {
            printLine("Task " + arg + " cannot be " + cmd + "d now.");
        }
    }

    void listTasks() {
        if (!m_tasks) {
            printLine("Not connected.");
            return;
        }
        std::vector<portal::transfer::TaskInfo> tasks = m_tasks->list();
        if (tasks.empty()) {
            printLine("No tasks.");
            return;
        }
        for (const auto& task : tasks) {
            std::string line = "  " + std::to_string(task.id) + "  " +
                               portal::transfer::taskStateName(task.state) + "  " + task.path;
            if (task.outcome && task.outcome->isError()) {
                line += "  (" + task.outcome->message + ")";
            }
            printLine(line);
        }
    }

    void serve(const std::string& arg) {
        if (arg == "stop") {
            if (m_server) {
                m_server->stop();
                m_server.reset();
            }
            return;
        }
        if (m_server) {
            printLine("Already serving on port " + std::to_string(m_server->port()));
            return;
        }
        auto server = std::make_unique<portal::transfer::SlaveServer>(m_config.storageDirectory);
        server->start("0.0.0.0", m_config.servicePort);
        server->announce(m_config.discoveryPort,
                         std::chrono::milliseconds(m_config.broadcastIntervalMillis));
        printLine("Serving on port " + std::to_string(server->port()) + ", saving to '" +
                  m_config.storageDirectory + "'");
        m_server = std::move(server);
    }

    void reportFinishedTasks() {
        if (!m_tasks) {
            return;
        }
        for (const auto& outcome : m_tasks->poll()) {
            printLine("Transfer " + outcome.summary());
        }
    }

    portal::transfer::Master& requireMaster() {
        if (!m_master) {
            throw std::runtime_error("not connected, use 'connect' first");
        }
        return *m_master;
    }

    portal::config::PortalConfig m_config;
    portal::network::DeviceRegistry m_devices;
    std::unique_ptr<portal::transfer::Master> m_master;
    std::unique_ptr<portal::transfer::TaskManager> m_tasks;
    std::thread m_readerThread;
    std::thread m_printerThread;
    std::unique_ptr<portal::transfer::SlaveServer> m_server;
};

} // namespace

int main(int argc, char** argv) {
    Logger& logger = Logger::getInstance();

    // 1. Parse configuration
    portal::config::PortalConfig config;
    portal::util::ConfigParser configParser(config);

    std::string configPath = "portal.conf";
    if (argc > 1) {
        configPath = argv[1];
    }

    try {
        configParser.loadFromFile(configPath);
        configParser.applyEnvironment();
        logger.setLogLevel(portal::util::logger::parseLogLevel(config.logLevel));
        if (!config.logFile.empty()) {
            logger.enableFileOutput(config.logFile, true);
        }
    } catch (const std::exception& ex) {
        logger.critical(std::string("[main] Invalid configuration: ") + ex.what());
        return 1;
    }

    logger.info("[main] portal starting, service port " + std::to_string(config.servicePort) +
                ", discovery port " + std::to_string(config.discoveryPort));

    // 2. Command loop
    Session session(config);
    printHelp();
    std::string line;
    while (true) {
        {
            std::lock_guard<std::mutex> lock(g_consoleMutex);
            std::cout << "portal> " << std::flush;
        }
        if (!std::getline(std::cin, line)) {
            break;
        }
        if (!session.execute(line)) {
            break;
        }
    }

    logger.info("[main] portal exiting.");
    return 0;
}
