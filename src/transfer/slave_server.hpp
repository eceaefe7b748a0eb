#ifndef PORTAL_TRANSFER_SLAVE_SERVER_HPP
#define PORTAL_TRANSFER_SLAVE_SERVER_HPP

#include <atomic>
#include <chrono>
#include <list>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include "network/discovery.hpp"
#include "network/socket.hpp"
#include "protocol/error.hpp"
#include "transfer/slave.hpp"
#include "util/logger.hpp"

namespace portal {
namespace transfer {

/*
  SlaveServer
  --------------------------------
  Accepts inbound connections and runs one Slave per connection on its own
  thread. Optionally announces the listening port over UDP broadcast so that
  senders on the LAN can find it.

  Completed files from every connection land in the same storage directory.
*/

class SlaveServer {
  public:
    explicit SlaveServer(std::string storageDirectory)
        : m_storageDirectory(std::move(storageDirectory)) {}

    ~SlaveServer() {
        stop();
    }

    SlaveServer(const SlaveServer&) = delete;
    SlaveServer& operator=(const SlaveServer&) = delete;

    /*
      void start(const std::string& bindAddress, uint16_t port)
      -----------------------------------------------------------------
      - Binds the listener (port 0 picks an ephemeral port, see port())
      - Spawns the accept thread
      - Throws PortalError(Io) if the port cannot be bound
    */
    void start(const std::string& bindAddress, uint16_t port) {
        using namespace portal::util::logger;
        if (m_isRunning) {
            Logger::getInstance().warn("[SlaveServer] start called but server is already running.");
            return;
        }

        m_listener = std::make_unique<network::TcpListener>();
        m_listener->bind(bindAddress, port);
        m_isRunning = true;
        m_acceptThread = std::thread(&SlaveServer::acceptThreadRoutine, this);

        Logger::getInstance().info("[SlaveServer] Saving received files to '" +
                                   m_storageDirectory + "'");
    }

    /*
      void announce(uint16_t discoveryPort, interval, targetHost)
      -----------------------------------------------------------------
      - Starts broadcasting the bound port; call after start()
    */
    void announce(uint16_t discoveryPort, std::chrono::milliseconds interval,
                  const std::string& targetHost = "255.255.255.255") {
        if (!m_isRunning) {
            throw std::runtime_error("SlaveServer::announce: server is not running.");
        }
        m_announcer = std::make_unique<network::BroadcastSender>(port(), discoveryPort, targetHost);
        m_announcer->start(interval);
    }

    /*
      void stop()
      -----------------------------------------------------------------
      - Stops announcing and accepting
      - Shuts down live connections so their Slaves return
      - Joins every thread
    */
    void stop() {
        using namespace portal::util::logger;
        if (!m_isRunning.exchange(false)) {
            return;
        }

        if (m_announcer) {
            m_announcer->stop();
            m_announcer.reset();
        }

        m_listener->close();
        if (m_acceptThread.joinable()) {
            m_acceptThread.join();
        }

        std::list<Connection> connections;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            connections.swap(m_connections);
        }
        for (auto& conn : connections) {
            conn.stream.shutdown();
        }
        for (auto& conn : connections) {
            if (conn.thread.joinable()) {
                conn.thread.join();
            }
        }

        Logger::getInstance().info("[SlaveServer] Stopped and all connections closed.");
    }

    uint16_t port() const {
        return m_listener ? m_listener->localPort() : 0;
    }

    bool isRunning() const { return m_isRunning; }

    /// Connections whose Slave is still serving.
    size_t activeConnections() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        size_t count = 0;
        for (const auto& conn : m_connections) {
            if (!*conn.finished) {
                ++count;
            }
        }
        return count;
    }

    const std::string& storageDirectory() const { return m_storageDirectory; }

  private:
    struct Connection {
        network::Stream stream;
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> finished;
    };

    void acceptThreadRoutine() {
        using namespace portal::util::logger;
        Logger& logger = Logger::getInstance();

        while (m_isRunning) {
            network::Stream stream;
            try {
                stream = m_listener->accept();
            } catch (const protocol::PortalError& ex) {
                if (!m_isRunning || ex.kind() == protocol::ErrorKind::Disconnected) {
                    break;
                }
                logger.warn(std::string("[SlaveServer] accept failed, continuing: ") + ex.what());
                continue;
            }

            std::lock_guard<std::mutex> lock(m_mutex);
            reapFinishedLocked();
            if (!m_isRunning) {
                stream.shutdown();
                break;
            }

            logger.info("[SlaveServer] Accepted connection from " + stream.peer().toString());
            auto finished = std::make_shared<std::atomic<bool>>(false);
            m_connections.push_back(Connection{stream, std::thread(), finished});
            m_connections.back().thread =
                std::thread(&SlaveServer::connectionRoutine, this, stream, finished);
        }
    }

    void connectionRoutine(network::Stream stream, std::shared_ptr<std::atomic<bool>> finished) {
        using namespace portal::util::logger;
        Slave slave(m_storageDirectory);
        try {
            slave.run(stream);
        } catch (const protocol::PortalError& ex) {
            Logger::getInstance().warn("[SlaveServer] Connection " + stream.peer().toString() +
                                       " ended: " + ex.what());
        } catch (const std::exception& ex) {
            Logger::getInstance().error("[SlaveServer] Connection " + stream.peer().toString() +
                                        " failed: " + ex.what());
        }
        stream.shutdown();
        *finished = true;
    }

    // Caller holds m_mutex.
    void reapFinishedLocked() {
        for (auto it = m_connections.begin(); it != m_connections.end();) {
            if (*it->finished) {
                if (it->thread.joinable()) {
                    it->thread.join();
                }
                it = m_connections.erase(it);
            } else {
                ++it;
            }
        }
    }

    std::string m_storageDirectory;
    std::unique_ptr<network::TcpListener> m_listener;
    std::unique_ptr<network::BroadcastSender> m_announcer;
    std::atomic<bool> m_isRunning{false};
    std::thread m_acceptThread;

    mutable std::mutex m_mutex;
    std::list<Connection> m_connections;
};

} // namespace transfer
} // namespace portal

#endif // PORTAL_TRANSFER_SLAVE_SERVER_HPP
