/**
 * @file SnapshotServer.hpp
 * @brief Read-only HTTP publisher of the last committed analysis cycle.
 */

#pragma once

#include <atomic>
#include <memory>
#include <string>
#include <thread>

namespace httplib {
class Server;
}

namespace worldpulse::application {
class AnalysisPipeline;
}

namespace worldpulse::infrastructure {

/**
 * @class SnapshotServer
 * @brief Serves /api/* JSON views over cpp-httplib on a background thread.
 */
class SnapshotServer {
public:
    SnapshotServer(std::shared_ptr<const application::AnalysisPipeline> pipeline, std::string host, int port);
    ~SnapshotServer();

    /** @brief Binds and starts listening. Returns false when the port cannot be bound. */
    bool start();
    void stop();

    bool isRunning() const { return m_running.load(); }

private:
    void registerRoutes();

    std::shared_ptr<const application::AnalysisPipeline> m_pipeline;
    std::string m_host;
    int m_port;
    std::unique_ptr<httplib::Server> m_server;
    std::thread m_thread;
    std::atomic<bool> m_running{false};
};

} // namespace worldpulse::infrastructure
