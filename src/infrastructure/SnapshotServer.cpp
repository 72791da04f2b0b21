/**
 * @file SnapshotServer.cpp
 * @brief Implementation of SnapshotServer.
 */

#include "infrastructure/SnapshotServer.hpp"
#include <iostream>
#include <httplib.h>
#include <nlohmann/json.hpp>
#include "application/AnalysisPipeline.hpp"
#include "infrastructure/JsonCodec.hpp"

using json = nlohmann::json;

namespace worldpulse::infrastructure {

namespace {

void Reply(httplib::Response& res, const json& body, int status = 200) {
    res.status = status;
    res.set_content(body.dump(2), "application/json");
}

} // namespace

SnapshotServer::SnapshotServer(std::shared_ptr<const application::AnalysisPipeline> pipeline, std::string host, int port)
    : m_pipeline(std::move(pipeline)), m_host(std::move(host)), m_port(port),
      m_server(std::make_unique<httplib::Server>()) {
    registerRoutes();
}

SnapshotServer::~SnapshotServer() {
    stop();
}

void SnapshotServer::registerRoutes() {
    // Every view reads the same committed snapshot; 503 until the first cycle completes.
    auto view = [this](const char* field) {
        return [this, field](const httplib::Request&, httplib::Response& res) {
            auto latest = m_pipeline->latest();
            if (!latest) {
                Reply(res, json{{"error", "no completed cycle yet"}}, 503);
                return;
            }
            json snapshot = codec::ToJson(*latest);
            Reply(res, json{{"completedAt", snapshot["completedAt"]}, {field, snapshot[field]}});
        };
    };

    m_server->Get("/api/health", [this](const httplib::Request&, httplib::Response& res) {
        auto latest = m_pipeline->latest();
        json body{{"status", "ok"}, {"hasSnapshot", latest.has_value()}};
        if (latest) body["lastCycle"] = codec::FormatTimestamp(latest->completedAt);
        Reply(res, body);
    });
    m_server->Get("/api/signals", view("signals"));
    m_server->Get("/api/country-scores", view("countryScores"));
    m_server->Get("/api/clusters", view("clusters"));
    m_server->Get("/api/convergence", view("convergence"));
    m_server->Get("/api/correlations", view("correlations"));
    m_server->Get("/api/overview", view("overview"));
    m_server->Get("/api/snapshot", [this](const httplib::Request&, httplib::Response& res) {
        auto latest = m_pipeline->latest();
        if (!latest) {
            Reply(res, json{{"error", "no completed cycle yet"}}, 503);
            return;
        }
        Reply(res, codec::ToJson(*latest));
    });
}

bool SnapshotServer::start() {
    if (m_running) return true;
    if (!m_server->bind_to_port(m_host.c_str(), m_port)) {
        std::cerr << "[SnapshotServer] Cannot bind " << m_host << ":" << m_port << std::endl;
        return false;
    }
    m_running = true;
    m_thread = std::thread([this]() {
        m_server->listen_after_bind();
        m_running = false;
    });
    std::cout << "[SnapshotServer] Serving on http://" << m_host << ":" << m_port << "/api" << std::endl;
    return true;
}

void SnapshotServer::stop() {
    if (m_server) m_server->stop();
    if (m_thread.joinable()) m_thread.join();
    m_running = false;
}

} // namespace worldpulse::infrastructure
