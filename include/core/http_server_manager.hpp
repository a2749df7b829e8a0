#pragma once

#include <httplib.h>
#include <memory>
#include <thread>
#include <atomic>
#include <mutex>
#include <string>
#include "core/frame_extraction_worker.hpp"
#include "logging/logger.hpp"

/**
 * @brief HTTP trigger endpoint for the frame extraction worker
 *
 * POST /process takes one trigger message and processes it synchronously:
 * 200 once the outcome notification went out, 400 for a malformed message,
 * 500 for any processing error so the caller can redeliver.
 * GET /health answers 200.
 *
 * Requests are processed one at a time.
 */
class HttpServerManager
{
public:
    explicit HttpServerManager(FrameExtractionWorker &worker);
    ~HttpServerManager();

    HttpServerManager(const HttpServerManager &) = delete;
    HttpServerManager &operator=(const HttpServerManager &) = delete;

    /**
     * @brief Bind synchronously, then serve on a background thread
     * @param port 0 binds an ephemeral port, reported by getCurrentPort()
     * @throws std::runtime_error if the address cannot be bound
     */
    void start(const std::string &host, int port);
    void stop();
    bool isRunning() const;

    std::string getCurrentHost() const;
    int getCurrentPort() const;

private:
    void serverThread();
    void setupRoutes();
    void handleProcess(const httplib::Request &req, httplib::Response &res);

    FrameExtractionWorker &worker_;

    std::unique_ptr<httplib::Server> server_;
    std::thread server_thread_;
    std::atomic<bool> running_{false};

    std::string current_host_;
    int current_port_;

    // Thread safety
    mutable std::mutex server_mutex_;
    mutable std::mutex config_mutex_;
    std::mutex processing_mutex_;
};
