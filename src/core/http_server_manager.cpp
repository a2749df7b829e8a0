#include "core/http_server_manager.hpp"
#include "core/errors.hpp"
#include <nlohmann/json.hpp>
#include <stdexcept>

HttpServerManager::HttpServerManager(FrameExtractionWorker &worker)
    : worker_(worker), current_host_("0.0.0.0"), current_port_(8080)
{
}

HttpServerManager::~HttpServerManager()
{
    stop();
}

void HttpServerManager::start(const std::string &host, int port)
{
    std::lock_guard<std::mutex> lock(server_mutex_);

    if (running_.load())
    {
        Logger::warn("HttpServerManager: Server is already running on " + current_host_ + ":" + std::to_string(current_port_));
        return;
    }

    server_ = std::make_unique<httplib::Server>();
    setupRoutes();

    int bound_port = port;
    if (port == 0)
    {
        bound_port = server_->bind_to_any_port(host);
    }
    else if (!server_->bind_to_port(host, port))
    {
        bound_port = -1;
    }
    if (bound_port < 0)
    {
        server_.reset();
        throw std::runtime_error("HttpServerManager: Failed to bind " + host + ":" + std::to_string(port));
    }

    {
        std::lock_guard<std::mutex> config_lock(config_mutex_);
        current_host_ = host;
        current_port_ = bound_port;
    }

    running_.store(true);
    server_thread_ = std::thread(&HttpServerManager::serverThread, this);

    Logger::info("HttpServerManager: Server started on " + host + ":" + std::to_string(bound_port));
}

void HttpServerManager::stop()
{
    std::lock_guard<std::mutex> lock(server_mutex_);

    if (!running_.load() && !server_thread_.joinable())
    {
        return;
    }

    running_.store(false);

    if (server_)
    {
        server_->stop();
    }

    if (server_thread_.joinable())
    {
        server_thread_.join();
    }

    server_.reset();

    Logger::info("HttpServerManager: Server stopped");
}

bool HttpServerManager::isRunning() const
{
    return running_.load();
}

std::string HttpServerManager::getCurrentHost() const
{
    std::lock_guard<std::mutex> lock(config_mutex_);
    return current_host_;
}

int HttpServerManager::getCurrentPort() const
{
    std::lock_guard<std::mutex> lock(config_mutex_);
    return current_port_;
}

void HttpServerManager::serverThread()
{
    try
    {
        if (!server_->listen_after_bind())
        {
            Logger::error("HttpServerManager: Listener on " + getCurrentHost() + ":" +
                          std::to_string(getCurrentPort()) + " exited with an error");
        }
        Logger::info("HttpServerManager: Server thread completed");
    }
    catch (const std::exception &e)
    {
        Logger::error("HttpServerManager: Server thread error: " + std::string(e.what()));
    }
    running_.store(false);
}

void HttpServerManager::setupRoutes()
{
    server_->Get("/health", [](const httplib::Request &, httplib::Response &res)
                 { res.set_content(R"({"status":"ok"})", "application/json"); });

    server_->Post("/process", [this](const httplib::Request &req, httplib::Response &res)
                  { handleProcess(req, res); });

    Logger::info("HttpServerManager: Routes setup completed successfully");
}

void HttpServerManager::handleProcess(const httplib::Request &req, httplib::Response &res)
{
    std::lock_guard<std::mutex> lock(processing_mutex_);

    nlohmann::json reply;
    try
    {
        worker_.handle(req.body);
        res.status = 200;
        reply["result"] = "processed";
    }
    catch (const TriggerDecodeError &e)
    {
        res.status = 400;
        reply["error"] = e.what();
    }
    catch (const std::exception &e)
    {
        Logger::error("HttpServerManager: Processing failed: " + std::string(e.what()));
        res.status = 500;
        reply["error"] = e.what();
    }
    res.set_content(reply.dump(), "application/json");
}
