#include "core/archive_builder.hpp"
#include "core/errors.hpp"
#include "core/frame_extraction_orchestrator.hpp"
#include "core/frame_extraction_worker.hpp"
#include "core/frame_extractor.hpp"
#include "core/http_server_manager.hpp"
#include "core/notifier.hpp"
#include "core/poco_config_manager.hpp"
#include "core/storage_gateway.hpp"
#include "core/trigger_adapter.hpp"
#include "core/worker_config.hpp"
#include "logging/logger.hpp"
#include <atomic>
#include <chrono>
#include <csignal>
#include <fstream>
#include <iostream>
#include <sstream>
#include <thread>

namespace
{
    std::atomic<bool> g_shutdown_requested{false};

    void handleSignal(int)
    {
        g_shutdown_requested.store(true);
    }

    void printUsage(const char *program)
    {
        std::cout << "Video Frame Extractor Worker" << std::endl;
        std::cout << "Usage: " << program << " [options]" << std::endl;
        std::cout << "Options:" << std::endl;
        std::cout << "  --config, -c <file>  Configuration file (default: config.json)" << std::endl;
        std::cout << "  --event, -e <file>   Process an SQS-style event file and exit" << std::endl;
        std::cout << "  --serve              Serve POST /process until SIGINT/SIGTERM" << std::endl;
        std::cout << "  --help, -h           Show this help message" << std::endl;
    }

    std::string readFile(const std::string &path)
    {
        std::ifstream in(path, std::ios::binary);
        if (!in.is_open())
        {
            throw std::runtime_error("Cannot open " + path);
        }
        std::stringstream ss;
        ss << in.rdbuf();
        return ss.str();
    }
}

int main(int argc, char *argv[])
{
    std::string config_path = "config.json";
    std::string event_path;
    bool serve = false;

    for (int i = 1; i < argc; i++)
    {
        std::string arg = argv[i];
        if ((arg == "--config" || arg == "-c") && i + 1 < argc)
        {
            config_path = argv[++i];
        }
        else if ((arg == "--event" || arg == "-e") && i + 1 < argc)
        {
            event_path = argv[++i];
        }
        else if (arg == "--serve")
        {
            serve = true;
        }
        else if (arg == "--help" || arg == "-h")
        {
            printUsage(argv[0]);
            return 0;
        }
        else
        {
            std::cerr << "Unknown or incomplete option: " << arg << std::endl;
            printUsage(argv[0]);
            return 2;
        }
    }

    if (event_path.empty() == !serve)
    {
        std::cerr << "Exactly one of --event or --serve is required" << std::endl;
        printUsage(argv[0]);
        return 2;
    }

    try
    {
        PocoConfigManager config_store;
        if (config_store.load(config_path))
        {
            Logger::info("Configuration loaded from " + config_path);
        }
        else
        {
            Logger::info("No configuration file at " + config_path + ", using environment and defaults");
        }

        WorkerConfig config(config_store);
        Logger::init(config.logLevel());

        LocalStorageGateway storage(config.storageRoot());
        BoundedFrameExtractor extractor;
        ZipArchiveBuilder archiver;
        HttpNotifier notifier(config.notificationTimeout());

        OrchestratorSettings settings;
        settings.output_bucket = config.outputBucket();
        settings.base_prefix = config.basePrefix();
        settings.scratch_root = config.scratchRoot();

        FrameExtractionOrchestrator orchestrator(storage, extractor, archiver, notifier, settings);
        TriggerAdapter adapter(config.notificationTarget());
        FrameExtractionWorker worker(config, adapter, orchestrator);

        if (!event_path.empty())
        {
            size_t processed = worker.handleEvent(readFile(event_path));
            Logger::info("Processed " + std::to_string(processed) + " record(s) from " + event_path);
            return 0;
        }

        std::signal(SIGINT, handleSignal);
        std::signal(SIGTERM, handleSignal);

        HttpServerManager server(worker);
        server.start(config.serverHost(), config.serverPort());
        while (!g_shutdown_requested.load() && server.isRunning())
        {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }
        Logger::info("Shutting down frame extractor worker...");
        server.stop();
        return 0;
    }
    catch (const ConfigurationError &e)
    {
        Logger::error("Configuration error: " + std::string(e.what()));
        return 3;
    }
    catch (const std::exception &e)
    {
        Logger::error("Frame extractor worker failed: " + std::string(e.what()));
        return 1;
    }
}
