// Services
#include "services/SyncService.hpp"
#include "services/SyncScheduler.hpp"

// Database
#include "db/Schema.hpp"
#include "db/Transactions.hpp"
#include "db/query/sync/Asset.hpp"
#include "db/query/sync/Event.hpp"
#include "db/query/sync/Project.hpp"

// Misc
#include "config/ConfigRegistry.hpp"
#include "remote/HttpApi.hpp"
#include "sync/model/AssetNode.hpp"
#include "log/Registry.hpp"

// Libraries
#include <atomic>
#include <csignal>
#include <iostream>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <thread>
#include <vector>

using namespace sl::config;
using namespace sl::services;
using namespace sl::log;

namespace {

std::atomic shouldExit = false;

void signalHandler(const int) { shouldExit = true; }

constexpr auto* USAGE = R"(usage: siteline [--config PATH] <command> [options]

commands:
  sync [--project UID] [--force]     diff remote projects and refresh changed ones
  upload --project UID EVENT...      package and upload local events
  upload-pending --project UID       upload every unsynced event of a project
  retry-downloads --project UID      re-download failed assets of a project
  clear-assets --project UID         release the project's cached assets
  assets --project UID               list the project's cached asset nodes
  cleanup --project UID [UID...]     delete projects with their defects, images and unshared assets
  clean                              remove stale partial downloads and archives
  daemon                             run the periodic sync scheduler
  config                             print the effective configuration
)";

struct Args {
    std::optional<std::string> configPath, project;
    std::string command;
    std::vector<std::string> positional;
    bool force = false;
};

Args parseArgs(const int argc, char** argv) {
    Args args;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        auto value = [&]() -> std::string {
            if (i + 1 >= argc) throw std::invalid_argument("missing value for " + arg);
            return argv[++i];
        };

        if (arg == "--config") args.configPath = value();
        else if (arg == "--project") args.project = value();
        else if (arg == "--force") args.force = true;
        else if (arg == "-h" || arg == "--help") args.command = "help";
        else if (arg.starts_with("--")) throw std::invalid_argument("unknown option " + arg);
        else if (args.command.empty()) args.command = arg;
        else args.positional.push_back(arg);
    }
    return args;
}

std::string requireProject(const Args& args) {
    if (!args.project) throw std::invalid_argument(args.command + " requires --project UID");
    return *args.project;
}

int report(const sl::sync::model::OpResult& result) {
    (result.success ? std::cout : std::cerr) << result.message << std::endl;
    return result.success ? EXIT_SUCCESS : EXIT_FAILURE;
}

int runDaemon(const std::shared_ptr<SyncService>& service) {
    const auto& cfg = ConfigRegistry::get();
    if (!cfg.scheduler.enabled) {
        Registry::siteline()->warn("[main] Scheduler disabled in configuration, nothing to run");
        return EXIT_SUCCESS;
    }

    SyncScheduler scheduler(service, cfg.scheduler.interval);

    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    scheduler.start();
    Registry::siteline()->info("[*] Siteline daemon started, syncing every {}h", cfg.scheduler.interval.count());

    while (!shouldExit) std::this_thread::sleep_for(std::chrono::seconds(1));

    Registry::siteline()->info("[*] Shutting down Siteline daemon...");
    scheduler.stop();
    return EXIT_SUCCESS;
}

}

int main(const int argc, char** argv) {
    Args args;
    try {
        args = parseArgs(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << e.what() << "\n\n" << USAGE;
        return 2;
    }

    if (args.command.empty() || args.command == "help") {
        std::cout << USAGE;
        return args.command.empty() ? 2 : EXIT_SUCCESS;
    }

    try {
        ConfigRegistry::init(args.configPath ? std::filesystem::path(*args.configPath) : sl::paths::getConfigPath());
        const auto& cfg = ConfigRegistry::get();

        if (args.command == "config") {
            std::cout << nlohmann::json(cfg).dump(2) << std::endl;
            return EXIT_SUCCESS;
        }

        Registry::init(cfg.logging.log_dir);

        sl::db::bootstrap(cfg.database);

        SyncService::Deps deps;
        deps.api = std::make_shared<sl::remote::HttpApi>(cfg.api);
        deps.projects = std::make_shared<sl::db::query::sync::Project>();
        deps.assets = std::make_shared<sl::db::query::sync::Asset>();
        deps.events = std::make_shared<sl::db::query::sync::Event>();

        const auto service = std::make_shared<SyncService>(std::move(deps), cfg);

        int rc;
        if (args.command == "sync") {
            rc = report(args.project ? service->syncProject(*args.project, args.force) : service->syncAllProjects());
        } else if (args.command == "upload") {
            const auto project = requireProject(args);
            if (args.positional.empty()) throw std::invalid_argument("upload requires at least one EVENT uid");
            rc = report(args.positional.size() == 1 ? service->uploadEvent(args.positional.front(), project)
                                                    : service->uploadEvents(args.positional, project));
        } else if (args.command == "upload-pending") {
            rc = report(service->uploadPendingEvents(requireProject(args)));
        } else if (args.command == "retry-downloads") {
            rc = report(service->retryFailedDownloads(requireProject(args)));
        } else if (args.command == "clear-assets") {
            rc = report(service->clearProjectAssets(requireProject(args)));
        } else if (args.command == "cleanup") {
            std::vector<std::string> projects{requireProject(args)};
            projects.insert(projects.end(), args.positional.begin(), args.positional.end());
            rc = report(service->cleanupProjects(projects));
        } else if (args.command == "assets") {
            auto out = nlohmann::json::array();
            for (const auto& node : service->assets(requireProject(args))) out.push_back(*node);
            std::cout << out.dump(2) << std::endl;
            rc = EXIT_SUCCESS;
        } else if (args.command == "clean") {
            rc = report(service->cleanStorage());
        } else if (args.command == "daemon") {
            rc = runDaemon(service);
        } else {
            std::cerr << "unknown command " << args.command << "\n\n" << USAGE;
            rc = 2;
        }

        sl::db::Transactions::shutdown();
        return rc;
    } catch (const std::invalid_argument& e) {
        std::cerr << e.what() << "\n\n" << USAGE;
        return 2;
    } catch (const std::exception& e) {
        if (Registry::isInitialized()) Registry::siteline()->error("[-] siteline {} failed: {}", args.command, e.what());
        std::cerr << "siteline: " << e.what() << std::endl;
        return EXIT_FAILURE;
    }
}
