#include "modelfetch/console_reporter.hpp"
#include "modelfetch/curl_http_client.hpp"
#include "modelfetch/download_service.hpp"
#include "modelfetch/errors.hpp"
#include "modelfetch/ini_config.hpp"
#include "modelfetch/logger.hpp"
#include "modelfetch/model_path_registry.hpp"
#include "modelfetch/settings.hpp"
#include "modelfetch/transfer_coordinator.hpp"

#include <atomic>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <fmt/format.h>
#include <jsoncpp/json/json.h>

namespace {

std::atomic<bool> g_interrupted{false};

void printUsage(const char* programName) {
    std::cerr << "Usage: " << programName
              << " [options] <category> <url> <filename> [<category> <url> <filename> ...]\n"
              << "       " << programName << " [options] --folders | --extensions | --list <category>"
              << std::endl;
    std::cerr << "Options:\n"
              << "  -c <file>          Load settings from an INI file\n"
              << "  -p <cat>=<dirs>    Add a model category (directories separated by ';')\n"
              << "  -t <connections>   Parallel connections per download, 1-64 (default: 8)\n"
              << "  -o                 Override existing files\n"
              << "  -j                 Print final statuses as JSON\n"
              << "  -v                 Verbose logging\n"
              << "  -h, --help         Show this message" << std::endl;
}

void printList(const std::vector<std::string>& items) {
    for (const auto& item : items) {
        std::cout << item << '\n';
    }
}

std::string requireValue(int argc, char** argv, int index) {
    if (index + 1 >= argc) {
        throw std::runtime_error(std::string("Missing value for ") + argv[index]);
    }
    return argv[index + 1];
}

} // namespace

int main(int argc, char** argv) {
    try {
        modelfetch::IniConfig config;
        std::vector<std::pair<std::string, std::string>> extra_paths;
        std::string connections_arg;
        std::string list_category;
        bool override_existing = false;
        bool print_json = false;
        bool verbose = false;
        bool list_folders = false;
        bool list_extensions = false;

        int arg_index = 1;
        while (arg_index < argc && argv[arg_index][0] == '-') {
            const std::string option = argv[arg_index];

            if (option == "-c") {
                const std::string path = requireValue(argc, argv, arg_index);
                if (!config.load(path)) {
                    throw std::runtime_error("Cannot read config file: " + path);
                }
                arg_index += 2;
            } else if (option == "-p") {
                const std::string spec = requireValue(argc, argv, arg_index);
                const auto eq = spec.find('=');
                if (eq == std::string::npos || eq == 0) {
                    throw std::runtime_error("Invalid path mapping: " + spec);
                }
                extra_paths.emplace_back(spec.substr(0, eq), spec.substr(eq + 1));
                arg_index += 2;
            } else if (option == "-t") {
                connections_arg = requireValue(argc, argv, arg_index);
                std::size_t consumed = 0;
                long long connections = 0;
                try {
                    connections = std::stoll(connections_arg, &consumed);
                } catch (const std::exception&) {
                    throw std::runtime_error("Invalid connection count: " + connections_arg);
                }
                if (consumed != connections_arg.size() || connections <= 0 ||
                    connections > static_cast<long long>(modelfetch::kMaxConnections)) {
                    throw std::runtime_error(fmt::format("Connection count must be between 1 and {}",
                                                         modelfetch::kMaxConnections));
                }
                arg_index += 2;
            } else if (option == "--list") {
                list_category = requireValue(argc, argv, arg_index);
                arg_index += 2;
            } else if (option == "--folders") {
                list_folders = true;
                ++arg_index;
            } else if (option == "--extensions") {
                list_extensions = true;
                ++arg_index;
            } else if (option == "-o") {
                override_existing = true;
                ++arg_index;
            } else if (option == "-j") {
                print_json = true;
                ++arg_index;
            } else if (option == "-v") {
                verbose = true;
                ++arg_index;
            } else if (option == "-h" || option == "--help") {
                printUsage(argv[0]);
                return 0;
            } else {
                printUsage(argv[0]);
                return 1;
            }
        }

        for (const auto& mapping : extra_paths) {
            config.setValue("paths", mapping.first, mapping.second);
        }
        if (!connections_arg.empty()) {
            config.setValue("download", "connections", connections_arg);
        }

        modelfetch::Settings settings = modelfetch::Settings::fromConfig(config);
        modelfetch::Logger::setup(verbose ? spdlog::level::debug : settings.log_level);

        auto paths = std::make_shared<modelfetch::FolderPathRegistry>();
        settings.applyTo(*paths);

        if (list_folders) {
            printList(modelfetch::folderNames(*paths));
            return 0;
        }
        if (list_extensions) {
            printList(paths->supportedExtensions());
            return 0;
        }
        if (!list_category.empty()) {
            printList(modelfetch::listWithFolderEntry(*paths, list_category));
            return 0;
        }

        if (argc - arg_index < 3 || (argc - arg_index) % 3 != 0) {
            printUsage(argv[0]);
            return 1;
        }

        auto http = std::make_shared<modelfetch::CurlHttpClient>(settings.http);
        modelfetch::DownloadService service(http, paths, {settings.transfer, settings.pause_poll});

        std::vector<std::string> ids;
        bool rejected = false;
        for (int i = arg_index; i < argc; i += 3) {
            modelfetch::StartRequest request{argv[i + 1], argv[i], argv[i + 2], override_existing};
            try {
                ids.push_back(service.submit(request));
            } catch (const modelfetch::ConflictError& ex) {
                std::cerr << ex.what() << " (" << ex.path() << "), use -o to override" << std::endl;
                rejected = true;
            } catch (const modelfetch::DownloadError& ex) {
                std::cerr << "Rejected " << argv[i + 2] << ": " << ex.what() << std::endl;
                rejected = true;
            }
        }

        std::signal(SIGINT, [](int) { g_interrupted = true; });

        modelfetch::ConsoleReporter reporter(service, ids);
        reporter.run([] { return g_interrupted.load(); });
        if (g_interrupted) {
            for (const auto& id : ids) {
                service.cancel(id);
            }
        }
        service.shutdown();

        bool all_completed = !rejected;
        Json::Value summary(Json::objectValue);
        for (const auto& id : ids) {
            const auto status = service.status(id);
            if (!status || status->state != modelfetch::DownloadState::Completed) {
                all_completed = false;
            }
            if (status) {
                summary[id] = modelfetch::toJson(*status);
            }
        }
        if (print_json) {
            Json::StreamWriterBuilder builder;
            builder["indentation"] = "  ";
            std::cout << Json::writeString(builder, summary) << std::endl;
        }
        return all_completed ? 0 : 1;
    } catch (const std::exception& ex) {
        std::cerr << "Fatal error: " << ex.what() << std::endl;
        return 1;
    }
}
