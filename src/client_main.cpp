#include <csignal>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "client/CurlTransport.hpp"
#include "client/UploadClient.hpp"
#include "core/CancelToken.hpp"
#include "core/Config.hpp"
#include "core/Error.hpp"

using namespace chunkwire;

static CancelToken g_cancel;

static void signal_handler(int)
{
    g_cancel.cancel();
}

static void print_usage(const char* prog)
{
    std::cout
        << "chunkwire file transfer client\n"
        << "\n"
        << "Usage:\n"
        << "  " << prog << " <file_path> [server_url]\n"
        << "  " << prog << " --status [server_url]\n"
        << "  " << prog << " --test [server_url]\n"
        << "\nOptions:\n"
        << "  --profile NAME    normal (default) or low-bandwidth\n"
        << "  --config FILE     JSON client config\n"
        << "  --retries N       attempts per chunk\n"
        << "  --chunk-size N    bytes per chunk\n"
        << "\nExamples:\n"
        << "  " << prog << " document.pdf\n"
        << "  " << prog << " image.jpg http://192.168.1.100:8080\n"
        << "  " << prog << " --status\n"
        << "  " << prog << " --test http://example.com:8080 --profile low-bandwidth\n";
}

int main(int argc, char* argv[])
{
    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    std::vector<std::string> positional;
    std::string profile = "normal";
    std::string configPath;
    std::string retries;
    std::string chunkSize;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto needValue = [&](std::string& out) {
            if (i + 1 >= argc) {
                std::cerr << "Missing value for " << arg << std::endl;
                std::exit(1);
            }
            out = argv[++i];
        };
        if (arg == "--profile") needValue(profile);
        else if (arg == "--config") needValue(configPath);
        else if (arg == "--retries") needValue(retries);
        else if (arg == "--chunk-size") needValue(chunkSize);
        else if (arg == "-h" || arg == "--help") { print_usage(argv[0]); return 0; }
        else positional.push_back(arg);
    }

    if (positional.empty() || positional.size() > 2) {
        print_usage(argv[0]);
        return 1;
    }

    ClientConfig config;
    try {
        if (!configPath.empty()) {
            config = ClientConfig::fromJsonFile(configPath);
        } else {
            config = ClientConfig::forProfile(profile);
        }
        if (positional.size() > 1) config.serverUrl = positional[1];
        if (!retries.empty()) config.maxRetries = static_cast<unsigned>(parseUnsigned(retries, "--retries"));
        if (!chunkSize.empty()) config.chunkSize = static_cast<size_t>(parseUnsigned(chunkSize, "--chunk-size"));
        config.validate();
    } catch (const ConfigError& e) {
        std::cerr << "Configuration error: " << e.what() << std::endl;
        return 1;
    }

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    try {
        CurlTransport transport;
        UploadClient client(config, transport);
        const std::string& command = positional[0];

        if (command == "--status") {
            auto status = client.getServerStatus();
            if (!status) return 1;
            std::cout << "Server status:" << std::endl;
            std::cout << status->dump(2) << std::endl;
            return 0;
        }

        if (command == "--test") {
            return client.testConnection() ? 0 : 1;
        }

        TransferResult result = client.checkAndUpload(command, &g_cancel);
        if (!result.success) {
            std::cerr << "Upload of " << command << " failed after " << result.chunksSent << "/"
                      << result.chunksTotal << " chunks (" << to_string(result.errorKind) << "): "
                      << result.error << std::endl;
            return 1;
        }

        std::cout << "File " << result.filename << " uploaded successfully!" << std::endl;
        std::cout << "Upload time: " << std::fixed << std::setprecision(2)
                  << result.elapsed.count() / 1000.0 << " seconds" << std::endl;
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
