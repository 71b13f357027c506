#include <iostream>
#include <string>
#include <csignal>

#include "core/Config.hpp"
#include "core/Error.hpp"
#include "server/FileStorage.hpp"
#include "server/HttpServer.hpp"
#include "server/Reassembler.hpp"
#include "server/UploadHandler.hpp"

using namespace chunkwire;

static void print_usage(const char* prog)
{
    std::cerr
        << "Usage: " << prog << " [options]\n"
        << "\nOptions:\n"
        << "  --port N          TCP port (default: 8080)\n"
        << "  --bind ADDR       listen address (default: 0.0.0.0)\n"
        << "  --storage DIR     directory for received files (default: storage)\n"
        << "  --profile NAME    wire field set: standard, compact or auto (default: auto)\n"
        << "  --threads N       connection worker threads (default: 4)\n"
        << "  --config FILE     JSON server config, flags override it\n";
}

int main(int argc, char* argv[])
{
    ServerConfig config;

    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "-h" || arg == "--help") {
                print_usage(argv[0]);
                return 0;
            }
            if (arg == "--config" && i + 1 < argc) {
                config = ServerConfig::fromJsonFile(argv[++i]);
            }
        }

        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (i + 1 >= argc) {
                std::cerr << "Unknown or incomplete option: " << arg << std::endl;
                print_usage(argv[0]);
                return 1;
            }
            std::string value = argv[++i];
            if (arg == "--port") {
                unsigned long port = parseUnsigned(value, arg);
                if (port > 65535) throw ConfigError("--port must be at most 65535");
                config.port = static_cast<uint16_t>(port);
            }
            else if (arg == "--bind") config.bindAddress = value;
            else if (arg == "--storage") config.storageDir = value;
            else if (arg == "--profile") config.wireProfile = value;
            else if (arg == "--threads") config.threads = static_cast<unsigned>(parseUnsigned(value, arg));
            else if (arg == "--config") continue;
            else {
                std::cerr << "Unknown option: " << arg << std::endl;
                print_usage(argv[0]);
                return 1;
            }
        }
        config.validate();
    } catch (const ConfigError& e) {
        std::cerr << "Configuration error: " << e.what() << std::endl;
        return 1;
    }

    // Writes to a client that hung up must not kill the server
    std::signal(SIGPIPE, SIG_IGN);

    try {
        FileStorage storage(config.storageDir);
        Reassembler reassembler(storage);
        UploadHandler uploadHandler(reassembler, storage, config.wireProfile);

        HttpServer server(config.maxRequestBytes);
        server.setReadTimeout(config.readTimeout);
        uploadHandler.registerEndpoints(server);
        server.stopOnSignals();
        server.listen(config.bindAddress, config.port);

        std::cout << "Storing uploads in " << config.storageDir
                  << " (wire profile: " << config.wireProfile << ")" << std::endl;
        server.run(config.threads);
        std::cout << "Server stopped" << std::endl;
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Server error: " << e.what() << std::endl;
        return 1;
    }
}
