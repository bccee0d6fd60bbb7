#include <portainer_mcp/config/config_loader.hpp>
#include <portainer_mcp/core/log.hpp>
#include <portainer_mcp/core/version.hpp>
#include <portainer_mcp/workflow/server_bootstrap.hpp>

#include <iostream>
#include <memory>
#include <string>

namespace {

constexpr int kExitConfigError = 2;

void PrintError(const portainer_mcp::Error& error) {
    std::cerr << "Error: " << error.ToString() << "\n";
}

} // anonymous namespace

int main(int argc, const char* argv[]) {
    using namespace portainer_mcp;

    auto loaded = LoadFromCli(argc, argv);
    if (loaded.IsErr()) {
        PrintError(loaded.Error());
        return kExitConfigError;
    }

    auto resolved = ResolveTokenEnv(std::move(loaded).Value());
    if (resolved.IsErr()) {
        PrintError(resolved.Error());
        return kExitConfigError;
    }
    auto config = std::move(resolved).Value();

    auto valid = ValidateConfig(config);
    if (valid.IsErr()) {
        PrintError(valid.Error());
        return kExitConfigError;
    }

    // stdout carries the stdio transport, so every sink writes to stderr.
    if (config.log.json) {
        InitGlobalLogger(std::make_unique<JsonSink>(std::cerr), config.log.level);
    } else {
        InitGlobalLogger(std::make_unique<ConsoleSink>(std::cerr), config.log.level);
    }
    LogInfo("main", std::string("portainer-mcp ") + kVersion + " starting");

    return RunServer(config);
}
