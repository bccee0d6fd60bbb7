#pragma once

#include <portainer_mcp/config/app_config.hpp>
#include <portainer_mcp/core/result.hpp>

#include <string>
#include <string_view>

namespace portainer_mcp {

// Default environment variable consulted when no token is configured.
inline constexpr const char* kDefaultTokenEnv = "PORTAINER_TOKEN";

// Parse a YAML config file on top of `base`.
Result<AppConfig, Error> LoadFromYaml(std::string_view file_path,
                                      AppConfig base = {});

// Parse YAML text on top of `base` (used by LoadFromYaml and tests).
Result<AppConfig, Error> LoadFromYamlString(std::string_view yaml,
                                            AppConfig base = {});

// Parse CLI arguments. When --config is given the YAML file is loaded first
// and every flag present on the command line overrides it.
Result<AppConfig, Error> LoadFromCli(int argc, const char* const* argv);

// Resolve token_env: if token is empty, read the named environment variable
// (PORTAINER_TOKEN when token_env is unset).
Result<AppConfig, Error> ResolveTokenEnv(AppConfig config);

// Validate that all required fields are present and values are sane.
Result<void, Error> ValidateConfig(const AppConfig& config);

} // namespace portainer_mcp
