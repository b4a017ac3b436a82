#pragma once
#include "dexarb/common.hpp"
#include <nlohmann/json.hpp>

namespace dexarb {

// Precedence: defaults < JSON file (--config) < environment < CLI flags.
// Sets show_help instead of exiting so callers decide.
Config parseArgs(int argc, char *argv[], bool &show_help);

// Throws ConfigError on unreadable files or wrongly typed keys
void applyConfigFile(Config &cfg, const std::string &path);
void applyJson(Config &cfg, const nlohmann::json &j);
void applyEnv(Config &cfg);

// Range checks, throws ConfigError
void validateConfig(const Config &cfg);

const char *usage();

} // namespace dexarb
