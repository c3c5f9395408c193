#pragma once

#include <string>

#include "config/sandbox_config.hpp"
#include "utils/logging.hpp"

namespace warden::config {

struct ActionDefaults {
    // Used when a request does not carry its own timeout.
    double timeout_s = 300.0;
};

struct Config {
    SandboxConfig sandbox;
    ActionDefaults actions;
    utils::LogConfig logging;
};

}  // namespace warden::config
