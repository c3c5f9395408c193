#include <chrono>
#include <csignal>
#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include "action/action_executor.hpp"
#include "action/action_server.hpp"
#include "action/action_types.hpp"
#include "config/config_loader.hpp"
#include "nlohmann/json.hpp"
#include "runtime/runtime_factory.hpp"
#include "utils/logging.hpp"

namespace {

volatile std::sig_atomic_t g_signal = 0;

constexpr auto kWaitSlice = std::chrono::milliseconds(200);

struct CliOptions {
    std::optional<std::string> sandbox_type;
    std::optional<double> timeout_s;
    std::vector<std::string> positional;
};

void HandleSignal(int signal) {
    g_signal = signal;
}

void PrintUsage() {
    std::cout << "Usage: warden [--type container|local] [--timeout SECONDS] <command>\n"
              << "  exec <command>            run a shell command in a fresh sandbox\n"
              << "  run-code <language> <code> run code (python, javascript, bash, sh)\n"
              << "  action <file|->           run a JSON action request\n"
              << "  config                    print the effective sandbox config" << std::endl;
}

std::optional<CliOptions> ParseArgs(int argc, char** argv) {
    CliOptions options{};
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if ((arg == "--type" || arg == "--timeout") && i + 1 >= argc) {
            std::cerr << arg << " needs a value" << std::endl;
            return std::nullopt;
        }
        if (arg == "--type") {
            options.sandbox_type = argv[++i];
        } else if (arg == "--timeout") {
            const std::string value = argv[++i];
            try {
                options.timeout_s = std::stod(value);
            } catch (const std::exception&) {
                std::cerr << "invalid --timeout: " << value << std::endl;
                return std::nullopt;
            }
            if (!(*options.timeout_s > 0.0)) {
                std::cerr << "--timeout must be positive" << std::endl;
                return std::nullopt;
            }
        } else if (arg == "-h" || arg == "--help") {
            return std::nullopt;
        } else {
            options.positional.push_back(arg);
        }
    }
    if (options.positional.empty()) {
        return std::nullopt;
    }
    return options;
}

std::string ReadInput(const std::string& source) {
    if (source == "-") {
        return std::string(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
    }
    std::ifstream input(source);
    if (!input.is_open()) {
        throw std::runtime_error("cannot open " + source);
    }
    std::ostringstream buffer;
    buffer << input.rdbuf();
    return buffer.str();
}

warden::action::ActionRequest BuildRequest(const CliOptions& options, const warden::config::Config& config) {
    using namespace warden::action;
    const auto& command = options.positional.front();
    const auto& args = options.positional;

    ActionRequest request{};
    request.timeout_seconds = config.actions.timeout_s;
    if (command == "exec") {
        if (args.size() < 2) {
            throw ValidationError("exec needs a command");
        }
        request.action_type = ActionType::kExecuteCommand;
        request.parameters = ExecuteCommandParams{args[1], std::nullopt};
    } else if (command == "run-code") {
        if (args.size() < 3) {
            throw ValidationError("run-code needs a language and the code");
        }
        request.action_type = ActionType::kRunCode;
        request.parameters = RunCodeParams{args[2], args[1], std::nullopt};
    } else if (command == "action") {
        if (args.size() < 2) {
            throw ValidationError("action needs a file name or -");
        }
        nlohmann::json data;
        try {
            data = nlohmann::json::parse(ReadInput(args[1]));
        } catch (const nlohmann::json::parse_error& ex) {
            throw ValidationError(std::string("invalid action JSON: ") + ex.what());
        }
        if (data.is_object() && !data.contains("timeout")) {
            data["timeout"] = config.actions.timeout_s;
        }
        request = ParseActionRequest(data, config.sandbox);
    } else {
        throw ValidationError("unknown command: " + command);
    }
    if (options.timeout_s) {
        request.timeout_seconds = *options.timeout_s;
    }
    return request;
}

int RunAction(const warden::config::Config& config, const warden::action::ActionRequest& request) {
    using namespace warden;
    auto runtime = runtime::CreateRuntime(config.sandbox);

    std::optional<action::ActionResponse> response;
    std::string action_id;
    {
        auto executor = std::make_shared<action::ActionExecutor>(
            [runtime]() { return runtime; },
            config::RuntimeOptions::FromConfig(config.sandbox));
        action::ActionServer server(executor);

        action_id = server.SubmitAction(request);
        while (!server.WaitForAction(action_id, kWaitSlice)) {
            if (g_signal != 0) {
                utils::LogWarn("cli", "interrupted, cancelling action", {{"id", action_id}});
                server.CancelAction(action_id);
                break;
            }
        }
        const auto result = server.GetActionResult(action_id);
        if (result.state == action::ResultState::kReady) {
            response = result.response;
        }
    }
    runtime->Shutdown();

    if (!response) {
        response = action::ActionResponse{};
        response->action_id = action_id;
        response->status = action::ActionStatus::kCancelled;
        response->error = "action cancelled";
    }
    std::cout << action::ToJson(*response).dump(2) << std::endl;
    return response->status == action::ActionStatus::kCompleted ? 0 : 1;
}

}  // namespace

int main(int argc, char** argv) {
    const auto options = ParseArgs(argc, argv);
    if (!options) {
        PrintUsage();
        return 2;
    }

    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    warden::config::Config config;
    try {
        config = warden::config::LoadConfig();
        if (options->sandbox_type) {
            config.sandbox.sandbox_type = warden::config::ParseSandboxType(*options->sandbox_type);
        }
    } catch (const warden::config::ConfigError& ex) {
        std::cerr << "config error: " << ex.what() << std::endl;
        return 2;
    }
    warden::utils::SetLogConfig(config.logging);

    if (options->positional.front() == "config") {
        std::cout << warden::config::ToJson(config.sandbox).dump(2) << std::endl;
        return 0;
    }

    try {
        const auto request = BuildRequest(*options, config);
        return RunAction(config, request);
    } catch (const warden::action::ValidationError& ex) {
        std::cerr << ex.what() << std::endl;
        PrintUsage();
        return 2;
    } catch (const warden::config::ConfigError& ex) {
        std::cerr << "config error: " << ex.what() << std::endl;
        return 2;
    } catch (const std::exception& ex) {
        std::cerr << "error: " << ex.what() << std::endl;
        return 1;
    }
}
