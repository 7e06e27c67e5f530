// Script Sandbox Runner CLI Tool
// Runs one "JS Transform" script in an isolated sandbox and prints the ScriptResult as JSON

#include "SBXTypes.h"
#include "common/JsonUtils.h"
#include "common/Logger.h"
#include "common/SandboxConfig.h"
#include "scripting/SandboxRuntimeManager.h"
#include <charconv>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>

namespace fs = std::filesystem;

namespace {

constexpr int EXIT_OK = 0;
constexpr int EXIT_SCRIPT_FAILURE = 1;
constexpr int EXIT_USAGE = 2;
constexpr int EXIT_UNAVAILABLE = 3;

struct RunnerOptions {
    fs::path scriptPath;
    std::optional<fs::path> inputPath;
    std::optional<fs::path> contextPath;
    std::optional<fs::path> configPath;
    int64_t timeoutMs = 1000;
    bool consoleEnabled = false;
};

class UsageError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

void printUsage(const char *programName) {
    std::cerr << "Usage: " << programName << " <script.js> [options]\n\n";
    std::cerr << "Run a script body as function(input, context, helpers) in an isolated sandbox.\n\n";
    std::cerr << "Options:\n";
    std::cerr << "  --input <file.json>    Input value (default: null)\n";
    std::cerr << "  --context <file.json>  Block context view (workflowId, runId, phase, ...)\n";
    std::cerr << "  --timeout <ms>         Execution timeout in milliseconds (default: 1000)\n";
    std::cerr << "  --console              Capture console output into consoleLogs\n";
    std::cerr << "  --config <file.json>   Sandbox limits overriding SBX_SANDBOX_* variables\n\n";
    std::cerr << "Exit codes: 0 ok, 1 script failure, 2 usage error, 3 sandbox unavailable\n";
}

std::string readFile(const fs::path &filePath) {
    if (!fs::exists(filePath)) {
        throw UsageError("File does not exist: " + filePath.string());
    }

    std::ifstream file(filePath, std::ios::in | std::ios::binary);
    if (!file) {
        throw UsageError("Failed to open file: " + filePath.string());
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

SBX::json readJsonFile(const fs::path &filePath) {
    std::string error;
    auto parsed = SBX::JsonUtils::parseJson(readFile(filePath), &error);
    if (!parsed) {
        throw UsageError("Invalid JSON in " + filePath.string() + ": " + error);
    }
    return *parsed;
}

RunnerOptions parseArguments(int argc, char **argv) {
    RunnerOptions options;
    bool haveScript = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto requireValue = [&](const std::string &flag) -> std::string {
            if (i + 1 >= argc) {
                throw UsageError(flag + " requires a value");
            }
            return argv[++i];
        };

        if (arg == "--input") {
            options.inputPath = requireValue(arg);
        } else if (arg == "--context") {
            options.contextPath = requireValue(arg);
        } else if (arg == "--config") {
            options.configPath = requireValue(arg);
        } else if (arg == "--timeout") {
            std::string value = requireValue(arg);
            auto [end, ec] = std::from_chars(value.data(), value.data() + value.size(), options.timeoutMs);
            if (ec != std::errc() || end != value.data() + value.size() || options.timeoutMs <= 0) {
                throw UsageError("--timeout expects a positive integer, got '" + value + "'");
            }
        } else if (arg == "--console") {
            options.consoleEnabled = true;
        } else if (!arg.empty() && arg[0] == '-') {
            throw UsageError("Unknown option: " + arg);
        } else if (!haveScript) {
            options.scriptPath = arg;
            haveScript = true;
        } else {
            throw UsageError("Unexpected argument: " + arg);
        }
    }

    if (!haveScript) {
        throw UsageError("Missing script file");
    }
    return options;
}

}  // namespace

int main(int argc, char **argv) {
    SBX::Logger::initialize();

    RunnerOptions options;
    SBX::ScriptInvocationRequest request;
    SBX::SandboxConfig config = SBX::SandboxConfig::fromEnvironment();

    try {
        options = parseArguments(argc, argv);
        request.code = readFile(options.scriptPath);
        request.input = options.inputPath ? readJsonFile(*options.inputPath) : SBX::json(nullptr);
        if (options.contextPath) {
            request.context = SBX::BlockContextView::fromJson(readJsonFile(*options.contextPath));
        }
        if (options.configPath) {
            config.applyJson(readJsonFile(*options.configPath));
        }
        request.timeoutMs = options.timeoutMs;
        request.consoleEnabled = options.consoleEnabled;
    } catch (const UsageError &e) {
        std::cerr << "Error: " << e.what() << "\n\n";
        printUsage(argv[0]);
        return EXIT_USAGE;
    }

    SBX::SandboxRuntimeManager manager(config);
    SBX::ScriptResult result = manager.execute(request);

    std::cout << SBX::JsonUtils::toPrettyString(result.toJson()) << "\n";
    SBX::Logger::flush();

    if (result.isSuccess()) {
        return EXIT_OK;
    }
    return result.getErrorTag() == SBX::ErrorTag::SandboxUnavailable ? EXIT_UNAVAILABLE : EXIT_SCRIPT_FAILURE;
}
