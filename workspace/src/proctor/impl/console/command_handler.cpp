/**
 * @file command_handler.cpp
 * @brief Implementation of the operator console
 */

#include "console/command_handler.h"
#include "sandbox/sandbox_runner.h"
#include "sandbox/command_resolver.h"
#include "anticheat/metrics_aggregator.h"
#include "utils/log.h"
#include <nlohmann/json.hpp>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>

#include <readline/readline.h>
#include <readline/history.h>

namespace proctor {
namespace console {

CommandHandler::CommandHandler(sandbox::SandboxRunner& runner, anticheat::MetricsAggregator& aggregator)
    : runner_(runner)
    , aggregator_(aggregator)
    , exitRequested_(false) {
    registerCommands();
}

CommandHandler::~CommandHandler() {
}

void CommandHandler::requestExit() {
    exitRequested_ = true;
}

void CommandHandler::registerCommands() {
    commands_["run"] = [this](const std::vector<std::string>& args) { return handleRun(args); };
    commands_["test"] = [this](const std::vector<std::string>& args) { return handleTest(args); };
    commands_["event"] = [this](const std::vector<std::string>& args) { return handleEvent(args); };
    commands_["summary"] = [this](const std::vector<std::string>& args) { return handleSummary(args); };
    commands_["complete"] = [this](const std::vector<std::string>& args) { return handleComplete(args); };
    commands_["backend"] = [this](const std::vector<std::string>& args) { return handleBackend(args); };
    commands_["help"] = [this](const std::vector<std::string>& args) { return handleHelp(args); };
    commands_["exit"] = [this](const std::vector<std::string>& args) { return handleExit(args); };
}

std::vector<std::string> CommandHandler::parseCommandLine(const std::string& commandLine) {
    std::vector<std::string> tokens;
    std::istringstream iss(commandLine);
    std::string token;

    while (iss >> token) {
        tokens.push_back(token);
    }

    return tokens;
}

CommandResult CommandHandler::processCommand(const std::string& commandLine) {
    auto tokens = parseCommandLine(commandLine);

    if (tokens.empty()) {
        return CommandResult(true, "");
    }

    std::string command = tokens[0];
    std::vector<std::string> args(tokens.begin() + 1, tokens.end());

    auto it = commands_.find(command);
    if (it != commands_.end()) {
        try {
            return it->second(args);
        } catch (const std::exception& e) {
            return CommandResult(false, std::string("Error executing command: ") + e.what());
        }
    } else {
        return CommandResult(false, "Unknown command: " + command + ". Type 'help' for available commands.");
    }
}

std::string CommandHandler::getHelpText() const {
    std::ostringstream oss;
    oss << "Available commands:\n";
    oss << "  run <language> <file> [stdin_file]      - Execute a source file once\n";
    oss << "  test <language> <file> <cases_file>     - Execute against a JSON array of\n";
    oss << "                                            {\"input\", \"output\"} test cases\n";
    oss << "  event <session> <type> [details_json]   - Record a behavioral event\n";
    oss << "  summary <session>                       - Show the anti-cheat report of a session\n";
    oss << "  complete <session>                      - Drop a finished session\n";
    oss << "  backend                                 - Show the selected execution backend\n";
    oss << "  help                                    - Show this help message\n";
    oss << "  exit                                    - Exit the command interface\n";
    oss << "Languages: python, javascript, cpp\n";
    return oss.str();
}

void CommandHandler::runInteractive() {
    std::cout << "Proctor Interactive Command Interface\n";
    std::cout << "Type 'help' for available commands, 'exit' to quit.\n";
    std::cout << "Use UP/DOWN arrow keys to navigate command history.\n\n";

    exitRequested_ = false;

    while (!exitRequested_) {
        char* line = readline("proctor> ");

        if (!line) {
            // Ctrl+D
            std::cout << "\n";
            break;
        }

        std::string commandLine(line);

        commandLine.erase(0, commandLine.find_first_not_of(" \t\n\r"));
        commandLine.erase(commandLine.find_last_not_of(" \t\n\r") + 1);

        if (!commandLine.empty()) {
            add_history(line);

            CommandResult result = processCommand(commandLine);

            if (!result.message.empty()) {
                std::cout << result.message << "\n";
            }

            if (!result.success) {
                std::cout << "[ERROR] Command failed\n";
            }
        }

        free(line);
    }

    std::cout << "Exiting command interface.\n";
}

std::string CommandHandler::readFile(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open file: " + path);
    }
    std::ostringstream content;
    content << file.rdbuf();
    return content.str();
}

CommandResult CommandHandler::handleRun(const std::vector<std::string>& args) {
    if (args.size() < 2 || args.size() > 3) {
        return CommandResult(false, "Usage: run <language> <file> [stdin_file]");
    }

    sandbox::ExecutionRequest request;
    request.language = sandbox::languageFromString(args[0]);
    request.code = readFile(args[1]);
    if (args.size() == 3) {
        request.stdinData = readFile(args[2]);
    }

    sandbox::ExecutionResult result = runner_.execute(request);
    return CommandResult(result.success, nlohmann::json(result).dump(2));
}

CommandResult CommandHandler::handleTest(const std::vector<std::string>& args) {
    if (args.size() != 3) {
        return CommandResult(false, "Usage: test <language> <file> <cases_file>");
    }

    sandbox::ExecutionRequest request;
    request.language = sandbox::languageFromString(args[0]);
    request.code = readFile(args[1]);

    nlohmann::json cases = nlohmann::json::parse(readFile(args[2]));
    if (!cases.is_array() || cases.empty()) {
        return CommandResult(false, "Test case file must hold a non-empty JSON array");
    }
    request.testCases = cases.get<std::vector<sandbox::TestCase>>();

    sandbox::ExecutionResult result = runner_.execute(request);
    return CommandResult(result.success, nlohmann::json(result).dump(2));
}

CommandResult CommandHandler::handleEvent(const std::vector<std::string>& args) {
    if (args.size() < 2) {
        return CommandResult(false, "Usage: event <session> <type> [details_json]");
    }

    anticheat::EventType type = anticheat::eventTypeFromString(args[1]);

    // The tokenizer splits the JSON on whitespace; glue it back together
    nlohmann::json details = nlohmann::json::object();
    if (args.size() > 2) {
        std::string text;
        for (size_t i = 2; i < args.size(); ++i) {
            if (i > 2) {
                text += ' ';
            }
            text += args[i];
        }
        details = nlohmann::json::parse(text);
    }

    anticheat::RecordResult result = aggregator_.recordEvent(args[0], type, details);
    return CommandResult(true, nlohmann::json(result).dump(2));
}

CommandResult CommandHandler::handleSummary(const std::vector<std::string>& args) {
    if (args.size() != 1) {
        return CommandResult(false, "Usage: summary <session>");
    }

    anticheat::InterviewSummary summary = aggregator_.getInterviewSummary(args[0]);
    return CommandResult(true, nlohmann::json(summary).dump(2));
}

CommandResult CommandHandler::handleComplete(const std::vector<std::string>& args) {
    if (args.size() != 1) {
        return CommandResult(false, "Usage: complete <session>");
    }

    if (!aggregator_.store().complete(args[0])) {
        return CommandResult(false, "Unknown session: " + args[0]);
    }
    return CommandResult(true, "Session " + args[0] + " completed");
}

CommandResult CommandHandler::handleBackend(const std::vector<std::string>& args) {
    const sandbox::BackendSelection& selection = runner_.selection();

    nlohmann::json info = {
        {"backend", sandbox::backendKindToString(selection.kind)},
        {"enabled", selection.isEnabled()},
        {"reason", selection.reason}
    };
    if (selection.backend) {
        const sandbox::LimitPolicy& policy = selection.backend->policy();
        info["timeout_seconds"] = policy.timeout().count();
        info["memory_limit"] = policy.memoryLimit();
        info["cpu_quota"] = policy.cpuQuota();
    }
    return CommandResult(true, info.dump(2));
}

CommandResult CommandHandler::handleHelp(const std::vector<std::string>& args) {
    return CommandResult(true, getHelpText());
}

CommandResult CommandHandler::handleExit(const std::vector<std::string>& args) {
    exitRequested_ = true;
    return CommandResult(true, "Exiting...");
}

} // namespace console
} // namespace proctor
