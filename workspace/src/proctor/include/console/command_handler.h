/**
 * @file command_handler.h
 * @brief Operator console for the proctoring engine
 */

#ifndef PROCTOR_CONSOLE_COMMAND_HANDLER_H
#define PROCTOR_CONSOLE_COMMAND_HANDLER_H

#include <atomic>
#include <functional>
#include <map>
#include <string>
#include <vector>

namespace proctor {

namespace sandbox {
class SandboxRunner;
}

namespace anticheat {
class MetricsAggregator;
}

namespace console {

/**
 * @brief Command result structure
 */
struct CommandResult {
    bool success;
    std::string message;

    CommandResult(bool s = true, const std::string& m = "")
        : success(s), message(m) {}
};

/**
 * @brief Command handler for processing terminal user input
 *
 * Provides an interactive console over the engine:
 * - run <language> <file> [stdin_file] - Execute a source file once
 * - test <language> <file> <cases_file> - Execute against JSON test cases
 * - event <session> <type> [details_json] - Record a behavioral event
 * - summary <session> - Show the anti-cheat report of a session
 * - complete <session> - Drop a finished session
 * - backend - Show the selected execution backend
 * - help - Show help text
 * - exit - Exit the command interface
 *
 * Results are printed as indented JSON.
 */
class CommandHandler {
public:
    /**
     * @param runner Sandbox runner; must outlive the handler
     * @param aggregator Anti-cheat aggregator; must outlive the handler
     */
    CommandHandler(sandbox::SandboxRunner& runner, anticheat::MetricsAggregator& aggregator);

    ~CommandHandler();

    /**
     * @brief Process a command line
     * @param commandLine Full command line string
     * @return Command result
     */
    CommandResult processCommand(const std::string& commandLine);

    /**
     * @brief Get help text for all commands
     */
    std::string getHelpText() const;

    /**
     * @brief Run interactive command loop
     *
     * Reads commands with readline until 'exit', EOF or requestExit().
     */
    void runInteractive();

    /**
     * @brief Stop the interactive loop after the current command
     */
    void requestExit();

    bool exitRequested() const { return exitRequested_; }

private:
    using CommandFunc = std::function<CommandResult(const std::vector<std::string>&)>;

    sandbox::SandboxRunner& runner_;
    anticheat::MetricsAggregator& aggregator_;

    std::map<std::string, CommandFunc> commands_;

    std::atomic<bool> exitRequested_;

    void registerCommands();

    std::vector<std::string> parseCommandLine(const std::string& commandLine);

    CommandResult handleRun(const std::vector<std::string>& args);
    CommandResult handleTest(const std::vector<std::string>& args);
    CommandResult handleEvent(const std::vector<std::string>& args);
    CommandResult handleSummary(const std::vector<std::string>& args);
    CommandResult handleComplete(const std::vector<std::string>& args);
    CommandResult handleBackend(const std::vector<std::string>& args);
    CommandResult handleHelp(const std::vector<std::string>& args);
    CommandResult handleExit(const std::vector<std::string>& args);

    /**
     * @brief Read a whole file
     * @throws std::runtime_error if the file cannot be opened
     */
    static std::string readFile(const std::string& path);
};

} // namespace console
} // namespace proctor

#endif // PROCTOR_CONSOLE_COMMAND_HANDLER_H
