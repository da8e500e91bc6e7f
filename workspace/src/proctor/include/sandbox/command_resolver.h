#ifndef PROCTOR_SANDBOX_COMMAND_RESOLVER_H
#define PROCTOR_SANDBOX_COMMAND_RESOLVER_H

#include "sandbox/execution_types.h"
#include <string>
#include <vector>
#include <map>

namespace proctor {

class EngineProperties;

namespace sandbox {

/**
 * @brief How one language is run inside the sandbox
 */
struct LanguageProfile {
    std::string image;                  ///< Container image tag
    std::string extension;              ///< Source file extension, no dot
    std::vector<std::string> command;   ///< argv run inside the container
};

/// Mount point of the working directory inside the sandbox
constexpr const char* SANDBOX_MOUNT_POINT = "/code";
/// Test input path inside the sandbox
constexpr const char* SANDBOX_INPUT_PATH = "/code/input.txt";
/// Host-side file name of the test input
constexpr const char* INPUT_FILE_NAME = "input.txt";

/**
 * @brief Language wire name ("python", "javascript", "cpp")
 */
std::string languageToString(Language language);

/**
 * @brief Parse a language wire name
 * @throws std::invalid_argument for an unregistered language
 */
Language languageFromString(const std::string& name);

/**
 * @brief Maps a language to its image, file extension and command
 *
 * The table is fixed at construction; image tags may be overridden from
 * configuration (sandbox.image.<language>).
 */
class CommandResolver {
public:
    /**
     * @brief Built-in table
     */
    CommandResolver();

    /**
     * @brief Built-in table with configured image overrides applied
     */
    explicit CommandResolver(const EngineProperties& props);

    /**
     * @throws std::invalid_argument if the language has no entry
     */
    const LanguageProfile& resolve(Language language) const;

    /**
     * @brief Source file name for a language, e.g. "solution.py"
     */
    std::string sourceFileName(Language language) const;

    /**
     * @brief Wrap argv so the input file is piped into its stdin
     *
     * Produces {"sh", "-c", "cat <inputPath> | <quoted argv>"}.
     */
    static std::vector<std::string> wrapCommandWithInput(const std::vector<std::string>& command,
                                                         const std::string& inputPath = SANDBOX_INPUT_PATH);

private:
    std::map<Language, LanguageProfile> profiles_;
};

} // namespace sandbox
} // namespace proctor

#endif // PROCTOR_SANDBOX_COMMAND_RESOLVER_H
