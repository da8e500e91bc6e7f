#include "sandbox/command_resolver.h"
#include "config/engine_properties.h"
#include "utils/string_utils.h"
#include "utils/log.h"
#include <stdexcept>

namespace proctor {
namespace sandbox {

std::string languageToString(Language language) {
    switch (language) {
        case Language::PYTHON: return "python";
        case Language::JAVASCRIPT: return "javascript";
        case Language::CPP: return "cpp";
        default: return "unknown";
    }
}

Language languageFromString(const std::string& name) {
    const std::string lower = utils::toLower(utils::trim(name));
    if (lower == "python") return Language::PYTHON;
    if (lower == "javascript") return Language::JAVASCRIPT;
    if (lower == "cpp") return Language::CPP;
    throw std::invalid_argument("Unsupported language: " + name);
}

CommandResolver::CommandResolver() {
    profiles_[Language::PYTHON] = {
        "python:3.11-slim", "py", {"python", "/code/solution.py"}};
    profiles_[Language::JAVASCRIPT] = {
        "node:20-slim", "js", {"node", "/code/solution.js"}};
    profiles_[Language::CPP] = {
        "gcc:13", "cpp",
        {"sh", "-c", "g++ -o /code/solution /code/solution.cpp && /code/solution"}};
}

CommandResolver::CommandResolver(const EngineProperties& props) : CommandResolver() {
    for (auto& [language, profile] : profiles_) {
        std::string image = props.getImageOverride(languageToString(language));
        if (!image.empty()) {
            LOGI_FMT("Image override for " << languageToString(language) << ": " << image);
            profile.image = image;
        }
    }
}

const LanguageProfile& CommandResolver::resolve(Language language) const {
    auto it = profiles_.find(language);
    if (it == profiles_.end()) {
        throw std::invalid_argument("No command registered for language " +
                                    std::to_string(static_cast<int>(language)));
    }
    return it->second;
}

std::string CommandResolver::sourceFileName(Language language) const {
    return "solution." + resolve(language).extension;
}

std::vector<std::string> CommandResolver::wrapCommandWithInput(const std::vector<std::string>& command,
                                                               const std::string& inputPath) {
    return {"sh", "-c", "cat " + inputPath + " | " + utils::shellJoin(command)};
}

} // namespace sandbox
} // namespace proctor
