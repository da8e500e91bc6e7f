#include <gtest/gtest.h>
#include "sandbox/command_resolver.h"
#include "config/engine_properties.h"

using namespace proctor;
using namespace proctor::sandbox;

TEST(CommandResolverTest, LanguageNames) {
    EXPECT_EQ(languageToString(Language::PYTHON), "python");
    EXPECT_EQ(languageToString(Language::JAVASCRIPT), "javascript");
    EXPECT_EQ(languageToString(Language::CPP), "cpp");

    EXPECT_EQ(languageFromString("python"), Language::PYTHON);
    EXPECT_EQ(languageFromString(" JavaScript "), Language::JAVASCRIPT);
    EXPECT_EQ(languageFromString("cpp"), Language::CPP);
    EXPECT_THROW(languageFromString("ruby"), std::invalid_argument);
}

TEST(CommandResolverTest, PythonProfile) {
    CommandResolver resolver;
    const LanguageProfile& profile = resolver.resolve(Language::PYTHON);

    EXPECT_EQ(profile.image, "python:3.11-slim");
    EXPECT_EQ(profile.extension, "py");
    EXPECT_EQ(profile.command, (std::vector<std::string>{"python", "/code/solution.py"}));
    EXPECT_EQ(resolver.sourceFileName(Language::PYTHON), "solution.py");
}

TEST(CommandResolverTest, JavaScriptProfile) {
    CommandResolver resolver;
    const LanguageProfile& profile = resolver.resolve(Language::JAVASCRIPT);

    EXPECT_EQ(profile.image, "node:20-slim");
    EXPECT_EQ(profile.command, (std::vector<std::string>{"node", "/code/solution.js"}));
    EXPECT_EQ(resolver.sourceFileName(Language::JAVASCRIPT), "solution.js");
}

TEST(CommandResolverTest, CppCompilesThenRuns) {
    CommandResolver resolver;
    const LanguageProfile& profile = resolver.resolve(Language::CPP);

    EXPECT_EQ(profile.image, "gcc:13");
    ASSERT_EQ(profile.command.size(), 3u);
    EXPECT_EQ(profile.command[0], "sh");
    EXPECT_EQ(profile.command[1], "-c");
    EXPECT_EQ(profile.command[2], "g++ -o /code/solution /code/solution.cpp && /code/solution");
}

TEST(CommandResolverTest, UnknownLanguageValueThrows) {
    CommandResolver resolver;
    EXPECT_THROW(resolver.resolve(static_cast<Language>(99)), std::invalid_argument);
}

TEST(CommandResolverTest, ImageOverrideFromProperties) {
    EngineProperties props;
    props.setImageOverride("python", "registry.local/python:3.12");

    CommandResolver resolver(props);
    EXPECT_EQ(resolver.resolve(Language::PYTHON).image, "registry.local/python:3.12");
    EXPECT_EQ(resolver.resolve(Language::JAVASCRIPT).image, "node:20-slim");
}

TEST(CommandResolverTest, WrapCommandPipesInputFile) {
    auto wrapped = CommandResolver::wrapCommandWithInput({"python", "/code/solution.py"});

    ASSERT_EQ(wrapped.size(), 3u);
    EXPECT_EQ(wrapped[0], "sh");
    EXPECT_EQ(wrapped[1], "-c");
    EXPECT_EQ(wrapped[2], "cat /code/input.txt | python /code/solution.py");
}

TEST(CommandResolverTest, WrapQuotesCompoundCommand) {
    CommandResolver resolver;
    auto wrapped = CommandResolver::wrapCommandWithInput(resolver.resolve(Language::CPP).command);

    EXPECT_EQ(wrapped[2],
              "cat /code/input.txt | sh -c 'g++ -o /code/solution /code/solution.cpp && /code/solution'");
}
