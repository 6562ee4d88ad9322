/**
 * Unit tests for placeholder resolution and environment handling
 */

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>

#include "src/variables/resolver/variable_resolver.hpp"

using variables::VariableMap;
using variables::VariableResolver;

namespace {
    const char* const ENVIRONMENTS = R"({
        "$shared": { "host": "shared.example", "version": "v1" },
        "dev": { "token": "dev-token" },
        "prod": { "token": "prod-token", "host": "prod.example", "retries": 3 }
    })";
}  // namespace

class VariableResolverTest : public ::testing::Test {
   protected:
    void SetUp() override { resolver_.load_environment_json(ENVIRONMENTS); }

    VariableResolver resolver_;
};

// ============================================================================
// Placeholder resolution
// ============================================================================

TEST_F(VariableResolverTest, FileVariableResolves) {
    const VariableMap file{{"token", "1"}};
    EXPECT_EQ(resolver_.resolve("{{token}}", {}, file), "1");
}

TEST_F(VariableResolverTest, LocalShadowsFileShadowsEnvironment) {
    const VariableMap local{{"token", "2"}};
    const VariableMap file{{"token", "1"}};

    EXPECT_EQ(resolver_.resolve("{{token}}", local, file), "2");
    EXPECT_EQ(resolver_.resolve("{{token}}", {}, file), "1");
    EXPECT_EQ(resolver_.resolve("{{token}}"), "dev-token");
}

TEST_F(VariableResolverTest, NamesAreCaseInsensitiveAndTrimmed) {
    const VariableMap file{{"BaseUrl", "https://x"}};
    EXPECT_EQ(resolver_.resolve("{{ baseurl }}/a", {}, file), "https://x/a");
}

TEST_F(VariableResolverTest, UnknownPlaceholdersPassThrough) {
    EXPECT_EQ(resolver_.resolve("a {{missing}} b"), "a {{missing}} b");
    EXPECT_EQ(resolver_.resolve("{{$nope}}"), "{{$nope}}");
    EXPECT_EQ(resolver_.resolve("{{unterminated"), "{{unterminated");
}

TEST_F(VariableResolverTest, BuiltinsTakePrecedence) {
    const VariableMap file{{"$guid", "shadowed"}};
    const std::string guid = resolver_.resolve("{{$guid}}", {}, file);
    EXPECT_EQ(guid.size(), 36U);
    EXPECT_NE(guid, "shadowed");
}

TEST_F(VariableResolverTest, ResolutionIsSinglePass) {
    const VariableMap file{{"a", "{{b}}"}, {"b", "deep"}};
    EXPECT_EQ(resolver_.resolve("{{a}}", {}, file), "{{b}}");
}

TEST_F(VariableResolverTest, EmptyInputStaysEmpty) { EXPECT_EQ(resolver_.resolve(""), ""); }

// ============================================================================
// Environments
// ============================================================================

TEST_F(VariableResolverTest, DefaultEnvironmentIsDev) {
    EXPECT_EQ(resolver_.current_environment(), "dev");
    EXPECT_EQ(resolver_.lookup_environment("host"), "shared.example");
}

TEST_F(VariableResolverTest, SelectedEnvironmentShadowsShared) {
    resolver_.set_environment("prod");

    EXPECT_EQ(resolver_.resolve("{{host}}/{{version}}"), "prod.example/v1");
    EXPECT_EQ(resolver_.resolve("{{token}}"), "prod-token");
}

TEST_F(VariableResolverTest, NonStringValuesAreIgnored) {
    resolver_.set_environment("prod");
    EXPECT_FALSE(resolver_.lookup_environment("retries").has_value());
}

TEST_F(VariableResolverTest, EmptyEnvironmentNameFallsBackToDev) {
    resolver_.set_environment("prod");
    resolver_.set_environment("");
    EXPECT_EQ(resolver_.current_environment(), "dev");
}

TEST_F(VariableResolverTest, UnknownEnvironmentStillSeesShared) {
    resolver_.set_environment("staging");
    EXPECT_EQ(resolver_.resolve("{{host}}"), "shared.example");
    EXPECT_EQ(resolver_.resolve("{{token}}"), "{{token}}");
}

TEST_F(VariableResolverTest, EnvironmentNamesExcludeShared) {
    const auto names = resolver_.environment_names();
    ASSERT_EQ(names.size(), 2U);
    EXPECT_EQ(names[0], "dev");
    EXPECT_EQ(names[1], "prod");
}

TEST_F(VariableResolverTest, SetVariableOverridesEnvironmentUntilReload) {
    resolver_.set_variable("token", "override");
    EXPECT_EQ(resolver_.resolve("{{token}}"), "override");

    const VariableMap file{{"token", "file"}};
    EXPECT_EQ(resolver_.resolve("{{token}}", {}, file), "file");

    resolver_.load_environment_json(ENVIRONMENTS);
    EXPECT_EQ(resolver_.resolve("{{token}}"), "dev-token");
}

TEST_F(VariableResolverTest, MalformedDocumentLeavesEnvironmentEmpty) {
    resolver_.load_environment_json("{ not json");
    EXPECT_TRUE(resolver_.environment_names().empty());
    EXPECT_EQ(resolver_.resolve("{{host}}"), "{{host}}");

    resolver_.load_environment_json("[1, 2]");
    EXPECT_TRUE(resolver_.environment_names().empty());
}

TEST_F(VariableResolverTest, LoadsEnvironmentFromFile) {
    const std::filesystem::path path = std::filesystem::temp_directory_path() / "courier_test_http-client.env.json";
    {
        std::ofstream out(path);
        out << R"({"dev": {"host": "from-file"}})";
    }

    resolver_.load_environment(path);
    EXPECT_EQ(resolver_.resolve("{{host}}"), "from-file");

    std::filesystem::remove(path);
}

TEST_F(VariableResolverTest, MissingFileLeavesEnvironmentEmpty) {
    resolver_.load_environment(std::filesystem::temp_directory_path() / "courier_no_such_env_file.json");
    EXPECT_TRUE(resolver_.environment_names().empty());
}
