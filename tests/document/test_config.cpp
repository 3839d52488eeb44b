/**
 * @file test_config.cpp
 * @brief CLI configuration parsing and loading
 */

#include "canonhash/config.hpp"

#include <filesystem>
#include <fstream>
#include <string>
#include <system_error>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

namespace canonhash::config::test {

using json = nlohmann::json;

namespace {

class TempDir
{
public:
    explicit TempDir(const std::string& name)
        : m_path(std::filesystem::temp_directory_path() / name)
    {
        std::filesystem::remove_all(m_path);
        std::filesystem::create_directories(m_path);
    }
    ~TempDir()
    {
        std::error_code ec;
        std::filesystem::remove_all(m_path, ec);
    }
    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    [[nodiscard]] const std::filesystem::path& path() const { return m_path; }

private:
    std::filesystem::path m_path;
};

void write_file(const std::filesystem::path& path, const std::string& content)
{
    std::ofstream out(path);
    out << content;
}

}  // namespace

TEST(ConfigTest, DefaultsWhenSettingsOmitted)
{
    auto config = parse_config(json{
        {"schema_version", "canonhash_config.v1"}
    });
    ASSERT_TRUE(config) << config.error().message;
    EXPECT_EQ(config->default_algorithm, "SHA-256");
    EXPECT_EQ(config->max_depth, kDefaultMaxDepth);
}

TEST(ConfigTest, ParsesSettings)
{
    auto config = parse_config(json{
        {"schema_version",    "canonhash_config.v1"},
        {"default_algorithm", "sha-512"            },
        {"max_depth",         64                   }
    });
    ASSERT_TRUE(config) << config.error().message;
    EXPECT_EQ(config->default_algorithm, "sha-512");
    EXPECT_EQ(config->max_depth, 64U);
}

TEST(ConfigTest, UnknownAlgorithmIsUnsupported)
{
    auto config = parse_config(json{
        {"schema_version",    "canonhash_config.v1"},
        {"default_algorithm", "MD9"                }
    });
    ASSERT_FALSE(config);
    EXPECT_TRUE(config.error().is(error_code::kUnsupportedAlgorithm));
}

TEST(ConfigTest, NonPositiveDepthIsRejected)
{
    for (int depth : {0, -1}) {
        SCOPED_TRACE(depth);
        auto config = parse_config(json{
            {"schema_version", "canonhash_config.v1"},
            {"max_depth",      depth                }
        });
        ASSERT_FALSE(config);
        EXPECT_TRUE(config.error().is(error_code::kInvalidArgument));
    }

    auto fractional = parse_config(json{
        {"max_depth", 2.5}
    });
    ASSERT_FALSE(fractional);
    EXPECT_TRUE(fractional.error().is(error_code::kInvalidArgument));
}

TEST(ConfigTest, MalformedDocuments)
{
    auto not_object = parse_config(json::array());
    ASSERT_FALSE(not_object);
    EXPECT_TRUE(not_object.error().is(error_code::kInvalidArgument));

    auto version = parse_config(json{
        {"schema_version", "canonhash_config.v0"}
    });
    ASSERT_FALSE(version);
    EXPECT_TRUE(version.error().is(error_code::kInvalidArgument));

    auto wrong_type = parse_config(json{
        {"default_algorithm", 256}
    });
    ASSERT_FALSE(wrong_type);
    EXPECT_TRUE(wrong_type.error().is(error_code::kInvalidArgument));
}

TEST(ConfigTest, LoadFromFile)
{
    TempDir temp_dir("canonhash_config_test");

    const auto valid_path = temp_dir.path() / "config.json";
    write_file(valid_path,
               R"({"schema_version": "canonhash_config.v1", "default_algorithm": "SHA-384", "max_depth": 8})");
    auto loaded = load_config(valid_path, CANONHASH_SCHEMA_DIR);
    ASSERT_TRUE(loaded) << loaded.error().message;
    EXPECT_EQ(loaded->default_algorithm, "SHA-384");
    EXPECT_EQ(loaded->max_depth, 8U);

    const auto extra_path = temp_dir.path() / "extra.json";
    write_file(extra_path, R"({"schema_version": "canonhash_config.v1", "verbose": true})");
    auto extra = load_config(extra_path, CANONHASH_SCHEMA_DIR);
    ASSERT_FALSE(extra);
    EXPECT_TRUE(extra.error().is(error_code::kSchemaValidationFailed));

    const auto broken_path = temp_dir.path() / "broken.json";
    write_file(broken_path, "{\"schema_version\": ");
    auto broken = load_config(broken_path, CANONHASH_SCHEMA_DIR);
    ASSERT_FALSE(broken);
    EXPECT_TRUE(broken.error().is(error_code::kParseError));

    auto missing = load_config(temp_dir.path() / "missing.json", CANONHASH_SCHEMA_DIR);
    ASSERT_FALSE(missing);
    EXPECT_TRUE(missing.error().is(error_code::kIOError));
}

}  // namespace canonhash::config::test
