/**
 * @file test_cli.cpp
 * @brief End-to-end tests of the canonhash command line: hashing, canonical output,
 *        config overrides, stdin input and field listing.
 */

#include <cstdlib>
#include <filesystem>
#include <format>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

namespace {

namespace fs = std::filesystem;

constexpr std::string_view kJohnDoeSha256 = "68MhDYWaHp32aTr3UL3wy805NKvTT+JZQlGWeMqvt68=";
constexpr std::string_view kJohnDoeSha256Hex =
    "ebc3210d859a1e9df6693af750bdf0cbcd3934abd34fe25942519678caafb7af";
constexpr std::string_view kJohnDoeSha512 =
    "e6xqqbp6orPHAKKTjtS9QhI8xqbYYTng1baxzrlQ6QFptMXHvB7f4+zwRJQh+ps2xJwvp7qa2QZeCgq8AnJg8A==";

class TempDir
{
public:
    explicit TempDir(const std::string& name)
        : m_path(fs::temp_directory_path() / name)
    {
        fs::remove_all(m_path);
        fs::create_directories(m_path);
    }

    ~TempDir()
    {
        std::error_code ec;
        fs::remove_all(m_path, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;
    TempDir(TempDir&&) = delete;
    TempDir& operator=(TempDir&&) = delete;

    [[nodiscard]] const fs::path& path() const { return m_path; }

private:
    fs::path m_path;
};

[[nodiscard]] std::string quote_path(const fs::path& path)
{
    return std::format("\"{}\"", path.string());
}

[[nodiscard]] int run_command(const std::string& command)
{
    return std::system(command.c_str());
}

void write_file(const fs::path& path, const std::string& content)
{
    std::ofstream out(path);
    out << content;
}

[[nodiscard]] std::string read_file(const fs::path& path)
{
    std::ifstream in(path);
    if (!in.is_open()) {
        throw std::runtime_error("Failed to open " + path.string());
    }
    return {std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
}

nlohmann::json field_json(std::string_view name, int order, std::string_view type)
{
    return nlohmann::json{
        { "name",  name},
        {"order", order},
        { "type",  type}
    };
}

/// Catalog, documents and output files of one CLI run
class CliFixture : public ::testing::Test
{
protected:
    CliFixture()
        : m_temp_dir(std::format("canonhash_cli_{}",
                                 ::testing::UnitTest::GetInstance()->current_test_info()->name()))
    {
        const nlohmann::json catalog = {
            {"schema_version", "type_catalog.v1"},
            {         "types",
             nlohmann::json::array(
             {{{"name", "Person"},
             {"fields",
             nlohmann::json::array({field_json("name", 1, "string"),
             field_json("age", 2, "integer")})}},
             {{"name", "Employee"},
             {"extends", "Person"},
             {"fields",
             nlohmann::json::array({field_json("score", 3, "number"),
             field_json("reports", 1, "list<Person>"),
             field_json("hired", 2, "timestamp")})}}})}
        };
        write_file(catalog_path(), catalog.dump(2));
        write_file(person_path(), R"({"age": 30, "cache": "stale", "name": "John Doe"})");
        write_file(employee_path(),
                   R"({"name": "Ada", "age": 36, "reports": [{"name": "Bob", "age": 25}]})");
    }

    [[nodiscard]] fs::path catalog_path() const { return m_temp_dir.path() / "catalog.json"; }
    [[nodiscard]] fs::path person_path() const { return m_temp_dir.path() / "person.json"; }
    [[nodiscard]] fs::path employee_path() const { return m_temp_dir.path() / "employee.json"; }
    [[nodiscard]] fs::path config_path() const { return m_temp_dir.path() / "config.json"; }
    [[nodiscard]] fs::path stdout_path() const { return m_temp_dir.path() / "stdout.txt"; }
    [[nodiscard]] fs::path stderr_path() const { return m_temp_dir.path() / "stderr.txt"; }

    /// canonhash <command> --catalog ... --schema-dir ... <extra>, stdout and stderr captured
    [[nodiscard]] std::string command(std::string_view subcommand, const std::string& extra) const
    {
        const fs::path canonhash_bin = fs::path(CANONHASH_BIN_DIR) / "canonhash";
        return std::format("{} {} --catalog {} --schema-dir {} {} > {} 2> {}",
                           quote_path(canonhash_bin),
                           subcommand,
                           quote_path(catalog_path()),
                           quote_path(fs::path(CANONHASH_SCHEMA_DIR)),
                           extra,
                           quote_path(stdout_path()),
                           quote_path(stderr_path()));
    }

    [[nodiscard]] std::string output() const { return read_file(stdout_path()); }
    [[nodiscard]] std::string errors() const { return read_file(stderr_path()); }

private:
    TempDir m_temp_dir;
};

}  // namespace

TEST_F(CliFixture, HashPrintsBase64Digest)
{
    const auto cmd = command("hash", std::format("--type Person --input {}", quote_path(person_path())));
    ASSERT_EQ(run_command(cmd), 0) << cmd << "\n" << errors();
    EXPECT_EQ(output(), std::format("{}\n", kJohnDoeSha256));
}

TEST_F(CliFixture, HashReadsDocumentFromStdin)
{
    const auto cmd = command("hash", std::format("--type Person < {}", quote_path(person_path())));
    ASSERT_EQ(run_command(cmd), 0) << cmd << "\n" << errors();
    EXPECT_EQ(output(), std::format("{}\n", kJohnDoeSha256));
}

TEST_F(CliFixture, HashHexFormat)
{
    const auto cmd = command(
        "hash", std::format("--type Person --input {} --format hex", quote_path(person_path())));
    ASSERT_EQ(run_command(cmd), 0) << cmd << "\n" << errors();
    EXPECT_EQ(output(), std::format("{}\n", kJohnDoeSha256Hex));
}

TEST_F(CliFixture, AlgorithmFlagOverridesConfig)
{
    write_file(config_path(),
               R"({"schema_version": "canonhash_config.v1", "default_algorithm": "SHA-512"})");

    const auto from_config = command(
        "hash",
        std::format("--type Person --input {} --config {}",
                    quote_path(person_path()),
                    quote_path(config_path())));
    ASSERT_EQ(run_command(from_config), 0) << from_config << "\n" << errors();
    EXPECT_EQ(output(), std::format("{}\n", kJohnDoeSha512));

    const auto overridden = command(
        "hash",
        std::format("--type Person --input {} --config {} --algorithm sha-256",
                    quote_path(person_path()),
                    quote_path(config_path())));
    ASSERT_EQ(run_command(overridden), 0) << overridden << "\n" << errors();
    EXPECT_EQ(output(), std::format("{}\n", kJohnDoeSha256));
}

TEST_F(CliFixture, MaxDepthFlagOverridesConfig)
{
    write_file(config_path(), R"({"schema_version": "canonhash_config.v1", "max_depth": 1})");

    const auto limited = command(
        "hash",
        std::format("--type Employee --input {} --config {}",
                    quote_path(employee_path()),
                    quote_path(config_path())));
    EXPECT_NE(run_command(limited), 0) << limited;
    EXPECT_NE(errors().find("Nesting deeper than 1"), std::string::npos) << errors();

    const auto overridden = command(
        "hash",
        std::format("--type Employee --input {} --config {} --max-depth 8",
                    quote_path(employee_path()),
                    quote_path(config_path())));
    ASSERT_EQ(run_command(overridden), 0) << overridden << "\n" << errors();
    EXPECT_FALSE(output().empty());
}

TEST_F(CliFixture, UnsupportedAlgorithmFails)
{
    const auto cmd = command(
        "hash", std::format("--type Person --input {} --algorithm MD9", quote_path(person_path())));
    EXPECT_NE(run_command(cmd), 0) << cmd;
    EXPECT_TRUE(output().empty());
    EXPECT_NE(errors().find("Unsupported digest algorithm: MD9"), std::string::npos) << errors();
}

TEST_F(CliFixture, CanonicalPrintsEncodedDocument)
{
    const auto cmd =
        command("canonical", std::format("--type Employee --input {}", quote_path(employee_path())));
    ASSERT_EQ(run_command(cmd), 0) << cmd << "\n" << errors();
    EXPECT_EQ(output(), "{\"reports\":[{\"name\":\"Bob\",\"age\":25}],\"name\":\"Ada\",\"age\":36}\n");
}

TEST_F(CliFixture, FieldsListsVisitingOrder)
{
    const auto cmd = command("fields", "--type Employee");
    ASSERT_EQ(run_command(cmd), 0) << cmd << "\n" << errors();
    EXPECT_EQ(output(),
              "Employee\n"
              "       1  reports\n"
              "       2  hired\n"
              "       3  score\n"
              "Person\n"
              "       1  name\n"
              "       2  age\n");
}

TEST_F(CliFixture, UnknownTypeFails)
{
    const auto cmd = command("fields", "--type Nobody");
    EXPECT_NE(run_command(cmd), 0) << cmd;
    EXPECT_NE(errors().find("Nobody"), std::string::npos) << errors();
}

TEST(CliTest, AlgorithmsMarksDefault)
{
    TempDir temp_dir("canonhash_cli_algorithms");
    const fs::path out = temp_dir.path() / "stdout.txt";
    const auto cmd = std::format("{} algorithms > {}",
                                 quote_path(fs::path(CANONHASH_BIN_DIR) / "canonhash"),
                                 quote_path(out));
    ASSERT_EQ(run_command(cmd), 0) << cmd;
    const std::string listing = read_file(out);
    EXPECT_NE(listing.find("SHA-256 (default)\n"), std::string::npos) << listing;
    EXPECT_NE(listing.find("SHA-512\n"), std::string::npos) << listing;
}
