/**
 * @file main.cpp
 * @brief canonhash CLI entry point
 *
 * Commands:
 *   hash        - Hash a JSON document as a catalog type
 *   canonical   - Print the canonical encoding of a JSON document
 *   algorithms  - List supported digest algorithms
 *   fields      - Show the hashed fields of a catalog type
 *   version     - Show version information
 */

#include "canonhash/canonical_json.hpp"
#include "canonhash/canonicalizer.hpp"
#include "canonhash/common.hpp"
#include "canonhash/config.hpp"
#include "canonhash/digest.hpp"
#include "canonhash/document_schema.hpp"
#include "canonhash/hasher.hpp"
#include "canonhash/version.hpp"

#include <charconv>
#include <cstdio>
#include <exception>
#include <fstream>
#include <iostream>
#include <optional>
#include <print>
#include <ranges>
#include <span>
#include <string>
#include <string_view>
#include <system_error>

#include <nlohmann/json.hpp>

namespace {

void print_version()
{
    std::println("canonhash {} ({})", canonhash::kVersion, canonhash::kBuildId);
    std::println("  encoding:  {}", canonhash::kEncodingVersion);
    std::println("  algorithm: {} (default)", canonhash::kDefaultAlgorithm);
}

void print_help()
{
    std::print(R"(canonhash - Deterministic hashing of structured values

Usage: canonhash <command> [options]

Commands:
  hash        Hash a JSON document as a catalog type
  canonical   Print the canonical encoding of a JSON document
  algorithms  List supported digest algorithms
  fields      Show the hashed fields of a catalog type, in visiting order
  version     Show version information

Global Options:
  --help, -h          Show this help message
  --version, -v       Show version information

Run 'canonhash <command> --help' for command-specific options.
)");
}

void print_hash_help()
{
    std::print(R"(Usage: canonhash hash [options]

Hash a JSON document as a catalog type

Options:
  --catalog FILE            Type catalog (type_catalog.v1) (required)
  --type NAME               Root type of the document (required)
  --input FILE, -i          Document to hash, '-' for stdin (default: -)
  --algorithm ALG, -a       Digest algorithm (default: SHA-256)
  --format base64|hex       Output encoding of the digest (default: base64)
  --config FILE             Configuration file (canonhash_config.v1)
  --max-depth N             Maximum nesting depth (default: 256)
  --schema-dir DIR          Path to schema directory (default: ./schemas)
  --verbose                 Report progress on stderr
  --help, -h                Show this help
)");
}

void print_canonical_help()
{
    std::print(R"(Usage: canonhash canonical [options]

Print the canonical encoding of a JSON document

Options:
  --catalog FILE            Type catalog (type_catalog.v1) (required)
  --type NAME               Root type of the document (required)
  --input FILE, -i          Document to encode, '-' for stdin (default: -)
  --config FILE             Configuration file (canonhash_config.v1)
  --max-depth N             Maximum nesting depth (default: 256)
  --schema-dir DIR          Path to schema directory (default: ./schemas)
  --verbose                 Report progress on stderr
  --help, -h                Show this help
)");
}

void print_fields_help()
{
    std::print(R"(Usage: canonhash fields [options]

Show the hashed fields of a catalog type, own fields first, then each ancestor

Options:
  --catalog FILE            Type catalog (type_catalog.v1) (required)
  --type NAME               Type to describe (required)
  --schema-dir DIR          Path to schema directory (default: ./schemas)
  --help, -h                Show this help
)");
}

struct DocumentOptions
{
    std::string catalog;
    std::string type;
    std::string input;
    std::optional<std::string> config;
    std::optional<std::size_t> max_depth;
    std::string schema_dir;
    bool verbose;
};

struct HashOptions
{
    DocumentOptions document;
    std::optional<std::string> algorithm;
    std::string format;
    bool show_help;
};

struct CanonicalOptions
{
    DocumentOptions document;
    bool show_help;
};

struct FieldsOptions
{
    std::string catalog;
    std::string type;
    std::string schema_dir;
    bool show_help;
};

[[nodiscard]] DocumentOptions default_document_options()
{
    return DocumentOptions{.catalog = std::string{},
                           .type = std::string{},
                           .input = "-",
                           .config = std::nullopt,
                           .max_depth = std::nullopt,
                           .schema_dir = "schemas",
                           .verbose = false};
}

// CLI parsing signature is stable.
// NOLINTNEXTLINE(bugprone-easily-swappable-parameters)
[[nodiscard]] auto read_option_value(std::span<char*> args,
                                     std::size_t index,
                                     std::string_view option) -> canonhash::Result<std::string>
{
    const std::size_t value_index = index + 1;
    if (value_index >= args.size() || args[value_index] == nullptr) {
        return std::unexpected(
            canonhash::Error::make(std::string(canonhash::error_code::kMissingArgument),
                                   std::string("Missing value for option: ") + std::string(option)));
    }
    return std::string(args[value_index]);
}

[[nodiscard]] canonhash::Result<std::size_t> parse_max_depth_value(std::string_view value)
{
    std::size_t parsed = 0;
    const char* begin = value.data();
    const char* end = value.data() + value.size();
    auto [ptr, ec] = std::from_chars(begin, end, parsed);
    if (ec != std::errc{} || ptr != end || parsed == 0) {
        return std::unexpected(
            canonhash::Error::make(std::string(canonhash::error_code::kInvalidArgument),
                                   std::string("Invalid --max-depth value: ") + std::string(value)));
    }
    return parsed;
}

[[nodiscard]] canonhash::Error unknown_option(std::string_view arg)
{
    return canonhash::Error::make(std::string(canonhash::error_code::kInvalidArgument),
                                  std::string("Unknown option: ") + std::string(arg));
}

[[nodiscard]] auto set_document_option(std::string_view arg,
                                       // CLI parsing signature is stable.
                                       // NOLINTNEXTLINE(bugprone-easily-swappable-parameters)
                                       std::span<char*> args,
                                       std::size_t idx,
                                       DocumentOptions& options,
                                       bool& skip_next) -> canonhash::Result<bool>
{
    if (arg == "--verbose") {
        options.verbose = true;
        return canonhash::Result<bool>{true};
    }

    std::string* target = nullptr;
    if (arg == "--catalog") {
        target = &options.catalog;
    } else if (arg == "--type") {
        target = &options.type;
    } else if (arg == "--input" || arg == "-i") {
        target = &options.input;
    } else if (arg == "--schema-dir") {
        target = &options.schema_dir;
    } else if (arg != "--config" && arg != "--max-depth") {
        return canonhash::Result<bool>{false};
    }

    auto value = read_option_value(args, idx, arg);
    if (!value) {
        return std::unexpected(value.error());
    }
    skip_next = true;

    if (target != nullptr) {
        *target = *value;
    } else if (arg == "--config") {
        options.config = *value;
    } else {
        auto parsed = parse_max_depth_value(*value);
        if (!parsed) {
            return std::unexpected(parsed.error());
        }
        options.max_depth = *parsed;
    }
    return canonhash::Result<bool>{true};
}

[[nodiscard]] auto set_hash_option(std::string_view arg,
                                   // CLI parsing signature is stable.
                                   // NOLINTNEXTLINE(bugprone-easily-swappable-parameters)
                                   std::span<char*> args,
                                   std::size_t idx,
                                   HashOptions& options,
                                   bool& skip_next) -> canonhash::Result<bool>
{
    if (arg == "--algorithm" || arg == "-a") {
        auto value = read_option_value(args, idx, arg);
        if (!value) {
            return std::unexpected(value.error());
        }
        options.algorithm = *value;
        skip_next = true;
        return canonhash::Result<bool>{true};
    }
    if (arg == "--format") {
        auto value = read_option_value(args, idx, arg);
        if (!value) {
            return std::unexpected(value.error());
        }
        if (*value != "base64" && *value != "hex") {
            return std::unexpected(
                canonhash::Error::make(std::string(canonhash::error_code::kInvalidArgument),
                                       "Invalid --format value: " + *value));
        }
        options.format = *value;
        skip_next = true;
        return canonhash::Result<bool>{true};
    }
    return set_document_option(arg, args, idx, options.document, skip_next);
}

[[nodiscard]] canonhash::Result<HashOptions> parse_hash_args(std::span<char*> args)
{
    HashOptions options{.document = default_document_options(),
                        .algorithm = std::nullopt,
                        .format = "base64",
                        .show_help = false};
    bool skip_next = false;
    for (auto [i, arg_ptr] : std::views::enumerate(args)) {
        if (skip_next) {
            skip_next = false;
            continue;
        }
        if (arg_ptr == nullptr) {
            continue;
        }
        const auto idx = static_cast<std::size_t>(i);
        std::string_view arg(arg_ptr);
        if (arg == "--help" || arg == "-h") {
            options.show_help = true;
            continue;
        }
        auto handled = set_hash_option(arg, args, idx, options, skip_next);
        if (!handled) {
            return std::unexpected(handled.error());
        }
        if (!*handled) {
            return std::unexpected(unknown_option(arg));
        }
    }
    return options;
}

[[nodiscard]] canonhash::Result<CanonicalOptions> parse_canonical_args(std::span<char*> args)
{
    CanonicalOptions options{.document = default_document_options(), .show_help = false};
    bool skip_next = false;
    for (auto [i, arg_ptr] : std::views::enumerate(args)) {
        if (skip_next) {
            skip_next = false;
            continue;
        }
        if (arg_ptr == nullptr) {
            continue;
        }
        const auto idx = static_cast<std::size_t>(i);
        std::string_view arg(arg_ptr);
        if (arg == "--help" || arg == "-h") {
            options.show_help = true;
            continue;
        }
        auto handled = set_document_option(arg, args, idx, options.document, skip_next);
        if (!handled) {
            return std::unexpected(handled.error());
        }
        if (!*handled) {
            return std::unexpected(unknown_option(arg));
        }
    }
    return options;
}

[[nodiscard]] canonhash::Result<FieldsOptions> parse_fields_args(std::span<char*> args)
{
    FieldsOptions options{.catalog = std::string{},
                          .type = std::string{},
                          .schema_dir = "schemas",
                          .show_help = false};
    bool skip_next = false;
    for (auto [i, arg_ptr] : std::views::enumerate(args)) {
        if (skip_next) {
            skip_next = false;
            continue;
        }
        if (arg_ptr == nullptr) {
            continue;
        }
        const auto idx = static_cast<std::size_t>(i);
        std::string_view arg(arg_ptr);
        if (arg == "--help" || arg == "-h") {
            options.show_help = true;
            continue;
        }
        std::string* target = nullptr;
        if (arg == "--catalog") {
            target = &options.catalog;
        } else if (arg == "--type") {
            target = &options.type;
        } else if (arg == "--schema-dir") {
            target = &options.schema_dir;
        } else {
            return std::unexpected(unknown_option(arg));
        }
        auto value = read_option_value(args, idx, arg);
        if (!value) {
            return std::unexpected(value.error());
        }
        *target = *value;
        skip_next = true;
    }
    return options;
}

[[nodiscard]] canonhash::Result<nlohmann::json> read_document(const std::string& input)
{
    nlohmann::json document;
    try {
        if (input == "-") {
            std::cin >> document;
            return document;
        }
        std::ifstream in(input);
        if (!in) {
            return std::unexpected(canonhash::Error::make(std::string(canonhash::error_code::kIOError),
                                                          "Failed to open input file: " + input));
        }
        in >> document;
    } catch (const nlohmann::json::exception& ex) {
        return std::unexpected(
            canonhash::Error::make(std::string(canonhash::error_code::kParseError),
                                   "Failed to parse input document " + input + ": " + ex.what()));
    }
    return document;
}

/// Everything needed to canonicalize one document
struct LoadedDocument
{
    canonhash::config::Config config;
    canonhash::document::TypeCatalog catalog;
    nlohmann::json document;
};

[[nodiscard]] canonhash::Result<LoadedDocument> load_document(const DocumentOptions& options,
                                                              std::string_view command)
{
    canonhash::config::Config config;
    if (options.config) {
        auto loaded = canonhash::config::load_config(*options.config, options.schema_dir);
        if (!loaded) {
            return std::unexpected(loaded.error());
        }
        config = std::move(*loaded);
        if (options.verbose) {
            std::println(stderr, "[{}] Loaded config {}", command, *options.config);
        }
    }
    if (options.max_depth) {
        config.max_depth = *options.max_depth;
    }

    auto catalog = canonhash::document::TypeCatalog::load(options.catalog, options.schema_dir);
    if (!catalog) {
        return std::unexpected(catalog.error());
    }
    if (options.verbose) {
        std::println(stderr,
                     "[{}] Loaded catalog {} ({} types)",
                     command,
                     options.catalog,
                     catalog->type_names().size());
    }

    auto document = read_document(options.input);
    if (!document) {
        return std::unexpected(document.error());
    }
    return LoadedDocument{.config = std::move(config),
                          .catalog = std::move(*catalog),
                          .document = std::move(*document)};
}

[[nodiscard]] int run_hash(const HashOptions& options)
{
    auto loaded = load_document(options.document, "hash");
    if (!loaded) {
        std::println(stderr, "Error: {}", loaded.error().message);
        return 1;
    }
    auto root = loaded->catalog.bind(loaded->document, options.document.type);
    if (!root) {
        std::println(stderr, "Error: {}", root.error().message);
        return 1;
    }

    const std::string algorithm = options.algorithm.value_or(loaded->config.default_algorithm);
    const canonhash::canonical::JsonCanonicalEncoder encoder{};
    const canonhash::Hasher hasher(canonhash::digest::default_registry(),
                                   encoder,
                                   canonhash::CanonicalizeOptions{.max_depth = loaded->config.max_depth});

    auto digest = hasher.digest(*root, algorithm);
    if (!digest) {
        std::println(stderr, "Error: hash failed: {}", digest.error().message);
        return 1;
    }

    if (options.document.verbose) {
        std::println(stderr,
                     "[hash] {} of {} ({} bytes)",
                     algorithm,
                     options.document.type,
                     digest->size());
    }
    std::println("{}",
                 options.format == "hex" ? canonhash::common::to_hex(*digest)
                                         : canonhash::common::base64_encode(*digest));
    return 0;
}

[[nodiscard]] int run_canonical(const CanonicalOptions& options)
{
    auto loaded = load_document(options.document, "canonical");
    if (!loaded) {
        std::println(stderr, "Error: {}", loaded.error().message);
        return 1;
    }
    auto root = loaded->catalog.bind(loaded->document, options.document.type);
    if (!root) {
        std::println(stderr, "Error: {}", root.error().message);
        return 1;
    }

    const canonhash::Canonicalizer canonicalizer(
        canonhash::CanonicalizeOptions{.max_depth = loaded->config.max_depth});
    auto tree = canonicalizer.canonicalize(*root);
    if (!tree) {
        std::println(stderr, "Error: canonicalize failed: {}", tree.error().message);
        return 1;
    }
    auto encoded = canonhash::canonical::encode_json(*tree);
    if (!encoded) {
        std::println(stderr, "Error: encode failed: {}", encoded.error().message);
        return 1;
    }

    if (options.document.verbose) {
        std::println(stderr, "[canonical] {} ({} bytes)", options.document.type, encoded->size());
    }
    std::println("{}", *encoded);
    return 0;
}

[[nodiscard]] int run_fields(const FieldsOptions& options)
{
    auto catalog = canonhash::document::TypeCatalog::load(options.catalog, options.schema_dir);
    if (!catalog) {
        std::println(stderr, "Error: {}", catalog.error().message);
        return 1;
    }
    const canonhash::TypeSchema* schema = catalog->find(options.type);
    if (schema == nullptr) {
        std::println(stderr, "Error: Unknown type '{}'", options.type);
        return 1;
    }

    for (; schema != nullptr; schema = schema->base() ? schema->base()->schema : nullptr) {
        std::println("{}", schema->type_name());
        for (const auto& field : schema->own_fields()) {
            std::println("  {:>6}  {}", field.descriptor.order_key, field.descriptor.name);
        }
    }
    return 0;
}

[[nodiscard]] int run_algorithms()
{
    for (const auto& name : canonhash::supported_algorithms()) {
        if (canonhash::common::iequals(name, canonhash::kDefaultAlgorithm)) {
            std::println("{} (default)", name);
        } else {
            std::println("{}", name);
        }
    }
    return 0;
}

[[nodiscard]] bool require_document_options(const DocumentOptions& options)
{
    if (options.catalog.empty() || options.type.empty()) {
        std::println(stderr, "Error: --catalog and --type are required");
        return false;
    }
    return true;
}

int cmd_hash(int argc, char** argv)
{
    auto args = std::span<char*>(argv, static_cast<std::size_t>(argc));
    auto options = parse_hash_args(args);
    if (!options) {
        std::println(stderr, "Error: {}", options.error().message);
        return 1;
    }
    if (options->show_help) {
        print_hash_help();
        return 0;
    }
    if (!require_document_options(options->document)) {
        print_hash_help();
        return 1;
    }
    return run_hash(*options);
}

int cmd_canonical(int argc, char** argv)
{
    auto args = std::span<char*>(argv, static_cast<std::size_t>(argc));
    auto options = parse_canonical_args(args);
    if (!options) {
        std::println(stderr, "Error: {}", options.error().message);
        return 1;
    }
    if (options->show_help) {
        print_canonical_help();
        return 0;
    }
    if (!require_document_options(options->document)) {
        print_canonical_help();
        return 1;
    }
    return run_canonical(*options);
}

int cmd_fields(int argc, char** argv)
{
    auto args = std::span<char*>(argv, static_cast<std::size_t>(argc));
    auto options = parse_fields_args(args);
    if (!options) {
        std::println(stderr, "Error: {}", options.error().message);
        return 1;
    }
    if (options->show_help) {
        print_fields_help();
        return 0;
    }
    if (options->catalog.empty() || options->type.empty()) {
        std::println(stderr, "Error: --catalog and --type are required");
        print_fields_help();
        return 1;
    }
    return run_fields(*options);
}

}  // namespace

namespace {

[[nodiscard]] int run_cli(int argc, char** argv)
{
    try {
        if (argc < 2) {
            print_help();
            return 1;
        }

        std::string_view cmd = argv[1];

        if (cmd == "--help" || cmd == "-h" || cmd == "help") {
            print_help();
            return 0;
        }
        if (cmd == "--version" || cmd == "-v" || cmd == "version") {
            print_version();
            return 0;
        }

        int sub_argc = argc - 2;
        char** sub_argv = argv + 2;

        if (cmd == "hash") {
            return cmd_hash(sub_argc, sub_argv);
        }
        if (cmd == "canonical") {
            return cmd_canonical(sub_argc, sub_argv);
        }
        if (cmd == "algorithms") {
            return run_algorithms();
        }
        if (cmd == "fields") {
            return cmd_fields(sub_argc, sub_argv);
        }

        std::println(stderr, "Unknown command: {}", cmd);
        print_help();
        return 1;
    } catch (const std::exception& ex) {
        try {
            std::println(stderr, "Error: {}", ex.what());
        } catch (...) {
            std::terminate();
        }
        return 1;
    } catch (...) {
        try {
            std::println(stderr, "Error: unknown exception");
        } catch (...) {
            std::terminate();
        }
        return 1;
    }
}

}  // namespace

int main(int argc, char** argv)
{
    return run_cli(argc, argv);
}
