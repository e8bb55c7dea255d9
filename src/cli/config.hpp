//! # Configuration
//!
//! Reads `semdiff.toml`. Only the `[diff]` section is used:
//!
//! | Key            | Type            | Default | Description                           |
//! |----------------|-----------------|---------|---------------------------------------|
//! | `threads`      | integer         | `0`     | extraction workers, 0 = all cores     |
//! | `changed-only` | boolean         | `true`  | analyse only files that differ        |
//! | `output-dir`   | string          | `"./"`  | where the report files are written    |
//! | `exclude`      | string or array | empty   | path prefixes that are never analysed |
//!
//! ## TOML Parser
//!
//! `SimpleTomlParser` handles the subset needed here: `[section]` headers,
//! `key = value` pairs with strings, integers, booleans and string arrays,
//! and `#` comments.

#ifndef SEMDIFF_CLI_CONFIG_HPP
#define SEMDIFF_CLI_CONFIG_HPP

#include "common.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace semdiff::cli {

/// Settings from the [diff] section
struct DiffSettings {
    unsigned threads = 0;
    bool changed_only = true;
    std::string output_dir = "./";
    std::vector<std::string> exclude;
};

struct Config {
    DiffSettings diff;

    /// Loads a configuration file. Syntax errors are `Usage` errors.
    [[nodiscard]] static auto load(const std::filesystem::path& path) -> Result<Config, DiffError>;

    /// Loads `path`, or `semdiff.toml` from the current directory when `path`
    /// is empty. A missing default file yields the defaults; a missing
    /// explicit file is an error.
    [[nodiscard]] static auto load_or_default(const std::string& path)
        -> Result<Config, DiffError>;

    [[nodiscard]] static auto parse(const std::string& content) -> Result<Config, DiffError>;
};

class SimpleTomlParser {
public:
    explicit SimpleTomlParser(const std::string& content) : content_(content) {}

    [[nodiscard]] auto parse() -> Result<Config, DiffError>;

private:
    std::string content_;
    std::string error_message_;
    size_t pos_ = 0;
    int line_ = 1;

    void skip_whitespace();
    void skip_comment();
    bool skip_line_end();
    bool is_eof() const {
        return pos_ >= content_.size();
    }
    char peek() const {
        return is_eof() ? '\0' : content_[pos_];
    }
    char advance();

    std::string parse_identifier();
    bool parse_string(std::string& out);
    bool parse_number(unsigned& out);
    bool parse_boolean(bool& out);
    bool parse_string_list(std::vector<std::string>& out);

    bool parse_diff_entry(const std::string& key, DiffSettings& settings);
    bool skip_value();

    void set_error(const std::string& message);
};

/// Splits "a, b,c" into trimmed, non-empty items.
[[nodiscard]] auto split_list(const std::string& text) -> std::vector<std::string>;

} // namespace semdiff::cli

#endif // SEMDIFF_CLI_CONFIG_HPP
