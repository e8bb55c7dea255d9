#include "config.hpp"

#include "log/log.hpp"

#include <cctype>
#include <fstream>
#include <limits>
#include <sstream>

namespace semdiff::cli {

// ============================================================================
// Config
// ============================================================================

auto Config::parse(const std::string& content) -> Result<Config, DiffError> {
    SimpleTomlParser parser(content);
    return parser.parse();
}

auto Config::load(const std::filesystem::path& path) -> Result<Config, DiffError> {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return DiffError{DiffErrorKind::Usage, "cannot open config file '" + path.string() + "'"};
    }
    std::ostringstream content;
    content << in.rdbuf();

    auto result = parse(content.str());
    if (is_err(result)) {
        auto error = unwrap_err(result);
        error.message = path.string() + ": " + error.message;
        return error;
    }
    SEMDIFF_LOG_DEBUG("cli", "loaded configuration from " << path.string());
    return result;
}

auto Config::load_or_default(const std::string& path) -> Result<Config, DiffError> {
    if (!path.empty()) {
        return load(path);
    }
    std::error_code ec;
    if (std::filesystem::exists("semdiff.toml", ec)) {
        return load("semdiff.toml");
    }
    return Config{};
}

auto split_list(const std::string& text) -> std::vector<std::string> {
    std::vector<std::string> out;
    std::stringstream ss(text);
    std::string item;
    while (std::getline(ss, item, ',')) {
        auto begin = item.find_first_not_of(" \t");
        if (begin == std::string::npos) {
            continue;
        }
        auto end = item.find_last_not_of(" \t");
        out.push_back(item.substr(begin, end - begin + 1));
    }
    return out;
}

// ============================================================================
// SimpleTomlParser
// ============================================================================

auto SimpleTomlParser::parse() -> Result<Config, DiffError> {
    Config config;
    std::string section;

    while (true) {
        // Blank and comment lines
        skip_whitespace();
        skip_comment();
        if (is_eof()) {
            break;
        }
        if (peek() == '\n' || peek() == '\r') {
            advance();
            continue;
        }

        if (peek() == '[') {
            advance();
            skip_whitespace();
            section = parse_identifier();
            skip_whitespace();
            if (section.empty() || peek() != ']') {
                set_error("malformed section header");
                return DiffError{DiffErrorKind::Usage, error_message_};
            }
            advance();
            if (section != "diff") {
                SEMDIFF_LOG_WARN("cli", "ignoring unknown config section [" << section << "]");
            }
            if (!skip_line_end()) {
                return DiffError{DiffErrorKind::Usage, error_message_};
            }
            continue;
        }

        std::string key = parse_identifier();
        if (key.empty()) {
            set_error("expected a key");
            return DiffError{DiffErrorKind::Usage, error_message_};
        }
        skip_whitespace();
        if (peek() != '=') {
            set_error("expected '=' after '" + key + "'");
            return DiffError{DiffErrorKind::Usage, error_message_};
        }
        advance();
        skip_whitespace();

        bool ok = section == "diff" ? parse_diff_entry(key, config.diff) : skip_value();
        if (!ok || !skip_line_end()) {
            return DiffError{DiffErrorKind::Usage, error_message_};
        }
    }

    return config;
}

void SimpleTomlParser::skip_whitespace() {
    while (peek() == ' ' || peek() == '\t') {
        advance();
    }
}

void SimpleTomlParser::skip_comment() {
    if (peek() == '#') {
        while (!is_eof() && peek() != '\n') {
            advance();
        }
    }
}

bool SimpleTomlParser::skip_line_end() {
    skip_whitespace();
    skip_comment();
    if (is_eof()) {
        return true;
    }
    if (peek() == '\r') {
        advance();
    }
    if (peek() != '\n') {
        set_error("unexpected '" + std::string(1, peek()) + "'");
        return false;
    }
    advance();
    return true;
}

char SimpleTomlParser::advance() {
    char c = content_[pos_++];
    if (c == '\n') {
        ++line_;
    }
    return c;
}

std::string SimpleTomlParser::parse_identifier() {
    std::string out;
    while (!is_eof()) {
        char c = peek();
        if (std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-' || c == '.') {
            out += advance();
        } else {
            break;
        }
    }
    return out;
}

bool SimpleTomlParser::parse_string(std::string& out) {
    char quote = peek();
    if (quote != '"' && quote != '\'') {
        set_error("expected a string");
        return false;
    }
    advance();
    out.clear();

    while (!is_eof() && peek() != quote) {
        char c = advance();
        if (c == '\n') {
            set_error("unterminated string");
            return false;
        }
        // Literal strings ('...') have no escapes
        if (c == '\\' && quote == '"' && !is_eof()) {
            char e = advance();
            switch (e) {
            case 'n':
                out += '\n';
                break;
            case 't':
                out += '\t';
                break;
            case '"':
            case '\\':
                out += e;
                break;
            default:
                set_error("invalid escape '\\" + std::string(1, e) + "'");
                return false;
            }
            continue;
        }
        out += c;
    }

    if (is_eof()) {
        set_error("unterminated string");
        return false;
    }
    advance();
    return true;
}

bool SimpleTomlParser::parse_number(unsigned& out) {
    if (!std::isdigit(static_cast<unsigned char>(peek()))) {
        set_error("expected a non-negative integer");
        return false;
    }
    uint64_t value = 0;
    while (std::isdigit(static_cast<unsigned char>(peek())) || peek() == '_') {
        char c = advance();
        if (c == '_') {
            continue;
        }
        value = value * 10 + static_cast<uint64_t>(c - '0');
        if (value > std::numeric_limits<unsigned>::max()) {
            set_error("integer out of range");
            return false;
        }
    }
    out = static_cast<unsigned>(value);
    return true;
}

bool SimpleTomlParser::parse_boolean(bool& out) {
    std::string word = parse_identifier();
    if (word == "true") {
        out = true;
        return true;
    }
    if (word == "false") {
        out = false;
        return true;
    }
    set_error("expected true or false");
    return false;
}

bool SimpleTomlParser::parse_string_list(std::vector<std::string>& out) {
    auto skip_blank = [this] {
        while (true) {
            skip_whitespace();
            skip_comment();
            if (peek() == '\n' || peek() == '\r') {
                advance();
            } else {
                break;
            }
        }
    };

    advance(); // [
    out.clear();
    skip_blank();
    while (peek() != ']') {
        std::string item;
        if (!parse_string(item)) {
            return false;
        }
        out.push_back(std::move(item));
        skip_blank();
        if (peek() == ',') {
            advance();
            skip_blank();
        } else if (peek() != ']') {
            set_error("expected ',' or ']' in array");
            return false;
        }
    }
    advance(); // ]
    return true;
}

bool SimpleTomlParser::parse_diff_entry(const std::string& key, DiffSettings& settings) {
    if (key == "threads") {
        return parse_number(settings.threads);
    }
    if (key == "changed-only" || key == "changed_only") {
        return parse_boolean(settings.changed_only);
    }
    if (key == "output-dir" || key == "output_dir") {
        return parse_string(settings.output_dir);
    }
    if (key == "exclude") {
        if (peek() == '[') {
            return parse_string_list(settings.exclude);
        }
        std::string text;
        if (!parse_string(text)) {
            return false;
        }
        settings.exclude = split_list(text);
        return true;
    }

    SEMDIFF_LOG_WARN("cli", "ignoring unknown config key diff." << key);
    return skip_value();
}

bool SimpleTomlParser::skip_value() {
    if (peek() == '"' || peek() == '\'') {
        std::string ignored;
        return parse_string(ignored);
    }
    if (peek() == '[') {
        std::vector<std::string> ignored;
        return parse_string_list(ignored);
    }
    if (parse_identifier().empty()) {
        set_error("expected a value");
        return false;
    }
    return true;
}

void SimpleTomlParser::set_error(const std::string& message) {
    error_message_ = "line " + std::to_string(line_) + ": " + message;
}

} // namespace semdiff::cli
