#include "bcproxy/dotenv/dotenv.hpp"

#include <cctype>
#include <cstdlib>
#include <fstream>

namespace bcproxy::dotenv {

    static std::string_view trim(std::string_view input) {
        while (!input.empty() && std::isspace(static_cast<unsigned char>(input.front()))) {
            input.remove_prefix(1);
        }
        while (!input.empty() && std::isspace(static_cast<unsigned char>(input.back()))) {
            input.remove_suffix(1);
        }
        return input;
    }

    static bool valid_key(std::string_view key) {
        if (key.empty() || std::isdigit(static_cast<unsigned char>(key.front()))) {
            return false;
        }
        for (char ch : key) {
            if (!std::isalnum(static_cast<unsigned char>(ch)) && ch != '_' && ch != '.') {
                return false;
            }
        }
        return true;
    }

    // Double quoted values understand \n, \r, \t, \" and \\.
    static std::string unescape_double_quoted(std::string_view body) {
        std::string out;
        out.reserve(body.size());
        for (std::size_t i = 0; i < body.size(); ++i) {
            char ch = body[i];
            if (ch == '\\' && i + 1 < body.size()) {
                char next = body[++i];
                switch (next) {
                    case 'n': out.push_back('\n'); break;
                    case 'r': out.push_back('\r'); break;
                    case 't': out.push_back('\t'); break;
                    case '"': out.push_back('"'); break;
                    case '\\': out.push_back('\\'); break;
                    default:
                        out.push_back('\\');
                        out.push_back(next);
                        break;
                }
            } else {
                out.push_back(ch);
            }
        }
        return out;
    }

    std::expected<std::optional<Assignment>, std::string> parse_line(std::string_view line) {
        auto trimmed = trim(line);
        if (trimmed.empty() || trimmed.front() == '#') {
            return std::nullopt;
        }

        if (trimmed.starts_with("export ")) {
            trimmed = trim(trimmed.substr(7));
        }

        const auto eq_pos = trimmed.find('=');
        if (eq_pos == std::string_view::npos) {
            return std::unexpected("missing '='");
        }

        auto key = trim(trimmed.substr(0, eq_pos));
        if (!valid_key(key)) {
            return std::unexpected("invalid key '" + std::string(key) + "'");
        }

        auto value = trim(trimmed.substr(eq_pos + 1));
        if (!value.empty() && (value.front() == '"' || value.front() == '\'')) {
            const char quote = value.front();
            auto close = std::string_view::npos;
            for (std::size_t i = 1; i < value.size(); ++i) {
                if (quote == '"' && value[i] == '\\') {
                    ++i;
                } else if (value[i] == quote) {
                    close = i;
                    break;
                }
            }
            if (close == std::string_view::npos) {
                return std::unexpected("unterminated quote");
            }
            auto body = value.substr(1, close - 1);
            std::string parsed = quote == '"' ? unescape_double_quoted(body) : std::string(body);
            return Assignment{std::string(key), std::move(parsed)};
        }

        if (auto comment = value.find(" #"); comment != std::string_view::npos) {
            value = trim(value.substr(0, comment));
        }
        return Assignment{std::string(key), std::string(value)};
    }

    static bool set_env_var(const std::string& key, const std::string& value, bool override_existing) {
        const char* existing = std::getenv(key.c_str());
        if (existing && !override_existing) {
            return false;
        }
        return ::setenv(key.c_str(), value.c_str(), 1) == 0;
    }

    LoadResult load_env_file(const std::filesystem::path& path, bool override_existing) {
        LoadResult result;

        std::error_code exists_ec;
        if (!std::filesystem::exists(path, exists_ec)) {
            result.skipped++;
            return result;
        }

        std::ifstream file(path);
        if (!file) {
            result.errors++;
            result.error_messages.push_back("Failed to open " + path.string());
            return result;
        }

        std::string line;
        std::size_t line_no = 0;
        while (std::getline(file, line)) {
            ++line_no;
            auto parsed = parse_line(line);
            if (!parsed) {
                result.errors++;
                result.error_messages.push_back(path.string() + ":" + std::to_string(line_no) + ": " + parsed.error());
                continue;
            }
            if (!parsed->has_value()) {
                continue;
            }

            const auto& [key, value] = **parsed;
            if (set_env_var(key, value, override_existing)) {
                result.loaded++;
            } else {
                result.skipped++;
            }
        }

        return result;
    }

    std::string get_env(std::string_view key, std::string_view fallback) {
        std::string key_str(key);
        const char* value = std::getenv(key_str.c_str());
        if (value && *value) {
            return std::string(value);
        }
        return std::string(fallback);
    }

} // namespace bcproxy::dotenv
