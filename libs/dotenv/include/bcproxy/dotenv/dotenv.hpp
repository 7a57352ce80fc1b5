#pragma once

#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace bcproxy::dotenv {

    struct LoadResult {
        std::size_t loaded{0};
        std::size_t skipped{0};
        std::size_t errors{0};
        std::vector<std::string> error_messages;
    };

    using Assignment = std::pair<std::string, std::string>;

    // Parses one line of a .env file. Blank lines and comments yield std::nullopt.
    // Accepts an optional leading "export", single or double quoted values and
    // trailing " #" comments on unquoted values.
    std::expected<std::optional<Assignment>, std::string> parse_line(std::string_view line);

    // Load a single .env file if it exists.
    // If override_existing is true, values overwrite existing environment variables.
    LoadResult load_env_file(const std::filesystem::path& path, bool override_existing = false);

    // Non-empty environment value, or the fallback.
    std::string get_env(std::string_view key, std::string_view fallback = {});

} // namespace bcproxy::dotenv
