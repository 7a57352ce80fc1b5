#include "bcproxy/log/Log.hpp"

#include <filesystem>
#include <memory>
#include <vector>

#include <spdlog/async.h>
#include <spdlog/async_logger.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace bcproxy::log {
    static std::shared_ptr<spdlog::logger> make_logger(const Options& o) {
        std::vector<spdlog::sink_ptr> sinks;

        if (o.to_console) {
            sinks.emplace_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
        }
        if (o.to_file && !o.file_path.empty()) {
            auto parent = std::filesystem::path(o.file_path).parent_path();
            if (!parent.empty()) {
                std::filesystem::create_directories(parent);
            }
            sinks.emplace_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                o.file_path, o.max_file_bytes, o.max_files));
        }

        if (o.async) {
            static bool pool_inited = false;
            if (!pool_inited) {
                // Queue size, worker threads
                spdlog::init_thread_pool(1 << 16, 1);
                pool_inited = true;
            }
            return std::make_shared<spdlog::async_logger>(
                "bcproxy", sinks.begin(), sinks.end(), spdlog::thread_pool(),
                spdlog::async_overflow_policy::overrun_oldest);
        }
        return std::make_shared<spdlog::logger>("bcproxy", sinks.begin(), sinks.end());
    }

    void init(const Options& opts) {
        auto logger = make_logger(opts);

        logger->set_level(static_cast<spdlog::level::level_enum>(opts.level));
        logger->set_pattern(opts.pattern);
        logger->flush_on(static_cast<spdlog::level::level_enum>(opts.flush_on));

        spdlog::drop("bcproxy");
        spdlog::register_logger(logger);
        spdlog::set_default_logger(logger);
    }

    std::optional<int> parse_level(std::string_view name) {
        auto lvl = spdlog::level::from_str(std::string(name));
        // from_str falls back to "off" for anything it does not recognize.
        if (lvl == spdlog::level::off && name != "off") {
            return std::nullopt;
        }
        return static_cast<int>(lvl);
    }

} // namespace bcproxy::log
