#pragma once
#include <unordered_map>
#include <mutex>
#include <memory>
#include <filesystem>
#include <string>
#include <vector>
#include <spdlog/spdlog.h>

// hash function for fmt::string_view<char> to use in unordered_map
namespace std {
template <>
    struct hash<fmt::basic_string_view<char>> {
        size_t operator()(const fmt::basic_string_view<char>& s) const noexcept {
            return std::hash<std::string_view>{}(std::string_view(s.data(), s.size()));
        }
    };
}

class Logger {
public:
    explicit Logger(std::shared_ptr<spdlog::logger> logger)
        : m_logger(std::move(logger)) {}

    void set_verbosity(int verbosity);
    void set_banner(const std::string& banner){ m_banner = banner; }
    void set_arguments(int argc, char* argv[]);
    void set_arguments(const std::vector<std::string>&);
    void set_dedup_limit(int limit){ m_dedup_limit = limit; }

    template <typename... Args>
    inline void trace(fmt::format_string<Args...> format, Args&&... args) {
        m_logger->trace(format, std::forward<Args>(args)...);
    }

    template <typename... Args>
    inline void debug(fmt::format_string<Args...> format, Args&&... args) {
        m_logger->debug(format, std::forward<Args>(args)...);
    }

    template <typename... Args>
    inline void info(fmt::format_string<Args...> format, Args&&... args) {
        m_logger->info(format, std::forward<Args>(args)...);
    }

    // warn() and error() are deduplicated by format string, see set_dedup_limit()
    template <typename... Args>
    inline void warn(fmt::format_string<Args...> format, Args&&... args) {
        log_dedup(spdlog::level::warn, format, std::forward<Args>(args)...);
    }

    template <typename... Args>
    inline void error(fmt::format_string<Args...> format, Args&&... args) {
        log_dedup(spdlog::level::err, format, std::forward<Args>(args)...);
    }

    template <typename... Args>
    inline void critical(fmt::format_string<Args...> format, Args&&... args) {
        m_logger->critical(format, std::forward<Args>(args)...);
    }

    // add a second output stream to the logger
    bool add_file(const std::filesystem::path& fname);

    // show the banner and arguments
    void start();

private:
    // XXX assumes that the first sink is the console
    void set_console_level(spdlog::level::level_enum level);

    template <typename... Args>
    void log_dedup(spdlog::level::level_enum lvl, fmt::format_string<Args...> format, Args&&... args) {
        if (m_dedup_limit > 0) {
            std::lock_guard<std::mutex> lock(m_mtx);

            int n = m_logged_messages[format]++; // do not count the arguments, just the format string
            if (n >= m_dedup_limit) {
                if (n == m_dedup_limit) {
                    std::string message = fmt::format(format, std::forward<Args>(args)...);
                    m_logger->log(lvl, "{} [repeated {} times. suppressing]", message, m_dedup_limit);
                }
                return;
            }
        }
        m_logger->log(lvl, format, std::forward<Args>(args)...);
    }

    std::shared_ptr<spdlog::logger> m_logger;                  // Wrapped spdlog logger
    std::unordered_map<fmt::string_view, int> m_logged_messages;
    mutable std::mutex m_mtx;
    std::string m_banner;
    std::filesystem::path m_fname;
    std::vector<std::string> m_arguments;
    int m_dedup_limit = 0;
};

// spdlog does not format std::filesystem::path by default
template <>
struct fmt::formatter<std::filesystem::path> : fmt::formatter<std::string> {
    template <typename FormatContext>
    auto format(const std::filesystem::path& path, FormatContext& ctx) const {
        return fmt::formatter<std::string>::format(path.string(), ctx);
    }
};
