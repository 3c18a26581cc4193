#pragma once
#include <unordered_map>
#include <mutex>
#include <memory>
#include <filesystem>
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

// Per-invocation logging capability. Created by main() and handed to every component.
class Logger {
public:

    explicit Logger(std::shared_ptr<spdlog::logger> logger)
        : m_logger(std::move(logger)) {}

    // console logger on stderr, so that reports on stdout stay machine-readable
    static std::shared_ptr<Logger> create(const std::string& name);
    // logger that drops everything, for tests and library users
    static std::shared_ptr<Logger> null();

    void set_verbosity(int verbosity);
    void set_banner(const std::string banner){ m_banner = banner; }
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

    template <typename... Args>
    inline void warn(fmt::format_string<Args...> format, Args&&... args) {
        if( suppressed(spdlog::level::warn, format, std::forward<Args>(args)...) ){
            return;
        }
        m_logger->warn(format, std::forward<Args>(args)...);
    }

    template <typename... Args>
    inline void error(fmt::format_string<Args...> format, Args&&... args) {
        if( suppressed(spdlog::level::err, format, std::forward<Args>(args)...) ){
            return;
        }
        m_logger->error(format, std::forward<Args>(args)...);
    }

    template <typename... Args>
    inline void critical(fmt::format_string<Args...> format, Args&&... args) {
        m_logger->critical(format, std::forward<Args>(args)...);
    }

    // add a second output stream to the logger
    bool add_file(const std::filesystem::path& fname);

    // show the banner and arguments
    void start();

    spdlog::level::level_enum level() const { return m_logger->level(); }

    void flush() { m_logger->flush(); }

private:
    void set_console_level(spdlog::level::level_enum level);

    // counts messages per format string, ignoring the arguments
    template <typename... Args>
    bool suppressed(spdlog::level::level_enum lvl, fmt::format_string<Args...> format, Args&&... args) {
        if( m_dedup_limit <= 0 ){
            return false;
        }

        std::lock_guard<std::mutex> lock(m_mtx);
        int n = m_logged_messages[format]++;
        if( n < m_dedup_limit ){
            return false;
        }
        if( n == m_dedup_limit ){
            std::string message = fmt::format(format, std::forward<Args>(args)...);
            m_logger->log(lvl, "{} [repeated {} times. suppressing]", message, m_dedup_limit);
        }
        return true;
    }

    std::shared_ptr<spdlog::logger> m_logger;
    std::unordered_map<fmt::string_view, int> m_logged_messages;
    mutable std::mutex m_mtx;
    std::string m_banner;
    std::filesystem::path m_fname;
    std::vector<std::string> m_arguments;
    int m_dedup_limit = 0;
};

// Custom formatter for std::filesystem::path, which is not supported by spdlog by default
template <>
struct fmt::formatter<std::filesystem::path> : fmt::formatter<std::string> {
    template <typename FormatContext>
    auto format(const std::filesystem::path& path, FormatContext& ctx) const {
        return fmt::formatter<std::string>::format(path.string(), ctx);
    }
};
