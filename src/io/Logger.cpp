/**
 * @file Logger.cpp
 * @brief Implementation of the Logger wrapper around spdlog.
 *
 * A Logger is created once per invocation and passed to the components that
 * need it. It supports an optional file sink next to the console, integer
 * verbosity levels, argument tracking for the session banner and
 * de-duplication of repeated warnings and errors.
 */

#include "Logger.hpp"
#include "utils/common.hpp"
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/null_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/fmt/ranges.h> // for fmt::join()
#include <fstream>

/**
 * @brief Creates a console logger writing to stderr.
 * @param name Logger name, shown in the log pattern.
 */
std::shared_ptr<Logger> Logger::create(const std::string& name) {
    auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    return std::make_shared<Logger>(std::make_shared<spdlog::logger>(name, sink));
}

std::shared_ptr<Logger> Logger::null() {
    auto sink = std::make_shared<spdlog::sinks::null_sink_mt>();
    return std::make_shared<Logger>(std::make_shared<spdlog::logger>("null", sink));
}

/**
 * @brief Sets the logging verbosity level.
 *
 * Maps integer verbosity to spdlog levels:
 * -4 or less: off, -3: critical, -2: error, -1: warn, 0: info, 1: debug, 2+: trace
 *
 * @param verbosity Integer verbosity level.
 */
void Logger::set_verbosity(int verbosity){
    if( verbosity <= -4 ){
        m_logger->set_level(spdlog::level::off);
        return;
    }
    switch( verbosity ){
        case -3:
            m_logger->set_level(spdlog::level::critical);
            break;
        case -2:
            m_logger->set_level(spdlog::level::err);
            break;
        case -1:
            m_logger->set_level(spdlog::level::warn);
            break;
        case 0: // default level
            m_logger->set_level(spdlog::level::info);
            break;
        case 1:
            m_logger->set_level(spdlog::level::debug);
            break;
        default:
            m_logger->set_level(spdlog::level::trace);
            break;
    }
}

void Logger::set_arguments(int argc, char* argv[]){
    m_arguments.clear();
    for( int i = 0; i < argc; ++i ){
        m_arguments.push_back(argv[i]);
    }
}

void Logger::set_arguments(const std::vector<std::string>& args){
    m_arguments = args;
}

/**
 * @brief Prepares an argument for the session banner.
 *
 * Masks a password in meta URLs and quotes the argument if it contains spaces.
 * @note Not a comprehensive shell-escape function.
 */
static std::string printable_arg(const std::string& arg) {
    std::string result = remove_password(arg);
    if (result.find(' ') != std::string::npos) {
        return "\"" + result + "\"";
    }
    return result;
}

/**
 * @brief Adds a file sink to the logger.
 *
 * The file sink logs at DEBUG or higher. If a file is already added, this
 * operation is ignored. The file is opened in append mode.
 *
 * @param fname Path to the log file.
 * @return True if file sink was added, false if already logging to a file or on error.
 */
bool Logger::add_file(const std::filesystem::path& fname) {
    if( !m_fname.empty() ){
        // already logging to a file, ignore
        return false;
    }

    std::ofstream file(fname, std::ios::app);
    if( !file.is_open() ){
        m_logger->error("Failed to open log file {}, no log will be saved!", fname);
        return false;
    }
    if( file.tellp() != 0 ){
        file.write("\n\n", 2); // visual sessions separator
    }
    file.close();

    auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(fname.string());

    // if current logger level is DEBUG or TRACE => file level just inherits it
    // otherwise, file level is DEBUG
    if( m_logger->level() != spdlog::level::debug && m_logger->level() != spdlog::level::trace ){
        file_sink->set_level(spdlog::level::debug);
        set_console_level(m_logger->level()); // move current level to console sink
        m_logger->set_level(spdlog::level::debug);
    }

    m_logger->sinks().push_back(file_sink);
    m_fname = fname;
    return true;
}

/**
 * @brief Logs session start information including banner and arguments.
 */
void Logger::start(){
    if( !m_banner.empty() ){
        m_logger->debug("==============================================================");
        m_logger->debug("{}", m_banner);
        m_logger->debug("==============================================================");
    }

    std::vector<std::string> args;
    args.reserve(m_arguments.size());
    for( const auto& arg : m_arguments ){
        args.push_back(printable_arg(arg));
    }
    m_logger->debug("started as {}", fmt::join(args, " "));
    m_logger->debug("logging to {}", m_fname.empty() ? "console only" : m_fname.string());
}

void Logger::set_console_level(spdlog::level::level_enum level) {
    m_logger->sinks().front()->set_level(level); // XXX assuming that first sink is console
}
