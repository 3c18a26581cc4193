/**
 * @file common.cpp
 * @brief Implementation of common utilities and global CLI state.
 *
 * Holds the command-line registration shared by every command, log file
 * initialization, meta URL password masking and the crash handler that prints
 * a stack trace.
 */

#include "common.hpp"
#include "../../dist/version.h"

int verbosity = 0;

// begin stack trace generation on error
#include <backtrace.h>

/**
 * @brief Backtrace error callback for logging libbacktrace errors.
 * @param msg Error message.
 * @param errnum Error number.
 */
void backtrace_error_cb(void *, const char *msg, int errnum) {
    spdlog::critical("Error: {} (Error number: {})", msg, errnum);
}

int backtrace_full_cb(void *, uintptr_t pc, const char *filename, int lineno, const char *function) {
    spdlog::critical("     {} {}:{} ({})", (void *)pc, filename ? filename : "?", lineno, function ? function : "?");
    return 0;  // Continue processing the backtrace
}

// the only place that logs through the process-wide spdlog logger: a signal has no invocation context
void signal_handler(int sig) {
    spdlog::critical("Signal {} received, printing backtrace...", sig);

    backtrace_state *state = backtrace_create_state(NULL, 0, backtrace_error_cb, NULL);
    backtrace_full(state, 0, backtrace_full_cb, backtrace_error_cb, NULL);

    exit(1);
}
// end stack trace generation on error

std::string filter_unprintable(const std::string& str){
    std::string result;
    for( char c : str ){
        if( c >= 0x20 && c <= 0x7e ){
            result += c;
        } else {
            result += '.';
        }
    }
    return result;
}

bool path_ends_with(const fs::path& p, const fs::path::string_type& suffix) {
    if (p.native().size() < suffix.size()) {
        return false;
    }
    return p.native().compare(p.native().size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::string remove_password(const std::string& uri) {
    const size_t scheme_end = uri.find("://");
    if( scheme_end == std::string::npos ){
        return uri;
    }
    const size_t auth_start = scheme_end + 3;
    const size_t at = uri.rfind('@');
    if( at == std::string::npos || at < auth_start ){
        return uri;
    }
    const size_t colon = uri.find(':', auth_start);
    if( colon == std::string::npos || colon > at ){
        return uri;
    }
    return uri.substr(0, colon + 1) + "****" + uri.substr(at);
}

void init_log(Logger& logger, const std::string& log_fname){
    if( !log_fname.empty() ){
        // explicit log pathname, can't continue without log
        if( !logger.add_file(log_fname) ){
            throw std::runtime_error(fmt::format("cannot open log file {}, refusing to continue without log", log_fname));
        }
    }
    logger.start();
}

void register_common_args(argparse::ArgumentParser &parser) {
    parser.add_argument("-v", "--verbose")
        .help("increase verbosity")
        .action([&](const auto &) { ++verbosity; })
        .append()
        .implicit_value(true)
        .nargs(0);

    parser.add_argument("-q", "--quiet")
        .help("decrease verbosity")
        .action([&](const auto &) { --verbosity; })
        .append()
        .implicit_value(true)
        .nargs(0);

    parser.add_argument("-L", "--log")
        .help("log pathname [default: console only]");
    parser.add_argument("--log-dedup-limit")
        .default_value(100)
        .scan<'i', int>()
        .help("limit duplicate log messages, 0 = no limit");
}

void register_program_args(argparse::ArgumentParser &parser) {
    register_common_args(parser);

    parser.add_argument("--version")
        .action([&](const auto & /*unused*/) {
            fmt::print("{}\n", APP_VERSION);
            exit(0);
        })
        .default_value(false)
        .help("print version information and exit")
        .implicit_value(true)
        .nargs(0);
}
