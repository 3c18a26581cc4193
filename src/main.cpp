/**
 * @file main.cpp
 * @brief Main entry point for MetaLoad application.
 *
 * Handles command-line parsing, logger setup for the invocation and command
 * execution. Every command except "test" is preceded by a silent self-test.
 */

#include <argparse/argparse.hpp>
#include <iostream>

#include "utils/common.hpp"
#include "../dist/version.h"

#include "commands/TestCommand.hpp"

argparse::ArgumentParser program(APP_NAME, APP_VERSION, argparse::default_arguments::help);

/**
 * @brief Main entry point for MetaLoad application.
 *
 * Handles:
 * - Signal handler registration for crash dumps
 * - Command-line argument parsing
 * - Creation of the invocation's logger, passed on to the command
 * - Automatic self-testing before command execution
 * - Command execution and error handling
 *
 * @return EXIT_SUCCESS (0) on success, EXIT_FAILURE (1) on error.
 */
int main(int argc, char*argv[]) {
    signal(SIGSEGV, signal_handler);
    signal(SIGABRT, signal_handler);

    register_program_args(program);

    for (const auto& [name, cmd] : Command::registry()) {
        program.add_subparser(cmd->parser());
    }

    try {
        program.parse_args(argc, argv);
    } catch (const std::exception& err) {
        std::cerr << err.what() << std::endl;
        std::cerr << program;
        std::exit(1);
    }

    auto logger = Logger::create(APP_NAME);
    logger->set_arguments(argc, argv);
    logger->set_banner(APP_NAME " " APP_VERSION);
    logger->set_verbosity(verbosity); // should be before logger->add_file() call

    auto& selfTestCmd = Command::registry()[TEST_CMD_NAME];
    for (const auto& [name, cmd] : Command::registry()) {
        if (!program.is_subcommand_used(name)) {
            continue;
        }

        try {
            logger->set_dedup_limit(cmd->parser().get<int>("--log-dedup-limit"));
            std::string log_fname;
            if( cmd->parser().is_used("--log") ){
                log_fname = cmd->parser().get<std::string>("--log");
            } else if( program.is_used("--log") ){
                log_fname = program.get<std::string>("--log");
            }
            init_log(*logger, log_fname);

            if( name == TEST_CMD_NAME ){
                // explicit self-test, make it visible
                logger->set_verbosity(9);
            } else {
                // implicit self-test, make it silent
                selfTestCmd->set_logger(logger);
                if( selfTestCmd->run() != 0 ){
                    logger->critical("self-test failed, exiting");
                    return 1;
                }
            }

            cmd->set_logger(logger);
            int ret = cmd->run();
            logger->flush();
            return ret;
        } catch (const std::exception& e) {
            logger->critical("{}", e.what());
            logger->flush();
            return 1;
        }
    }

    std::cout << program;
    return 0;
}
