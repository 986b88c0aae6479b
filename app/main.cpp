#include "CommandRunner.hpp"
#include "ErrorMessages.hpp"
#include "Logger.hpp"

#include <locale.h>
#include <libintl.h>
#include <cstdio>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <string>
#include <vector>

#ifndef SYSTOOLKIT_LOCALE_DIR
#define SYSTOOLKIT_LOCALE_DIR "/usr/share/locale"
#endif


bool initialize_loggers()
{
    try {
        Logger::setup_loggers();
        return true;
    } catch (const std::exception &e) {
        if (auto logger = Logger::get_logger("core_logger")) {
            logger->critical("Failed to initialize loggers: {}", e.what());
        } else {
            std::fprintf(stderr, "Failed to initialize loggers: %s\n", e.what());
        }
        return false;
    }
}

namespace {

void setup_translations()
{
    setlocale(LC_ALL, "");
    bindtextdomain(ErrorMessages::text_domain, SYSTOOLKIT_LOCALE_DIR);
    bind_textdomain_codeset(ErrorMessages::text_domain, "UTF-8");
    textdomain(ErrorMessages::text_domain);
}

} // namespace


int main(int argc, char **argv) {
    setup_translations();

    if (!initialize_loggers()) {
        return EXIT_FAILURE;
    }

    std::vector<std::string> args(argv + 1, argv + argc);

    try {
        CommandRunner runner(std::cout, std::cerr);
        return runner.run(args);
    } catch (const std::exception& ex) {
        if (auto logger = Logger::get_logger("cli_logger")) {
            logger->critical("Unexpected error: {}", ex.what());
        }
        std::fprintf(stderr, "Error: %s\n", ex.what());
        return EXIT_FAILURE;
    }
}
