//  commands.cpp
#include <cstring>
#include <iostream>
#include <istream>
#include <string>
#include <vector>

#include "../core/utils.hpp"

#include "./constants.hpp"
#include "./commands.hpp"

//  Analyze command line ---------------------------------------------------------------------------------------------------------------
//  Anything that is not an option is a message; after "--" everything is
bool process_args(int argc, char* argv[]) {

    bool options_done = false;

    //  Option value, or an error if it is missing
    auto value_of = [&](int& i, const char* option) -> const char* {
        if (i + 1 >= argc || !*argv[i + 1]) {
            std::cout << "Missing " << option << " value" << std::endl;
            return nullptr;
        }
        return argv[++i];
    };

    for (int i = 1; i < argc; ++i) {

        if (options_done || argv[i][0] != '-' || argv[i][1] == '\0') {
            messages.push_back(argv[i]);
            continue;
        }

        if (std::strcmp(argv[i], "--") == 0) {
            options_done = true;
            continue;
        }

        //  Help
        if (std::strcmp(argv[i], "--help") == 0 || std::strcmp(argv[i], "-h") == 0) {
            std::cout << help_text << std::endl;
            return false;
        }

        //  Version
        if (std::strcmp(argv[i], "--version") == 0 || std::strcmp(argv[i], "-v") == 0) {
            std::cout << "fifoclient " << version << std::endl;
            return false;
        }

        //  Logging on/off
        if (std::strcmp(argv[i], "--log") == 0 || std::strcmp(argv[i], "-l") == 0) {
            logging_enabled = true;
            continue;
        }

        //  Verbose logging on/off
        if (std::strcmp(argv[i], "--verbose") == 0) {
            logging_enabled = true;
            logging_verbose = true;
            continue;
        }

        //  Delivery guarantee
        if (std::strcmp(argv[i], "--guarantee") == 0 || std::strcmp(argv[i], "-g") == 0) {
            guarantee_delivery = true;
            continue;
        }

        //  Blocking mode
        if (std::strcmp(argv[i], "--block") == 0 || std::strcmp(argv[i], "-b") == 0) {
            block = true;
            continue;
        }

        //  FIFO pipe name
        if (std::strcmp(argv[i], "--pipe") == 0 || std::strcmp(argv[i], "-n") == 0) {
            const char* value = value_of(i, "--pipe");
            if (!value)
                return false;
            pipe_name = value;
            continue;
        }

        //  Root of relative pipe names
        if (std::strcmp(argv[i], "--root") == 0 || std::strcmp(argv[i], "-d") == 0) {
            const char* value = value_of(i, "--root");
            if (!value)
                return false;
            fifo_root = value;
            continue;
        }

        //	Retries
        if (std::strcmp(argv[i], "--retries") == 0 || std::strcmp(argv[i], "-r") == 0) {
            const char* text = value_of(i, "--retries");
            auto value = text ? string_to_int(text, 0, 65535) : std::nullopt;
            if (!value) {
                std::cout << "Invalid --retries value" << std::endl;
                return false;
            }

            retries = *value;
            continue;
        }

        //	Retry interval
        if (std::strcmp(argv[i], "--retry_interval") == 0 || std::strcmp(argv[i], "-ri") == 0) {
            const char* text = value_of(i, "--retry_interval");
            auto value = text ? string_to_int(text, 1, 60000) : std::nullopt;
            if (!value) {
                std::cout << "Invalid --retry_interval value" << std::endl;
                return false;
            }

            retry_interval = *value;
            continue;
        }

        std::cout << "Unknown argument: " << argv[i] << std::endl;
        return false;
    }

    return true;
}

//  Messages from a stream, one per line -----------------------------------------------------------------------------------------------
std::vector<std::string> read_messages(std::istream& in) {

    std::vector<std::string> lines;
    std::string line;

    while (std::getline(in, line)) {
        line = trim(line);
        if (!line.empty())
            lines.push_back(line);
    }

    return lines;
}

//  Fatal errors -----------------------------------------------------------------------------------------------------------------------
//  Logged like everything else; without --log they still reach stderr
void report_error(const std::string& what) {

    log("ERROR", what);

    if (!logging_enabled)
        std::cerr << "fifoclient: " << what << std::endl;
}
