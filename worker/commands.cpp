//  commands.cpp
#include <atomic>
#include <csignal>
#include <cstring>
#include <iostream>
#include <regex>
#include <string>
#include <vector>

#include "../core/utils.hpp"
#include "../fifo/client.hpp"
#include "../fifo/worker.hpp"

#include "./constants.hpp"
#include "./commands.hpp"

//  Analyze command line ---------------------------------------------------------------------------------------------------------------
bool process_args(int argc, char* argv[]) {

    for (int i = 1; i < argc; ++i) {

        //  Help
        if (std::strcmp(argv[i], "--help") == 0 || std::strcmp(argv[i], "-h") == 0) {
            std::cout << help_text << std::endl;
            return false;
        }

        //  Version
        if (std::strcmp(argv[i], "--version") == 0 || std::strcmp(argv[i], "-v") == 0) {
            std::cout << "fifoworker " << version << std::endl;
            return false;
        }

        //  Logging on/off
        if (std::strcmp(argv[i], "--log") == 0 || std::strcmp(argv[i], "-l") == 0)
            logging_enabled = true;

        //  Verbose logging on/off
        if (std::strcmp(argv[i], "--verbose") == 0) {
            logging_enabled = true;
            logging_verbose = true;
        }

        //  No remote quit
        if (std::strcmp(argv[i], "--disable_quit") == 0 || std::strcmp(argv[i], "-dq") == 0)
            quit_enabled = false;

        //  FIFO pipe name
        if ((std::strcmp(argv[i-1], "--pipe") == 0 || std::strcmp(argv[i-1], "-n") == 0) && *argv[i])
            pipe_name = argv[i];

        //  Root of relative pipe names
        if ((std::strcmp(argv[i-1], "--root") == 0 || std::strcmp(argv[i-1], "-d") == 0) && *argv[i])
            fifo_root = argv[i];

        //  Forward accepted messages
        if ((std::strcmp(argv[i-1], "--forward") == 0 || std::strcmp(argv[i-1], "-f") == 0) && *argv[i])
            forward_pipe = argv[i];

        //  PID file
        if ((std::strcmp(argv[i-1], "--pid") == 0 || std::strcmp(argv[i-1], "-p") == 0) && *argv[i])
            pid_file = argv[i];

        //  Exact filter (the empty message is a valid one too)
        if (std::strcmp(argv[i-1], "--exact") == 0 || std::strcmp(argv[i-1], "-e") == 0)
            exact_filters.push_back(argv[i]);

        //  Pattern filter
        if (std::strcmp(argv[i-1], "--regex") == 0 || std::strcmp(argv[i-1], "-x") == 0) {
            try {
                std::regex check(argv[i]);
            } catch (const std::regex_error& e) {
                std::cout << "Invalid --regex value: " << e.what() << std::endl;
                return false;
            }

            regex_filters.push_back(argv[i]);
        }

        //  Polling interval
        if (std::strcmp(argv[i-1], "--interval") == 0 || std::strcmp(argv[i-1], "-i") == 0) {

            auto value = string_to_int(argv[i], 10, 60000);
            if (!value) {
                std::cout << "Invalid --interval value" << std::endl;
                return false;
            }

            interval = *value;
        }

        //  Read chunk size
        if (std::strcmp(argv[i-1], "--read_size") == 0 || std::strcmp(argv[i-1], "-s") == 0) {

            auto value = string_to_int(argv[i], 1, 65536);
            if (!value) {
                std::cout << "Invalid --read_size value" << std::endl;
                return false;
            }

            read_size = *value;
        }
    }

    return true;
}

//  Accepted message: print it, pass it on if there is somewhere to pass it ------------------------------------------------------------
void accept_message(const std::string& message, FifoClient* forwarder) {

    std::cout << message << std::endl;

    if (forwarder)
        forwarder->write(message);
}

//  Message table ----------------------------------------------------------------------------------------------------------------------
//  Order matters, the first subscription that matches gets the message
void register_subscriptions(FifoWorker& worker, FifoClient* forwarder) {

    const bool filtered = !exact_filters.empty() || !regex_filters.empty();

    //  Idle ticks come most often, check them first
    worker.subscribe([](const std::string&, const std::string& origin) {
        if (logging_verbose)
            log("RECV", "Nothing on " + origin);
    }, "");

    if (quit_enabled) {
        worker.subscribe([&worker](const std::string&, const std::string& origin) {
            log("LOG", "Quit requested through " + origin);
            worker.quit();
        }, "quit");
    }

    auto accept = [forwarder](const std::string& message, const std::string&) {
        accept_message(message, forwarder);
    };

    for (const auto& filter : exact_filters)
        worker.subscribe(accept, filter);

    for (const auto& filter : regex_filters)
        worker.subscribe_regex(accept, filter);

    //  Everything else
    if (!filtered)
        worker.subscribe(accept);
    else
        worker.subscribe([](const std::string& message, const std::string& origin) {
            log("WARNING", "Unknown message on " + origin + ": " + message);
        });
}

//  Fatal errors -----------------------------------------------------------------------------------------------------------------------
//  Logged like everything else; without --log they still reach stderr
void report_error(const std::string& what) {

    log("ERROR", what);

    if (!logging_enabled)
        std::cerr << "fifoworker: " << what << std::endl;
}

//  Shutdown handlers ------------------------------------------------------------------------------------------------------------------
//  The worker is published before the handlers go in and withdrawn only after they are gone

static std::atomic<FifoWorker*> signalled_worker{nullptr};

static void on_signal(int signum) {
    shutdown_handler(signum);

    FifoWorker* worker = signalled_worker.load();
    if (worker)
        worker->quit();
}

void watch_signals(FifoWorker& worker) {
    signalled_worker = &worker;
    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);
}

void unwatch_signals() {
    std::signal(SIGINT, SIG_DFL);
    std::signal(SIGTERM, SIG_DFL);
    signalled_worker = nullptr;
}
