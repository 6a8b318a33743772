#include <chrono>
#include <csignal>
#include <exception>
#include <iostream>
#include <string>

//  General utility functions
#include "./core/utils.hpp"

//  Library
#include "./fifo/client.hpp"

//  Program-specific
#include "./client/constants.hpp"
#include "./client/commands.hpp"

//  ================================================================================================================================================================

int main(int argc, char* argv[]) {

    if (!process_args(argc, argv))
        return 1;

    //  A reader that goes away mid-write must be an error, not a dead client
    std::signal(SIGPIPE, SIG_IGN);

    if (messages.empty())
        messages = read_messages(std::cin);

    try {
        FifoClient client(pipe_name, fifo_root, retries, std::chrono::milliseconds(retry_interval), guarantee_delivery);

        for (const auto& message : messages) {
            if (block)
                client.put(message);
            else
                client.write(message);
        }
    }
    catch (const std::exception& e) {
        report_error(e.what());
        return 1;
    }

    return 0;
}
