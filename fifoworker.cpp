#include <chrono>
#include <csignal>
#include <exception>
#include <memory>
#include <string>

//  General utility functions
#include "./core/utils.hpp"

//  Library
#include "./fifo/client.hpp"
#include "./fifo/worker.hpp"

//  Program-specific
#include "./worker/constants.hpp"
#include "./worker/commands.hpp"

//  ================================================================================================================================================================

int main(int argc, char* argv[]) {

    //  Process arguments, then check if another worker is running
    if (!process_args(argc, argv) || !single_instance(pid_file))
        return 1;

    std::signal(SIGPIPE, SIG_IGN);

    try {
        FifoWorker worker(pipe_name, fifo_root, static_cast<std::size_t>(read_size));

        std::unique_ptr<FifoClient> forwarder;
        if (!forward_pipe.empty())
            forwarder = std::make_unique<FifoClient>(forward_pipe, fifo_root);

        register_subscriptions(worker, forwarder.get());

        //  SIGINT/SIGTERM ask the worker to quit; handlers are gone before the worker is
        watch_signals(worker);
        try {
            worker.run(std::chrono::milliseconds(interval));
        }
        catch (const std::exception& e) {
            unwatch_signals();
            report_error(e.what());
            return 1;
        }
        unwatch_signals();
    }
    catch (const std::exception& e) {
        report_error(e.what());
        return 1;
    }

    log("SHUTDOWN", "Bye!");
    return 0;
}
