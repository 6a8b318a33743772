// worker.hpp
#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <regex>
#include <string>

#include "constants.hpp"
#include "dispatcher.hpp"
#include "pipe.hpp"

//  Listens on a named pipe and hands every message over to its subscribers.
//  Anything may write into the pipe, ie.: echo my command > /tmp/myfifo.fifo
class FifoWorker {
public:
    FifoWorker(const std::string& name, const std::string& fifo_root, std::size_t read_size = default_read_size);

    FifoWorker(const FifoWorker&) = delete;
    FifoWorker& operator=(const FifoWorker&) = delete;

    //  Wildcard subscription, see FifoDispatcher
    void subscribe(FifoHandler handler);
    void subscribe(FifoHandler handler, const std::string& message);
    void subscribe(FifoHandler handler, const std::regex& pattern);
    void subscribe_regex(FifoHandler handler, const std::string& pattern);

    //  Creates the pipe if needed, then reads it every interval until quit() is called
    void run(std::chrono::milliseconds interval);

    //  Safe to call from handlers, signal handlers and other threads. A request made
    //  before run() stops the next run() before it dispatches anything.
    void quit();
    FifoHandler quit_handler();
    bool quitting() const { return quitting_; }

    const FifoPath& fifo() const { return fifo_; }

private:
    FifoPath fifo_;
    std::size_t read_size_;
    FifoDispatcher dispatcher_;
    std::atomic<bool> quitting_{false};
};
