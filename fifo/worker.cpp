// worker.cpp
#include <atomic>
#include <chrono>
#include <functional>
#include <string>
#include <system_error>
#include <utility>

#define ASIO_STANDALONE
#include <asio/io_context.hpp>
#include <asio/post.hpp>
#include <asio/steady_timer.hpp>

#include "../core/utils.hpp"

#include "frame_reader.hpp"
#include "worker.hpp"

FifoWorker::FifoWorker(const std::string& name, const std::string& fifo_root, std::size_t read_size)
    : fifo_(resolve_fifo_path(name, fifo_root)), read_size_(read_size) {}

//  Subscriptions -----------------------------------------------------------------------------------------------------------------------------------------------
//  Hint: subscribe to the empty message first, it arrives on every idle tick

void FifoWorker::subscribe(FifoHandler handler) {
    dispatcher_.subscribe(std::move(handler));
}

void FifoWorker::subscribe(FifoHandler handler, const std::string& message) {
    dispatcher_.subscribe(std::move(handler), message);
}

void FifoWorker::subscribe(FifoHandler handler, const std::regex& pattern) {
    dispatcher_.subscribe(std::move(handler), pattern);
}

void FifoWorker::subscribe_regex(FifoHandler handler, const std::string& pattern) {
    dispatcher_.subscribe_regex(std::move(handler), pattern);
}

//  Quitting ----------------------------------------------------------------------------------------------------------------------------------------------------

void FifoWorker::quit() {
    quitting_ = true;
}

FifoHandler FifoWorker::quit_handler() {
    return [this](const std::string&, const std::string&) { quit(); };
}

//  Main loop ---------------------------------------------------------------------------------------------------------------------------------------------------
//  Every tick reads one chunk and dispatches its lines, then the timer schedules the next tick.
//  Errors leave io.run() as exceptions and the handle is closed on the way out.
//  A quit requested before run() is kept: the loop stops before the first dispatch.

namespace {

//  Clears the quit request on every way out of run(), so the worker can run again
struct QuitReset {
    std::atomic<bool>& quitting;
    ~QuitReset() { quitting = false; }
};

}

void FifoWorker::run(std::chrono::milliseconds interval) {

    QuitReset reset{quitting_};

    create_pipe(fifo_.path);
    FifoHandle fifo = open_fifo_read(fifo_.path);

    log("LOG", "Initializing FIFO pipe watcher loop on " + fifo_.path);

    asio::io_context io;
    asio::steady_timer timer(io);
    std::function<void()> tick;

    tick = [&]() {

        if (quitting_)
            return;

        for (const auto& message : read_batch(fifo, read_size_)) {
            dispatcher_.dispatch(message, fifo_.name);
            if (quitting_)
                return;
        }

        timer.expires_after(interval);
        timer.async_wait([&](const std::error_code& ec) {
            if (ec)
                return;
            tick();
        });
    };

    asio::post(io, tick);
    io.run();

    fifo.close();
    log("LOG", "FIFO pipe watcher on " + fifo_.path + " stopped");
}
