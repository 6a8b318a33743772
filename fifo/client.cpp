// client.cpp
#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <string>
#include <system_error>
#include <thread>
#include <unistd.h>

#include "../core/utils.hpp"

#include "client.hpp"
#include "constants.hpp"
#include "errors.hpp"

FifoClient::FifoClient(const std::string& name,
                       const std::string& fifo_root,
                       int retries,
                       std::chrono::milliseconds retry_interval,
                       bool guarantee_delivery)
    : fifo_(resolve_fifo_path(name, fifo_root)),
      retries_(retries < 0 ? 0 : retries),
      retries_save_(retries_),
      retry_interval_(retry_interval),
      guarantee_delivery_(guarantee_delivery) {}

//  One message, one write() call - lines from several writers can only interleave whole
void FifoClient::send_line(const FifoHandle& fifo, const std::string& message) {

    std::string line = message + "\n";
    ssize_t bytes_written = ::write(fifo.fd(), line.data(), line.size());

    if (bytes_written == -1) {
        int err = errno;
        log("ERROR", "Failed to write to " + fifo_.path + ": " + std::string(strerror(err)));
        throw std::system_error(err, std::generic_category(), "Cannot write " + fifo_.path);
    }

    if (static_cast<size_t>(bytes_written) != line.size()) {
        log("ERROR", "Short write to " + fifo_.path + ": " + std::to_string(bytes_written) + " of " + std::to_string(line.size()) + " bytes");
        throw std::runtime_error("Message to " + fifo_.path + " was cut short");
    }

    if (logging_verbose)
        log("SEND", fifo_.name + ": " + message);
}

//  Writes a message, retries while nobody reads the pipe ---------------------------------------------------------------------------------------------------------

bool FifoClient::write(const std::string& message) {

    if (message.find('\n') != std::string::npos)
        throw std::invalid_argument("Message cannot contain a newline");

    while (true) {
        int err = 0;
        FifoHandle fifo = open_fifo_write(fifo_.path, &err);

        if (fifo.is_open()) {
            retries_ = retries_save_;
            send_line(fifo, message);
            return true;
        }

        if (retries_ > 0) {
            --retries_;
            if (logging_verbose)
                log("LOG", "No reader on " + fifo_.path + " (" + std::string(strerror(err)) + "), " + std::to_string(retries_) + " retries left");
            std::this_thread::sleep_for(retry_interval_);
            continue;
        }

        if (guarantee_delivery_) {
            log("ERROR", "Nobody reads " + fifo_.path + ", giving up!");
            throw FifoUnavailableError(fifo_.name);
        }

        log("WARNING", "Nobody reads " + fifo_.path + ", message dropped");
        return false;
    }
}

//  Writes a message, waits for a reader forever ------------------------------------------------------------------------------------------------------------------

void FifoClient::put(const std::string& message) {

    if (message.find('\n') != std::string::npos)
        throw std::invalid_argument("Message cannot contain a newline");

    while (true) {
        FifoHandle fifo = open_fifo_write(fifo_.path);

        if (fifo.is_open()) {
            retries_ = retries_save_;
            send_line(fifo, message);
            return;
        }

        std::this_thread::sleep_for(retry_interval_);
    }
}
