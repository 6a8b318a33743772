// client.hpp
#pragma once

#include <chrono>
#include <string>

#include "pipe.hpp"

//  Writes messages into a pipe that a FifoWorker (or anything else) reads.
//
//  retries - attempts made while nobody reads the pipe yet, before the message is given up
//  retry_interval - wait between two attempts
//  guarantee_delivery - throw FifoUnavailableError when the retries run out; otherwise the
//      message is dropped and later writes do not retry at all until one of them succeeds
class FifoClient {
public:
    FifoClient(const std::string& name,
               const std::string& fifo_root,
               int retries = 3,
               std::chrono::milliseconds retry_interval = std::chrono::milliseconds(100),
               bool guarantee_delivery = false);

    //  Returns false if the message was dropped
    bool write(const std::string& message);

    //  Waits for a reader as long as it takes
    void put(const std::string& message);

    int retries_left() const { return retries_; }
    const FifoPath& fifo() const { return fifo_; }

private:
    void send_line(const FifoHandle& fifo, const std::string& message);

    FifoPath fifo_;
    int retries_;
    int retries_save_;
    std::chrono::milliseconds retry_interval_;
    bool guarantee_delivery_;
};
