// frame_reader.cpp
#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <string>
#include <system_error>
#include <vector>
#include <unistd.h>

#include "../core/utils.hpp"

#include "constants.hpp"
#include "frame_reader.hpp"

//  Chunk splitter ------------------------------------------------------------------------------------------------------------------------------------------------
//  An empty chunk still gives one empty message: that is the idle tick

std::vector<std::string> split_frames(const std::string& chunk) {

    std::vector<std::string> lines = split(trim(chunk), "\n");

    for (auto& line : lines)
        line = trim(line);

    return lines;
}

//  Reads whatever is waiting in the pipe -------------------------------------------------------------------------------------------------------------------------

std::vector<std::string> read_batch(const FifoHandle& fifo, std::size_t max_bytes) {

    std::string buffer(max_bytes, '\0');
    ssize_t bytes_read = read(fifo.fd(), &buffer[0], max_bytes);

    if (bytes_read < 0) {
        int err = errno;

        if (err != EAGAIN && err != EWOULDBLOCK) {
            log("ERROR", "Error reading from FIFO pipeline: " + std::string(strerror(err)));
            throw std::system_error(err, std::generic_category(), "Cannot read FIFO pipeline");
        }

        bytes_read = 0;
    }

    buffer.resize(static_cast<std::size_t>(bytes_read));

    if (!is_valid_utf8(buffer)) {
        log("ERROR", "FIFO pipeline delivered " + std::to_string(bytes_read) + " bytes of invalid UTF-8");
        throw std::runtime_error("Invalid UTF-8 received from FIFO pipeline");
    }

    if (logging_verbose && bytes_read > 0)
        log("RECV", std::to_string(bytes_read) + " bytes");

    return split_frames(buffer);
}
