// frame_reader.hpp
#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "pipe.hpp"

std::vector<std::string> read_batch(const FifoHandle& fifo, std::size_t max_bytes);
std::vector<std::string> split_frames(const std::string& chunk);
