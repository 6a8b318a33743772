// constants.hpp
#pragma once
#include <cstddef>
#include <string>

//  Version number and build time
extern const char version[];

//  Logging flags
extern bool logging_enabled;
extern bool logging_verbose;

//  Largest chunk taken from the pipe on one worker tick, bytes
extern const std::size_t default_read_size;

//  Permission bits of newly created pipes (umask is cleared while creating)
extern const unsigned int fifo_mode;
