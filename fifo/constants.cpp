#include "constants.hpp"
#include <string>

//  Version number and build time
const char version[] = "1.0.0 " __DATE__ " " __TIME__;

//  Logging flags - the library is silent unless a program turns them on
bool logging_enabled = false;
bool logging_verbose = false;

//  Read chunk size
const std::size_t default_read_size = 9999;

//  World read/write
const unsigned int fifo_mode = 0666;
