// constants.hpp
#pragma once
#include <string>
#include <vector>

//  Version number and logging flags come from the library
#include "../fifo/constants.hpp"

//  FIFO pipe name and the directory relative names live in
extern std::string pipe_name;
extern std::string fifo_root;

//  Polling interval, milliseconds
extern int interval;

//  Largest chunk read on one tick, bytes
extern int read_size;

//  Accept filters, tried in this order: exact messages first, then patterns
extern std::vector<std::string> exact_filters;
extern std::vector<std::string> regex_filters;

//  Pipe that accepted messages are forwarded to (empty: no forwarding)
extern std::string forward_pipe;

//  "quit" message stops the worker
extern bool quit_enabled;

//  PID filename
extern std::string pid_file;

//  Help text
extern std::string help_text;
