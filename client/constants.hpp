// constants.hpp
#pragma once
#include <string>
#include <vector>

//  Version number and logging flags come from the library
#include "../fifo/constants.hpp"

//  FIFO pipe name and the directory relative names live in
extern std::string pipe_name;
extern std::string fifo_root;

//	Write retry constants
extern int retries;
extern int retry_interval;

//  Fail instead of dropping messages nobody reads
extern bool guarantee_delivery;

//  Wait for the reader as long as it takes
extern bool block;

//  Messages from the command line (stdin is read if there are none)
extern std::vector<std::string> messages;

//  Help text
extern std::string help_text;
