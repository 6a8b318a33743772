//  commands.hpp
#pragma once

#include <istream>
#include <string>
#include <vector>

bool process_args(int argc, char* argv[]);
std::vector<std::string> read_messages(std::istream& in);
void report_error(const std::string& what);
