// utils.hpp
#ifndef UTILS_HPP
#define UTILS_HPP

#pragma once
#include <vector>
#include <string>
#include <optional>

std::string get_timestamp(const bool withTime = false);
void log(const std::string& type, const std::string& msg);
bool single_instance(const std::string& pid_file);
void shutdown_handler(int signum);
std::vector<std::string> split(const std::string& s, const std::string& delim);
std::string trim(const std::string& s);
bool is_valid_utf8(const std::string& s);
std::optional<int> string_to_int(const std::string& s, std::optional<int> min, std::optional<int> max);

#endif
