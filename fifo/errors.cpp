// errors.cpp
#include "errors.hpp"

NotFifoError::NotFifoError(const std::string& path)
    : std::runtime_error(path + " is not a named pipe"), path_(path) {}

FifoUnavailableError::FifoUnavailableError(const std::string& name)
    : std::runtime_error("The named pipe " + name + " has no reader"), name_(name) {}
