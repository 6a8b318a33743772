// errors.hpp
#pragma once

#include <stdexcept>
#include <string>

//  The path of a requested pipe points to an existing file that is not a FIFO
class NotFifoError : public std::runtime_error {
public:
    explicit NotFifoError(const std::string& path);
    const std::string& path() const { return path_; }

private:
    std::string path_;
};

//  Nobody is reading the pipe after all retries were spent (guaranteed delivery only)
class FifoUnavailableError : public std::runtime_error {
public:
    explicit FifoUnavailableError(const std::string& name);
    const std::string& name() const { return name_; }

private:
    std::string name_;
};
