// pipe.hpp
#pragma once

#include <string>

//  Logical pipe name and the filesystem path it resolves to
struct FifoPath {
    std::string name;
    std::string path;
};

FifoPath resolve_fifo_path(const std::string& name, const std::string& fifo_root);

//  Owns one open descriptor of a FIFO; closes it exactly once
class FifoHandle {
public:
    FifoHandle() = default;
    explicit FifoHandle(int fd) : fd_(fd) {}
    ~FifoHandle();

    FifoHandle(const FifoHandle&) = delete;
    FifoHandle& operator=(const FifoHandle&) = delete;
    FifoHandle(FifoHandle&& other) noexcept;
    FifoHandle& operator=(FifoHandle&& other) noexcept;

    int fd() const { return fd_; }
    bool is_open() const { return fd_ != -1; }
    void close();

private:
    int fd_ = -1;
};

void create_pipe(const std::string& path);
bool is_fifo_missing_reader(int err);
FifoHandle open_fifo_read(const std::string& path);
FifoHandle open_fifo_write(const std::string& path, int* transient_errno = nullptr);
