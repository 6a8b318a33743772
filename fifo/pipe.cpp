// pipe.cpp
#include <string>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <stdexcept>
#include <system_error>
#include <utility>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>
#include <fcntl.h>

#include "../core/utils.hpp"

#include "constants.hpp"
#include "errors.hpp"
#include "pipe.hpp"

//	A FIFO pipe is a plain file in the filesystem: the worker creates it and reads it, clients open it for
//	writing only while the worker holds it open

//  Name resolution ---------------------------------------------------------------------------------------------------------------------------------------------
//  Relative names live under the pipe root, absolute ones are used as they are

FifoPath resolve_fifo_path(const std::string& name, const std::string& fifo_root) {

    if (name.empty())
        throw std::invalid_argument("Pipe name cannot be empty");

    if (name[0] == '/')
        return FifoPath{name, name};

    return FifoPath{name, (std::filesystem::path(fifo_root) / name).string()};
}

//  Descriptor ownership ----------------------------------------------------------------------------------------------------------------------------------------

FifoHandle::~FifoHandle() {
    close();
}

FifoHandle::FifoHandle(FifoHandle&& other) noexcept : fd_(std::exchange(other.fd_, -1)) {}

FifoHandle& FifoHandle::operator=(FifoHandle&& other) noexcept {
    if (this != &other) {
        close();
        fd_ = std::exchange(other.fd_, -1);
    }
    return *this;
}

void FifoHandle::close() {

    if (fd_ == -1)
        return;

    //  The descriptor is gone after close() even when it reports an error, never retry it
    if (::close(fd_) != 0)
        log("ERROR", "Error closing FIFO pipeline: " + std::string(strerror(errno)));

    fd_ = -1;
}

//  ---  Pipeline creator ----------------------------------------------------------------------------------------------

static void check_fifo(const std::string& pipe_path, const struct stat& st) {

    if (!S_ISFIFO(st.st_mode)) {
        log("ERROR", "Pipeline " + pipe_path + " exists but it's not FIFO.");
        throw NotFifoError(pipe_path);
    }

    if (logging_verbose)
        log("LOG", "Pipeline " + pipe_path + " already exists");
}

void create_pipe(const std::string& pipe_path) {

    struct stat st;

    if (stat(pipe_path.c_str(), &st) == 0) {
        check_fifo(pipe_path, st);
        return;
    }

    if (errno != ENOENT)
        throw std::system_error(errno, std::generic_category(), "Cannot stat " + pipe_path);

    //  Clear the umask so the pipe really gets the requested mode
    mode_t saved_umask = umask(0);
    int rc = mkfifo(pipe_path.c_str(), fifo_mode);
    int err = errno;
    umask(saved_umask);

    if (rc == 0) {
        log("LOG", "Pipeline " + pipe_path + " created.");
        return;
    }

    //  Somebody else created it in the meantime
    if (err == EEXIST && stat(pipe_path.c_str(), &st) == 0) {
        check_fifo(pipe_path, st);
        return;
    }

    log("ERROR", "Failed to create pipeline " + pipe_path + ": " + std::string(strerror(err)));
    throw std::system_error(err, std::generic_category(), "Cannot create " + pipe_path);
}

//  Openers -----------------------------------------------------------------------------------------------------------------------------------------------------

//  ENXIO: nobody has the pipe open for reading; ENOENT: the worker did not create it yet
bool is_fifo_missing_reader(int err) {
    return err == ENXIO || err == ENOENT;
}

FifoHandle open_fifo_read(const std::string& pipe_path) {

    int fd = open(pipe_path.c_str(), O_RDONLY | O_NONBLOCK);

    if (fd == -1) {
        int err = errno;
        log("ERROR", "Error opening FIFO pipeline: " + std::string(strerror(err)));
        throw std::system_error(err, std::generic_category(), "Cannot open " + pipe_path + " for reading");
    }

    return FifoHandle(fd);
}

//  Returns an empty handle if there is no reader yet, the reason goes to transient_errno
FifoHandle open_fifo_write(const std::string& pipe_path, int* transient_errno) {

    int fd = open(pipe_path.c_str(), O_WRONLY | O_NONBLOCK);

    if (fd == -1) {
        int err = errno;

        if (is_fifo_missing_reader(err)) {
            if (transient_errno)
                *transient_errno = err;
            return FifoHandle();
        }

        log("ERROR", "Cannot open pipe " + pipe_path + " for writing: " + std::string(strerror(err)));
        throw std::system_error(err, std::generic_category(), "Cannot open " + pipe_path + " for writing");
    }

    return FifoHandle(fd);
}
