#include "constants.hpp"
#include <string>

//  FIFO pipe
std::string pipe_name = "fifobus.fifo";
std::string fifo_root = "/tmp";

//  Polling interval, milliseconds
int interval = 100;

//  Read chunk, bytes
int read_size = static_cast<int>(default_read_size);

//  Accept filters
std::vector<std::string> exact_filters;
std::vector<std::string> regex_filters;

//  Forwarding
std::string forward_pipe;

//  Remote quit enabled
bool quit_enabled = true;

//  PID filename
std::string pid_file = "/tmp/fifoworker.pid";

//  Help text
std::string help_text =
    "fifoworker - Listens on a FIFO pipe and prints the messages\n"
    "Version and build date: " + std::string(version) + "\n\n"
    "Command line arguments:\n"

    "\nPipeline configuration:\n\n"
    "  --pipe, -n <name>                    FIFO pipe name. Relative names are placed under the root directory. Default: " + pipe_name + "\n"
    "  --root, -d <dir>                     Root directory of relative pipe names. Default: " + fifo_root + "\n"
    "  --interval, -i <interval>            Milliseconds between two reads of the pipe. Default: " + std::to_string(interval) + "\n"
    "  --read_size, -s <bytes>              Largest chunk read at once. Default: " + std::to_string(read_size) + "\n"

    "\nMessages:\n\n"
    "  --exact, -e <message>                Accept this message. Can be repeated. Without filters every message is accepted.\n"
    "  --regex, -x <pattern>                Accept messages starting with a match of this pattern. Can be repeated.\n"
    "  --forward, -f <pipe>                 Forward accepted messages to another FIFO pipe\n"
    "  --disable_quit, -dq                  Ignore the \"quit\" message. The worker can still be stopped by SIGINT/SIGTERM.\n"

    "\nOthers:\n\n"
    "  --help, -h                           This text\n"
    "  --log, -l                            Enable logging. Default: " + (logging_enabled ? "on" : "off") + "\n"
    "  --verbose                            Verbose logging\n"
    "  --pid, -p <path>                     File to store process ID (prevents running multiple instances). Default: " + pid_file + "\n"
    "  --version, -v                        Version information\n"
    "\n";
