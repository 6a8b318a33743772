#include "constants.hpp"
#include <string>

//  FIFO pipe
std::string pipe_name = "fifobus.fifo";
std::string fifo_root = "/tmp";

//  Write retries while nobody reads the pipe
int retries = 3;

//  Retry interval, milliseconds
int retry_interval = 100;

//  Delivery guarantee
bool guarantee_delivery = false;

//  Blocking mode
bool block = false;

//  Messages
std::vector<std::string> messages;

//  Help text
std::string help_text =
    "fifoclient - Writes messages to a FIFO pipe\n"
    "Version and build date: " + std::string(version) + "\n\n"
    "Usage: fifoclient [options] [--] [message...]\n"
    "Without messages on the command line every non-empty line of the standard input is sent.\n\n"
    "Command line arguments:\n"

    "\nPipeline configuration:\n\n"
    "  --pipe, -n <name>                    FIFO pipe name. Relative names are placed under the root directory. Default: " + pipe_name + "\n"
    "  --root, -d <dir>                     Root directory of relative pipe names. Default: " + fifo_root + "\n"

    "\nDelivery:\n\n"
    "  --retries, -r <retries>              Attempts to reach a reader before a message is given up. Default: " + std::to_string(retries) + "\n"
    "  --retry_interval, -ri <interval>     Milliseconds to wait between attempts. Default: " + std::to_string(retry_interval) + "\n"
    "  --guarantee, -g                      Fail with an error instead of dropping a message\n"
    "  --block, -b                          Wait for a reader as long as it takes\n"

    "\nOthers:\n\n"
    "  --help, -h                           This text\n"
    "  --log, -l                            Enable logging. Default: " + (logging_enabled ? "on" : "off") + "\n"
    "  --verbose                            Verbose logging\n"
    "  --version, -v                        Version information\n"
    "\n";
