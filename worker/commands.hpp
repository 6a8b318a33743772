//  commands.hpp
#pragma once

#include <string>

class FifoWorker;
class FifoClient;

bool process_args(int argc, char* argv[]);
void register_subscriptions(FifoWorker& worker, FifoClient* forwarder);
void accept_message(const std::string& message, FifoClient* forwarder);
void report_error(const std::string& what);
void watch_signals(FifoWorker& worker);
void unwatch_signals();
