// dispatcher.hpp
#pragma once

#include <functional>
#include <regex>
#include <string>
#include <variant>
#include <vector>

//  Handler arguments: the message and the logical name of the pipe it came through
using FifoHandler = std::function<void(const std::string&, const std::string&)>;

//  Message table: subscriptions are tried in the order they were added, the first match
//  gets the message and nothing else does. The wildcard only sees what no subscription took.
class FifoDispatcher {
public:
    struct ExactMatch {
        std::string message;
        FifoHandler handler;
    };

    struct PatternMatch {
        std::regex pattern;
        FifoHandler handler;
    };

    using Subscription = std::variant<ExactMatch, PatternMatch>;

    void subscribe(FifoHandler handler);
    void subscribe(FifoHandler handler, const std::string& message);
    void subscribe(FifoHandler handler, const std::regex& pattern);
    void subscribe_regex(FifoHandler handler, const std::string& pattern);

    bool dispatch(const std::string& message, const std::string& origin) const;

    size_t size() const { return subscriptions_.size(); }
    bool has_wildcard() const { return static_cast<bool>(wildcard_); }

private:
    std::vector<Subscription> subscriptions_;
    FifoHandler wildcard_;
};
