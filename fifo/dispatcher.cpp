// dispatcher.cpp
#include <regex>
#include <string>
#include <utility>
#include <variant>

#include "../core/utils.hpp"

#include "constants.hpp"
#include "dispatcher.hpp"

//  Subscriptions -----------------------------------------------------------------------------------------------------------------------------------------------

//  Wildcard: only the first one counts
void FifoDispatcher::subscribe(FifoHandler handler) {
    if (!wildcard_)
        wildcard_ = std::move(handler);
}

void FifoDispatcher::subscribe(FifoHandler handler, const std::string& message) {
    subscriptions_.emplace_back(ExactMatch{message, std::move(handler)});
}

void FifoDispatcher::subscribe(FifoHandler handler, const std::regex& pattern) {
    subscriptions_.emplace_back(PatternMatch{pattern, std::move(handler)});
}

void FifoDispatcher::subscribe_regex(FifoHandler handler, const std::string& pattern) {
    subscribe(std::move(handler), std::regex(pattern));
}

//  Dispatcher --------------------------------------------------------------------------------------------------------------------------------------------------
//  Patterns are anchored at the start of the message only, a matching prefix is enough

static bool matches(const FifoDispatcher::Subscription& sub, const std::string& message) {

    if (const auto* exact = std::get_if<FifoDispatcher::ExactMatch>(&sub))
        return exact->message == message;

    const auto& pattern = std::get<FifoDispatcher::PatternMatch>(sub).pattern;
    return std::regex_search(message, pattern, std::regex_constants::match_continuous);
}

static const FifoHandler& handler_of(const FifoDispatcher::Subscription& sub) {
    return std::visit([](const auto& s) -> const FifoHandler& { return s.handler; }, sub);
}

//  Returns false if the message was dropped
bool FifoDispatcher::dispatch(const std::string& message, const std::string& origin) const {

    for (const auto& sub : subscriptions_) {
        if (matches(sub, message)) {
            //  Copy: the handler may add subscriptions while it runs
            FifoHandler handler = handler_of(sub);
            handler(message, origin);
            return true;
        }
    }

    if (wildcard_) {
        FifoHandler handler = wildcard_;
        handler(message, origin);
        return true;
    }

    if (logging_verbose)
        log("LOG", "No subscriber for \"" + message + "\" on " + origin + ", dropped");

    return false;
}
