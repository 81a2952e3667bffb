#include "ruida/core/SignalBus.hpp"

#include <algorithm>

namespace ruida::core {

SignalBus::Token SignalBus::subscribe(const std::string& topic, Handler handler) {
    std::lock_guard lock(mutex);
    const Token token = nextToken++;
    topics[topic].push_back(Entry{token, std::move(handler)});
    return token;
}

void SignalBus::unsubscribe(Token token) {
    std::lock_guard lock(mutex);
    for (auto& [topic, entries] : topics) {
        entries.erase(std::remove_if(entries.begin(), entries.end(),
                                     [token](const Entry& e) { return e.token == token; }),
                      entries.end());
    }
}

void SignalBus::publish(const std::string& topic, const std::any& payload) {
    std::vector<Handler> handlers;
    {
        std::lock_guard lock(mutex);
        auto it = topics.find(topic);
        if (it == topics.end()) {
            return;
        }
        for (const auto& entry : it->second) {
            handlers.push_back(entry.handler);
        }
    }
    for (const auto& handler : handlers) {
        if (handler) {
            handler(payload);
        }
    }
}

std::size_t SignalBus::subscriberCount(const std::string& topic) const {
    std::lock_guard lock(mutex);
    auto it = topics.find(topic);
    return it == topics.end() ? 0 : it->second.size();
}

} // namespace ruida::core
