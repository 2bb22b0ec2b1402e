#pragma once

#include "events/EventSink.hpp"

#include <functional>
#include <memory>
#include <string>
#include <unordered_map>
#include <nlohmann/json.hpp>

namespace loft::events {

/// Routes hub invocations (target name plus JSON argument array) to an EventSink.
class Dispatcher {
public:
    explicit Dispatcher(std::shared_ptr<EventSink> sink);

    /// Returns false for targets it does not know. Malformed arguments throw remote::DecodeError.
    bool dispatch(const std::string& target, const nlohmann::json& arguments) const;

    /// Parses a hub invocation message: {"type":1,"target":...,"arguments":[...]}.
    bool dispatchMessage(const std::string& message) const;

private:
    using Handler = std::function<void(EventSink&, const nlohmann::json& args)>;

    std::shared_ptr<EventSink> sink_;
    std::unordered_map<std::string, Handler> handlers_;
};

}
