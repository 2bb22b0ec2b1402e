#include "events/Dispatcher.hpp"
#include "remote/errors.hpp"
#include "log/Registry.hpp"

#include <algorithm>
#include <cctype>
#include <fmt/core.h>

using json = nlohmann::json;

namespace loft::events {

namespace {

std::string lower(std::string s) {
    std::ranges::transform(s, s.begin(), [](const unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

template <typename T>
T arg(const json& args, const size_t index) {
    if (!args.is_array() || index >= args.size())
        throw std::out_of_range(fmt::format("missing argument {}", index));
    return args[index].get<T>();
}

}

Dispatcher::Dispatcher(std::shared_ptr<EventSink> sink) : sink_(std::move(sink)) {
    if (!sink_) sink_ = std::make_shared<EventSink>();

    const auto list = [](void (EventSink::*hook)(const std::vector<ItemRef>&)) {
        return [hook](EventSink& s, const json& a) { (s.*hook)(arg<std::vector<ItemRef>>(a, 0)); };
    };
    const auto mail = [](void (EventSink::*hook)(const std::vector<Mail>&)) {
        return [hook](EventSink& s, const json& a) { (s.*hook)(arg<std::vector<Mail>>(a, 0)); };
    };

    handlers_ = {
        {"filesadded", list(&EventSink::filesAdded)},
        {"filesdeleted", list(&EventSink::filesDeleted)},
        {"filesmodified", list(&EventSink::filesModified)},
        {"eventmodified", list(&EventSink::eventModified)},
        {"eventdeleted", list(&EventSink::eventDeleted)},
        {"contactsmodified", list(&EventSink::contactsModified)},
        {"folderchange", [](EventSink& s, const json&) { s.folderChanged(); }},
        {"fsfolderchange", [](EventSink& s, const json& a) { s.fsFolderChange(arg<FolderChange>(a, 0)); }},
        {"mailboxsizeupdate", [](EventSink& s, const json& a) {
            s.mailboxSizeUpdate(arg<std::vector<MailboxSizeUpdate>>(a, 0));
        }},
        {"mailadded", mail(&EventSink::mailAdded)},
        {"mailmodified", mail(&EventSink::mailModified)},
        {"mailremoved", mail(&EventSink::mailRemoved)},
        {"contactsdeleted", [](EventSink& s, const json& a) {
            s.contactsDeleted(arg<std::string>(a, 0), arg<std::vector<std::string>>(a, 1));
        }},
        {"tasksmodified", [](EventSink& s, const json& a) {
            s.tasksModified(arg<std::string>(a, 0), arg<std::vector<ItemRef>>(a, 1));
        }},
        {"tasksdeleted", [](EventSink& s, const json& a) {
            s.tasksDeleted(arg<std::string>(a, 0), arg<std::vector<std::string>>(a, 1));
        }},
        {"selftestreturn", [](EventSink& s, const json& a) { s.selfTestReturn(arg<SelfTest>(a, 0)); }},
    };
}

bool Dispatcher::dispatch(const std::string& target, const json& arguments) const {
    const auto it = handlers_.find(lower(target));
    if (it == handlers_.end()) {
        log::Registry::events()->debug("[Dispatcher] Ignoring unknown event '{}'", target);
        return false;
    }

    log::Registry::events()->debug("[Dispatcher] {}", target);

    try {
        it->second(*sink_, arguments);
    } catch (const json::exception& e) {
        throw remote::DecodeError(fmt::format("malformed arguments for event '{}': {}", target, e.what()));
    } catch (const std::out_of_range& e) {
        throw remote::DecodeError(fmt::format("malformed arguments for event '{}': {}", target, e.what()));
    }
    return true;
}

bool Dispatcher::dispatchMessage(const std::string& message) const {
    json j;
    try {
        j = json::parse(message);
    } catch (const json::parse_error& e) {
        throw remote::DecodeError(fmt::format("hub message is not JSON: {}", e.what()));
    }

    if (!j.is_object() || !j.contains("target") || !j["target"].is_string())
        throw remote::DecodeError("hub message has no target");

    return dispatch(j["target"].get<std::string>(), j.value("arguments", json::array()));
}

}
