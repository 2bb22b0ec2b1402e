#include "events/types.hpp"

#include <nlohmann/json.hpp>

namespace loft::events {

void from_json(const nlohmann::json& j, ItemRef& r) {
    r.id = j.at("id").get<std::string>();
    r.source = j.value("source", std::string{});
}

void from_json(const nlohmann::json& j, FolderChange& c) {
    c.action = j.value("action", 0);
    c.parent_folder = j.value("parentFolder", std::string{});
    c.folder = j.value("folder", std::string{});
}

void from_json(const nlohmann::json& j, MailboxSizeUpdate& u) {
    u.size = j.value("size", int64_t{0});
    u.max_size = j.value("maxSize", int64_t{0});
}

void from_json(const nlohmann::json& j, Mail& m) {
    m.uid = j.value("uid", int64_t{0});
    m.mail_id = j.value("mid", int64_t{0});
    m.owner_email_address = j.value("ownerEmailAddress", std::string{});
    m.folder = j.value("folder", std::string{});
    m.is_new = j.value("isNew", false);
}

void from_json(const nlohmann::json& j, SelfTest& t) {
    t.test_str = j.value("testStr", std::string{});
}

}
