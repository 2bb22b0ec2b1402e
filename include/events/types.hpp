#pragma once

#include <cstdint>
#include <string>
#include <nlohmann/json_fwd.hpp>

namespace loft::events {

/// Files, calendar events, contacts and tasks are all announced as {id, source}.
struct ItemRef {
    std::string id;
    std::string source;
};

struct FolderChange {
    int action = 0;
    std::string parent_folder;
    std::string folder;
};

struct MailboxSizeUpdate {
    int64_t size = 0;
    int64_t max_size = 0;
};

struct Mail {
    int64_t uid = 0;
    int64_t mail_id = 0;
    std::string owner_email_address;
    std::string folder;
    bool is_new = false;
};

struct SelfTest {
    std::string test_str;
};

void from_json(const nlohmann::json& j, ItemRef& r);
void from_json(const nlohmann::json& j, FolderChange& c);
void from_json(const nlohmann::json& j, MailboxSizeUpdate& u);
void from_json(const nlohmann::json& j, Mail& m);
void from_json(const nlohmann::json& j, SelfTest& t);

}
