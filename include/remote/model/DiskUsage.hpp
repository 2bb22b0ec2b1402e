#pragma once

#include <cstdint>
#include <nlohmann/json_fwd.hpp>

namespace loft::remote::model {

struct DiskUsage {
    int64_t allowed = 0;
    int64_t used = 0;
    int64_t mailboxes = 0;
    int64_t appointments = 0;
    int64_t contacts = 0;
    int64_t notes = 0;
    int64_t tasks = 0;
    int64_t file_storage = 0;
    int64_t meeting_workspace = 0;
    int64_t chat_files = 0;

    [[nodiscard]] int64_t available() const { return allowed > used ? allowed - used : 0; }
};

void to_json(nlohmann::json& j, const DiskUsage& d);
void from_json(const nlohmann::json& j, DiskUsage& d);

}
