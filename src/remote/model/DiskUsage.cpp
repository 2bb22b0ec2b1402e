#include "remote/model/DiskUsage.hpp"

#include <nlohmann/json.hpp>

namespace loft::remote::model {

void to_json(nlohmann::json& j, const DiskUsage& d) {
    j = {
        {"allowed", d.allowed},
        {"used", d.used},
        {"mailboxes", d.mailboxes},
        {"appointmentsUsed", d.appointments},
        {"contactsUsed", d.contacts},
        {"notesUsed", d.notes},
        {"tasksUsed", d.tasks},
        {"fileStorageUsed", d.file_storage},
        {"meetingWorkspaceUsed", d.meeting_workspace},
        {"chatFilesUsed", d.chat_files}
    };
}

void from_json(const nlohmann::json& j, DiskUsage& d) {
    d.allowed = j.value("allowed", int64_t{0});
    d.used = j.value("used", int64_t{0});
    d.mailboxes = j.value("mailboxes", int64_t{0});
    d.appointments = j.value("appointmentsUsed", int64_t{0});
    d.contacts = j.value("contactsUsed", int64_t{0});
    d.notes = j.value("notesUsed", int64_t{0});
    d.tasks = j.value("tasksUsed", int64_t{0});
    d.file_storage = j.value("fileStorageUsed", int64_t{0});
    d.meeting_workspace = j.value("meetingWorkspaceUsed", int64_t{0});
    d.chat_files = j.value("chatFilesUsed", int64_t{0});
}

}
