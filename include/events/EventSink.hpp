#pragma once

#include "events/types.hpp"

#include <string>
#include <vector>

namespace loft::events {

/// Receives decoded hub events. Every hook defaults to a no-op.
class EventSink {
public:
    virtual ~EventSink() = default;

    virtual void filesAdded(const std::vector<ItemRef>&) {}
    virtual void filesDeleted(const std::vector<ItemRef>&) {}
    virtual void filesModified(const std::vector<ItemRef>&) {}

    virtual void folderChanged() {}
    virtual void fsFolderChange(const FolderChange&) {}

    virtual void mailboxSizeUpdate(const std::vector<MailboxSizeUpdate>&) {}
    virtual void mailAdded(const std::vector<Mail>&) {}
    virtual void mailModified(const std::vector<Mail>&) {}
    virtual void mailRemoved(const std::vector<Mail>&) {}

    virtual void eventModified(const std::vector<ItemRef>&) {}
    virtual void eventDeleted(const std::vector<ItemRef>&) {}

    virtual void contactsModified(const std::vector<ItemRef>&) {}
    virtual void contactsDeleted(const std::string& /*source*/, const std::vector<std::string>& /*ids*/) {}

    virtual void tasksModified(const std::string& /*user*/, const std::vector<ItemRef>&) {}
    virtual void tasksDeleted(const std::string& /*user*/, const std::vector<std::string>& /*ids*/) {}

    virtual void selfTestReturn(const SelfTest&) {}
};

}
