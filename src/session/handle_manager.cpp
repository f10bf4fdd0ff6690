//===----------------------------------------------------------------------===//
//                         DBRelay
//
// session/handle_manager.cpp
//
// Handle allocation, lookup and cascading release
//===----------------------------------------------------------------------===//

#include "session/handle_manager.hpp"
#include "logging/logger.hpp"

namespace dbrelay {

void HandleManager::ThrowMissing(uint64_t id) const {
    if (id == 0 || id > last_id) {
        throw RelayException(ErrorCode::INVALID_HANDLE,
                             "Unknown handle " + std::to_string(id));
    }
    throw RelayException(ErrorCode::HANDLE_CLOSED,
                         "Handle " + std::to_string(id) + " is closed");
}

std::shared_ptr<Resource> HandleManager::Lookup(uint64_t id) const {
    std::lock_guard<std::mutex> lock(mutex);
    auto it = handles.find(id);
    if (it == handles.end()) {
        ThrowMissing(id);
    }
    return it->second;
}

size_t HandleManager::CloseLocked(uint64_t id, std::vector<std::shared_ptr<Resource>>& removed) {
    auto it = handles.find(id);
    if (it == handles.end()) {
        return 0;
    }
    removed.push_back(std::move(it->second));
    handles.erase(it);

    std::vector<uint64_t> children;
    for (const auto& entry : handles) {
        if (entry.second->GetParentId() == id) {
            children.push_back(entry.first);
        }
    }

    size_t count = 1;
    for (uint64_t child : children) {
        count += CloseLocked(child, removed);
    }
    return count;
}

size_t HandleManager::Close(uint64_t id) {
    // Resources are destroyed after the lock is dropped
    std::vector<std::shared_ptr<Resource>> removed;
    size_t count;
    {
        std::lock_guard<std::mutex> lock(mutex);
        if (id == 0 || id > last_id) {
            ThrowMissing(id);
        }
        count = CloseLocked(id, removed);
    }
    if (count > 1) {
        LOG_TRACE("handles", "Closed handle " + std::to_string(id) + " and " +
                  std::to_string(count - 1) + " dependent handles");
    }
    return count;
}

size_t HandleManager::CloseChildren(uint64_t parent_id, HandleKind kind) {
    std::vector<std::shared_ptr<Resource>> removed;
    size_t count = 0;
    {
        std::lock_guard<std::mutex> lock(mutex);
        std::vector<uint64_t> children;
        for (const auto& entry : handles) {
            if (entry.second->GetParentId() == parent_id && entry.second->GetKind() == kind) {
                children.push_back(entry.first);
            }
        }
        for (uint64_t child : children) {
            count += CloseLocked(child, removed);
        }
    }
    return count;
}

size_t HandleManager::CloseAll() {
    phmap::flat_hash_map<uint64_t, std::shared_ptr<Resource>> removed;
    {
        std::lock_guard<std::mutex> lock(mutex);
        removed.swap(handles);
    }
    return removed.size();
}

void HandleManager::BeginClosing() {
    std::lock_guard<std::mutex> lock(mutex);
    closing = true;
}

bool HandleManager::IsClosing() const {
    std::lock_guard<std::mutex> lock(mutex);
    return closing;
}

size_t HandleManager::OpenCount() const {
    std::lock_guard<std::mutex> lock(mutex);
    return handles.size();
}

uint64_t HandleManager::LastAllocatedId() const {
    std::lock_guard<std::mutex> lock(mutex);
    return last_id;
}

} // namespace dbrelay
