//===----------------------------------------------------------------------===//
//                         DBRelay
//
// session/handle_manager.hpp
//
// Per-session table of statement, cursor and LOB handles
//===----------------------------------------------------------------------===//

#pragma once

#include "common.hpp"
#include "exception.hpp"
#include "session/resources.hpp"
#include <parallel_hashmap/phmap.h>

namespace dbrelay {

// Ids are allocated from a per-session counter and never reused, so an id at
// or below the counter that is no longer in the table is known to be closed.
class HandleManager {
public:
    HandleManager() = default;

    HandleManager(const HandleManager&) = delete;
    HandleManager& operator=(const HandleManager&) = delete;

    // Allocate a new handle owned by parent_id (0 = the session).
    // Refused while the session is being torn down.
    template <typename T, typename... Args>
    std::shared_ptr<T> Allocate(uint64_t parent_id, Args&&... args) {
        std::lock_guard<std::mutex> lock(mutex);
        if (closing) {
            throw RelayException(ErrorCode::SESSION_CLOSING, "Session is closing; cannot allocate handles");
        }
        if (parent_id != 0 && handles.find(parent_id) == handles.end()) {
            ThrowMissing(parent_id);
        }
        uint64_t id = ++last_id;
        auto resource = std::make_shared<T>(id, parent_id, std::forward<Args>(args)...);
        handles.emplace(id, resource);
        return resource;
    }

    // Throws INVALID_HANDLE for ids never allocated, HANDLE_CLOSED for closed ones
    std::shared_ptr<Resource> Lookup(uint64_t id) const;

    template <typename T>
    std::shared_ptr<T> LookupAs(uint64_t id) const {
        auto resource = Lookup(id);
        if (resource->GetKind() != T::KIND) {
            throw RelayException(ErrorCode::WRONG_HANDLE_KIND,
                                 "Handle " + std::to_string(id) + " is a " +
                                 HandleKindToString(resource->GetKind()) + ", expected a " +
                                 HandleKindToString(T::KIND));
        }
        return std::static_pointer_cast<T>(resource);
    }

    // Close a handle and everything it owns. Closing an already closed handle
    // succeeds and returns 0; an id that was never allocated is an error.
    size_t Close(uint64_t id);

    // Close the children of parent_id of one kind (cursors on re-execution)
    size_t CloseChildren(uint64_t parent_id, HandleKind kind);

    // Close every handle (session destruction)
    size_t CloseAll();

    // Refuse further allocations
    void BeginClosing();
    bool IsClosing() const;

    size_t OpenCount() const;
    uint64_t LastAllocatedId() const;

private:
    [[noreturn]] void ThrowMissing(uint64_t id) const;

    // Removes id and its descendants; caller holds the lock
    size_t CloseLocked(uint64_t id, std::vector<std::shared_ptr<Resource>>& removed);

    phmap::flat_hash_map<uint64_t, std::shared_ptr<Resource>> handles;
    uint64_t last_id = 0;
    bool closing = false;
    mutable std::mutex mutex;
};

} // namespace dbrelay
