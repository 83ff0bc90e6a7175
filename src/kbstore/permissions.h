#pragma once

#include "kbstore.pb.h"
#include "status.h"

#include <shared_mutex>
#include <string>
#include <unordered_map>

class TreeStore;

// Per-principal capabilities. A principal without a record has none.
// Records change only through set()/revoke(), called locally at startup, or
// through grant(), which requires the administrator principal.
class PermissionGate {
  public:
    PermissionGate(TreeStore *store, const std::string &admin)
        : store_(store), admin_(admin) {}
    ~PermissionGate() = default;

    // Loads every persisted record into the cache.
    Status init();

    bool can_edit(const std::string &principal) const;
    bool can_receive_feedback(const std::string &principal) const;

    // All-false record when the principal is unknown.
    PermissionRecord get(const std::string &principal) const;

    Status set(const PermissionRecord &record);
    Status revoke(const std::string &principal);

    // set() on behalf of `requester`; PermissionDenied unless it is the
    // administrator. An empty administrator disables remote changes.
    Status grant(const std::string &requester, const PermissionRecord &record);

    bool is_admin(const std::string &principal) const {
        return !admin_.empty() && principal == admin_;
    }

  private:
    TreeStore *store_;
    const std::string admin_;
    mutable std::shared_mutex mu_;
    std::unordered_map<std::string, PermissionRecord> records_;
};
