#include "permissions.h"
#include "tree_store.h"

#include <butil/logging.h>
#include <mutex>

Status PermissionGate::init() {
    auto [s, records] = store_->load_permissions();
    if (!s.ok()) {
        LOG(ERROR) << "Failed to load permissions: " << s.ToString();
        return s;
    }
    std::unique_lock<std::shared_mutex> lock(mu_);
    records_.clear();
    for (auto &record : records) {
        records_[record.principal()] = std::move(record);
    }
    LOG(INFO) << "Loaded " << records_.size() << " permission records";
    return Status::OK();
}

bool PermissionGate::can_edit(const std::string &principal) const {
    return get(principal).can_edit();
}

bool PermissionGate::can_receive_feedback(const std::string &principal) const {
    return get(principal).can_receive_feedback();
}

PermissionRecord PermissionGate::get(const std::string &principal) const {
    std::shared_lock<std::shared_mutex> lock(mu_);
    auto it = records_.find(principal);
    if (it != records_.end())
        return it->second;
    PermissionRecord none;
    none.set_principal(principal);
    return none;
}

Status PermissionGate::set(const PermissionRecord &record) {
    if (record.principal().empty()) {
        return Status::InvalidArgument("Empty principal");
    }
    std::unique_lock<std::shared_mutex> lock(mu_);
    Status s = store_->put_permission(record);
    if (!s.ok())
        return s;
    records_[record.principal()] = record;
    LOG(INFO) << "Permissions of " << record.principal()
              << ": edit=" << record.can_edit()
              << " feedback=" << record.can_receive_feedback();
    return Status::OK();
}

Status PermissionGate::grant(const std::string &requester,
                             const PermissionRecord &record) {
    if (!is_admin(requester)) {
        LOG(WARNING) << "'" << requester
                     << "' may not change the permissions of '"
                     << record.principal() << "'";
        return Status::PermissionDenied("'" + requester +
                                        "' may not change permissions");
    }
    return set(record);
}

Status PermissionGate::revoke(const std::string &principal) {
    std::unique_lock<std::shared_mutex> lock(mu_);
    Status s = store_->delete_permission(principal);
    if (!s.ok())
        return s;
    records_.erase(principal);
    return Status::OK();
}
