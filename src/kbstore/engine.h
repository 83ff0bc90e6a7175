#pragma once

#include "id_allocator.h"
#include "permissions.h"
#include "status.h"
#include "tree_store.h"

#include <cstdint>
#include <string>
#include <utility>

// Orchestrates every write to the namespace. Each request is validated and
// applied inside one TreeStore transaction, so it either commits whole or
// leaves no trace:
//
//   Validating -> Applying -> Committed
//   Validating -> Rejected
//
// The permission check always runs before the transaction is opened.
class MutationEngine {
  public:
    MutationEngine(TreeStore *store, IdAllocator *dir_ids,
                   IdAllocator *note_ids, const PermissionGate *gate)
        : store_(store), dir_ids_(dir_ids), note_ids_(note_ids), gate_(gate) {}
    ~MutationEngine() = default;

    std::pair<Status, uint64_t> create_directory(const std::string &principal,
                                                 uint64_t parent,
                                                 const std::string &name);
    std::pair<Status, uint64_t> create_note(const std::string &principal,
                                            uint64_t parent,
                                            const std::string &name,
                                            const std::string &content);

    // Rejects with CycleRejected when `new_parent` is `dir` or lies inside
    // the subtree of `dir`.
    Status move_directory(const std::string &principal, uint64_t dir,
                          uint64_t new_parent, const std::string &new_name);
    Status rename_directory(const std::string &principal, uint64_t dir,
                            const std::string &new_name);

    Status move_note(const std::string &principal, uint64_t note,
                     uint64_t new_parent, const std::string &new_name);
    Status rename_note(const std::string &principal, uint64_t note,
                       const std::string &new_name);
    Status update_note(const std::string &principal, uint64_t note,
                       const std::string &content);

    Status delete_note(const std::string &principal, uint64_t note);

    // Removes the directory, every directory below it and every note they
    // own in a single transaction.
    Status delete_directory(const std::string &principal, uint64_t dir);

  private:
    Status authorize(const std::string &principal, const char *op) const;
    Status finish(const char *op, Status s) const;
    // Exhaustion of the id space fails the request with StorageFailure.
    static std::pair<Status, uint64_t> allocate(IdAllocator *ids);

    Status relocate_directory(TreeStore::Transaction *txn, uint64_t dir,
                              uint64_t new_parent,
                              const std::string &new_name);
    Status relocate_note(TreeStore::Transaction *txn, uint64_t note,
                         uint64_t new_parent, const std::string &new_name);

    TreeStore *store_;
    IdAllocator *dir_ids_;
    IdAllocator *note_ids_;
    const PermissionGate *gate_;
};
