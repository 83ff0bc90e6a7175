#include "engine.h"
#include "ancestry.h"
#include "util.h"

#include <butil/logging.h>
#include <set>
#include <stdexcept>
#include <vector>

Status MutationEngine::authorize(const std::string &principal,
                                 const char *op) const {
    if (!gate_->can_edit(principal)) {
        return Status::PermissionDenied("'" + principal +
                                        "' may not edit the knowledge base (" +
                                        op + ")");
    }
    return Status::OK();
}

Status MutationEngine::finish(const char *op, Status s) const {
    if (s.ok()) {
        VLOG(1) << op << " committed";
    } else if (s.IsValidationError()) {
        LOG(WARNING) << op << " rejected: " << s.ToString();
    } else {
        LOG(ERROR) << op << " failed: " << s.ToString();
    }
    return s;
}

std::pair<Status, uint64_t> MutationEngine::allocate(IdAllocator *ids) {
    try {
        return {Status::OK(), ids->allocate()};
    } catch (const std::runtime_error &e) {
        return {Status::StorageFailure(e.what()), 0};
    }
}

std::pair<Status, uint64_t>
MutationEngine::create_directory(const std::string &principal, uint64_t parent,
                                 const std::string &name) {
    Status s = authorize(principal, "create_directory");
    if (!s.ok())
        return {finish("create_directory", s), 0};

    auto txn = store_->begin();
    if (!txn->has_dir(parent)) {
        return {finish("create_directory",
                       Status::UnknownParent("No directory with id " +
                                             std::to_string(parent))),
                0};
    }
    if (!is_valid_name(name)) {
        return {finish("create_directory",
                       Status::InvalidArgument("Invalid name '" + name + "'")),
                0};
    }
    if (txn->lookup_child(parent, name, ENTRY_DIRECTORY)) {
        return {finish("create_directory",
                       Status::DuplicateName("A directory named '" + name +
                                             "' already exists")),
                0};
    }

    auto [alloc, id] = allocate(dir_ids_);
    if (!alloc.ok())
        return {finish("create_directory", alloc), 0};
    s = txn->insert_dir(id);
    if (s.ok())
        s = txn->insert_dir_edge(parent, id, name);
    if (s.ok())
        s = txn->commit();
    if (!s.ok())
        return {finish("create_directory", s), 0};

    LOG(INFO) << "Created directory " << id << " '" << name << "' under "
              << parent;
    return {finish("create_directory", s), id};
}

std::pair<Status, uint64_t>
MutationEngine::create_note(const std::string &principal, uint64_t parent,
                            const std::string &name,
                            const std::string &content) {
    Status s = authorize(principal, "create_note");
    if (!s.ok())
        return {finish("create_note", s), 0};

    auto txn = store_->begin();
    if (!txn->has_dir(parent)) {
        return {finish("create_note",
                       Status::UnknownParent("No directory with id " +
                                             std::to_string(parent))),
                0};
    }
    if (!is_valid_name(name)) {
        return {finish("create_note",
                       Status::InvalidArgument("Invalid name '" + name + "'")),
                0};
    }
    if (txn->lookup_child(parent, name, ENTRY_NOTE)) {
        return {finish("create_note",
                       Status::DuplicateName("A note named '" + name +
                                             "' already exists")),
                0};
    }

    auto [alloc, id] = allocate(note_ids_);
    if (!alloc.ok())
        return {finish("create_note", alloc), 0};
    s = txn->insert_note(id, content);
    if (s.ok())
        s = txn->insert_note_edge(parent, id, name);
    if (s.ok())
        s = txn->commit();
    if (!s.ok())
        return {finish("create_note", s), 0};

    LOG(INFO) << "Created note " << id << " '" << name << "' under "
              << parent;
    return {finish("create_note", s), id};
}

Status MutationEngine::relocate_directory(TreeStore::Transaction *txn,
                                          uint64_t dir, uint64_t new_parent,
                                          const std::string &new_name) {
    if (!is_valid_name(new_name)) {
        return Status::InvalidArgument("Invalid name '" + new_name + "'");
    }
    const DirRecord *rec = txn->index().dir(dir);
    if (rec->attached && rec->parent == new_parent && rec->name == new_name) {
        return Status::OK();
    }
    if (txn->lookup_child(new_parent, new_name, ENTRY_DIRECTORY)) {
        return Status::DuplicateName("A directory named '" + new_name +
                                     "' already exists");
    }
    Status s = txn->remove_dir_edge(dir);
    if (!s.ok())
        return s;
    return txn->insert_dir_edge(new_parent, dir, new_name);
}

Status MutationEngine::move_directory(const std::string &principal,
                                      uint64_t dir, uint64_t new_parent,
                                      const std::string &new_name) {
    Status s = authorize(principal, "move_directory");
    if (!s.ok())
        return finish("move_directory", s);

    auto txn = store_->begin();
    if (!txn->has_dir(dir)) {
        return finish("move_directory",
                      Status::NotFound("No directory with id " +
                                       std::to_string(dir)));
    }
    if (!txn->has_dir(new_parent)) {
        return finish("move_directory",
                      Status::UnknownParent("No directory with id " +
                                            std::to_string(new_parent)));
    }
    // The exclusive lock is held from here to commit, so no concurrent move
    // can change the ancestor path between this check and the write.
    AncestryOracle oracle(txn->index());
    if (oracle.is_ancestor(dir, new_parent)) {
        return finish("move_directory",
                      Status::CycleRejected(
                          "Moving directory " + std::to_string(dir) +
                          " under " + std::to_string(new_parent) +
                          " would create a loop"));
    }

    s = relocate_directory(txn.get(), dir, new_parent, new_name);
    if (s.ok())
        s = txn->commit();
    if (s.ok()) {
        LOG(INFO) << "Moved directory " << dir << " to " << new_parent
                  << " as '" << new_name << "'";
    }
    return finish("move_directory", s);
}

Status MutationEngine::rename_directory(const std::string &principal,
                                        uint64_t dir,
                                        const std::string &new_name) {
    Status s = authorize(principal, "rename_directory");
    if (!s.ok())
        return finish("rename_directory", s);
    if (dir == kRootDirId) {
        return finish("rename_directory",
                      Status::RootImmovable("Cannot rename the root directory"));
    }

    auto txn = store_->begin();
    const DirRecord *rec = txn->index().dir(dir);
    if (rec == nullptr) {
        return finish("rename_directory",
                      Status::NotFound("No directory with id " +
                                       std::to_string(dir)));
    }
    s = relocate_directory(txn.get(), dir, rec->parent, new_name);
    if (s.ok())
        s = txn->commit();
    return finish("rename_directory", s);
}

Status MutationEngine::relocate_note(TreeStore::Transaction *txn,
                                     uint64_t note, uint64_t new_parent,
                                     const std::string &new_name) {
    if (!is_valid_name(new_name)) {
        return Status::InvalidArgument("Invalid name '" + new_name + "'");
    }
    const NoteRecord *rec = txn->index().note(note);
    if (rec->parent == new_parent && rec->name == new_name) {
        return Status::OK();
    }
    if (txn->lookup_child(new_parent, new_name, ENTRY_NOTE)) {
        return Status::DuplicateName("A note named '" + new_name +
                                     "' already exists");
    }
    Status s = txn->remove_note_edge(note);
    if (!s.ok())
        return s;
    return txn->insert_note_edge(new_parent, note, new_name);
}

Status MutationEngine::move_note(const std::string &principal, uint64_t note,
                                 uint64_t new_parent,
                                 const std::string &new_name) {
    Status s = authorize(principal, "move_note");
    if (!s.ok())
        return finish("move_note", s);

    auto txn = store_->begin();
    if (!txn->has_note(note)) {
        return finish("move_note", Status::NotFound("No note with id " +
                                                    std::to_string(note)));
    }
    if (!txn->has_dir(new_parent)) {
        return finish("move_note",
                      Status::UnknownParent("No directory with id " +
                                            std::to_string(new_parent)));
    }
    s = relocate_note(txn.get(), note, new_parent, new_name);
    if (s.ok())
        s = txn->commit();
    return finish("move_note", s);
}

Status MutationEngine::rename_note(const std::string &principal, uint64_t note,
                                   const std::string &new_name) {
    Status s = authorize(principal, "rename_note");
    if (!s.ok())
        return finish("rename_note", s);

    auto txn = store_->begin();
    const NoteRecord *rec = txn->index().note(note);
    if (rec == nullptr) {
        return finish("rename_note", Status::NotFound("No note with id " +
                                                      std::to_string(note)));
    }
    s = relocate_note(txn.get(), note, rec->parent, new_name);
    if (s.ok())
        s = txn->commit();
    return finish("rename_note", s);
}

Status MutationEngine::update_note(const std::string &principal,
                                   uint64_t note, const std::string &content) {
    Status s = authorize(principal, "update_note");
    if (!s.ok())
        return finish("update_note", s);

    auto txn = store_->begin();
    s = txn->update_note(note, content);
    if (s.ok())
        s = txn->commit();
    return finish("update_note", s);
}

Status MutationEngine::delete_note(const std::string &principal,
                                   uint64_t note) {
    Status s = authorize(principal, "delete_note");
    if (!s.ok())
        return finish("delete_note", s);

    auto txn = store_->begin();
    if (!txn->has_note(note)) {
        return finish("delete_note", Status::NotFound("No note with id " +
                                                      std::to_string(note)));
    }
    s = txn->remove_note_edge(note);
    if (s.ok())
        s = txn->erase_note(note);
    if (s.ok())
        s = txn->commit();
    if (s.ok())
        LOG(INFO) << "Deleted note " << note;
    return finish("delete_note", s);
}

Status MutationEngine::delete_directory(const std::string &principal,
                                        uint64_t dir) {
    if (dir == kRootDirId) {
        return finish("delete_directory",
                      Status::RootUndeletable(
                          "Cannot delete the root directory"));
    }
    Status s = authorize(principal, "delete_directory");
    if (!s.ok())
        return finish("delete_directory", s);

    auto txn = store_->begin();
    if (!txn->has_dir(dir)) {
        return finish("delete_directory",
                      Status::NotFound("No directory with id " +
                                       std::to_string(dir)));
    }

    AncestryOracle oracle(txn->index());
    const std::set<uint64_t> notes = oracle.owned_notes(dir);
    const std::vector<uint64_t> dirs = oracle.post_order(dir);

    for (uint64_t note : notes) {
        s = txn->remove_note_edge(note);
        if (s.ok())
            s = txn->erase_note(note);
        if (!s.ok())
            return finish("delete_directory", s);
    }
    // Children before parents; `dir` itself comes last.
    for (uint64_t d : dirs) {
        s = txn->remove_dir_edge(d);
        if (s.ok())
            s = txn->erase_dir(d);
        if (!s.ok())
            return finish("delete_directory", s);
    }

    s = txn->commit();
    if (s.ok()) {
        LOG(INFO) << "Deleted directory " << dir << " with " << dirs.size() - 1
                  << " subdirectories and " << notes.size() << " notes";
    }
    return finish("delete_directory", s);
}
