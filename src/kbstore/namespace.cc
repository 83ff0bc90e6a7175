#include "namespace.h"
#include "ancestry.h"
#include "util.h"

#include <utility>
#include <vector>

namespace {

Status no_such_dir(uint64_t id) {
    return Status::NotFound("No directory with id " + std::to_string(id));
}

Status no_such_note(uint64_t id) {
    return Status::NotFound("No note with id " + std::to_string(id));
}

} // namespace

std::optional<Entry> Namespace::lookup_child(uint64_t parent,
                                             const std::string &name) const {
    auto snap = store_->snapshot();
    return snap.lookup_child(parent, name);
}

std::pair<Status, Listing> Namespace::list_children(uint64_t parent) const {
    auto snap = store_->snapshot();
    return snap.list_children(parent);
}

std::pair<Status, Note> Namespace::read_note(uint64_t note) const {
    auto snap = store_->snapshot();
    return snap.read_note(note);
}

std::pair<Status, Entry>
Namespace::resolve_path(const std::string &path) const {
    Entry current;
    current.set_kind(ENTRY_DIRECTORY);
    current.set_id(kRootDirId);

    std::vector<std::string> parts = split_path(path);
    if (parts.empty()) {
        // it means this is the root directory
        return {Status::OK(), current};
    }

    auto snap = store_->snapshot();
    for (size_t i = 0; i < parts.size(); ++i) {
        std::optional<Entry> next;
        if (i + 1 < parts.size()) {
            next = snap.lookup_child(current.id(), parts[i], ENTRY_DIRECTORY);
        } else {
            next = snap.lookup_child(current.id(), parts[i]);
        }
        if (!next) {
            return {Status::NotFound("No entry '" + parts[i] + "' in path " +
                                     path),
                    Entry()};
        }
        current = *next;
    }
    return {Status::OK(), current};
}

std::pair<Status, std::string>
Namespace::directory_path(uint64_t dir) const {
    auto snap = store_->snapshot();
    if (!snap.has_dir(dir))
        return {no_such_dir(dir), ""};

    std::vector<std::string> names;
    uint64_t cur = dir;
    while (cur != kRootDirId) {
        const DirRecord *rec = snap.index().dir(cur);
        names.push_back(rec->name);
        cur = rec->parent;
    }
    std::string path = "/";
    for (auto it = names.rbegin(); it != names.rend(); ++it) {
        path = join_paths(path, *it);
    }
    return {Status::OK(), path};
}

std::pair<Status, std::optional<uint64_t>>
Namespace::directory_parent(uint64_t dir) const {
    auto snap = store_->snapshot();
    const DirRecord *rec = snap.index().dir(dir);
    if (rec == nullptr)
        return {no_such_dir(dir), std::nullopt};
    if (!rec->attached)
        return {Status::OK(), std::nullopt};
    return {Status::OK(), rec->parent};
}

std::pair<Status, std::optional<std::string>>
Namespace::directory_name(uint64_t dir) const {
    auto snap = store_->snapshot();
    const DirRecord *rec = snap.index().dir(dir);
    if (rec == nullptr)
        return {no_such_dir(dir), std::nullopt};
    if (!rec->attached)
        return {Status::OK(), std::nullopt};
    return {Status::OK(), rec->name};
}

std::pair<Status, uint64_t> Namespace::note_parent(uint64_t note) const {
    auto snap = store_->snapshot();
    const NoteRecord *rec = snap.index().note(note);
    if (rec == nullptr)
        return {no_such_note(note), 0};
    return {Status::OK(), rec->parent};
}

std::pair<Status, std::string> Namespace::note_name(uint64_t note) const {
    auto snap = store_->snapshot();
    const NoteRecord *rec = snap.index().note(note);
    if (rec == nullptr)
        return {no_such_note(note), ""};
    return {Status::OK(), rec->name};
}

bool Namespace::is_ancestor(uint64_t candidate, uint64_t target) const {
    auto snap = store_->snapshot();
    return AncestryOracle(snap.index()).is_ancestor(candidate, target);
}

std::set<uint64_t> Namespace::descendants(uint64_t root) const {
    auto snap = store_->snapshot();
    return AncestryOracle(snap.index()).descendants(root);
}

std::set<uint64_t> Namespace::owned_notes(uint64_t root) const {
    auto snap = store_->snapshot();
    return AncestryOracle(snap.index()).owned_notes(root);
}

std::pair<Status, Subtree> Namespace::subtree(uint64_t root) const {
    auto snap = store_->snapshot();
    if (!snap.has_dir(root))
        return {no_such_dir(root), Subtree()};
    AncestryOracle oracle(snap.index());
    Subtree result;
    result.dirs = oracle.descendants(root);
    result.notes = oracle.owned_notes(root);
    return {Status::OK(), std::move(result)};
}
