#ifndef KBSTORE_NAMESPACE_H
#define KBSTORE_NAMESPACE_H

#include "kbstore.pb.h"
#include "status.h"
#include "tree_store.h"

#include <cstdint>
#include <optional>
#include <set>
#include <string>

struct Subtree {
    std::set<uint64_t> dirs;
    std::set<uint64_t> notes;
};

// Read-only view of the namespace for collaborators: lookups, listings, path
// resolution and ancestry queries. Every call works on one consistent
// snapshot and never sees a half-committed mutation.
class Namespace {
  public:
    explicit Namespace(const TreeStore *store) : store_(store) {}
    ~Namespace() {}

    std::optional<Entry> lookup_child(uint64_t parent,
                                      const std::string &name) const;
    std::pair<Status, Listing> list_children(uint64_t parent) const;
    std::pair<Status, Note> read_note(uint64_t note) const;

    // "/a/b/readme" -> entry. Intermediate components must be directories;
    // the last one resolves directory-first. "/" is the root.
    std::pair<Status, Entry> resolve_path(const std::string &path) const;

    // Absolute path of a directory, "/" for the root.
    std::pair<Status, std::string> directory_path(uint64_t dir) const;

    // Empty for the root.
    std::pair<Status, std::optional<uint64_t>>
    directory_parent(uint64_t dir) const;
    std::pair<Status, std::optional<std::string>>
    directory_name(uint64_t dir) const;
    std::pair<Status, uint64_t> note_parent(uint64_t note) const;
    std::pair<Status, std::string> note_name(uint64_t note) const;

    bool is_ancestor(uint64_t candidate, uint64_t target) const;
    std::set<uint64_t> descendants(uint64_t root) const;
    std::set<uint64_t> owned_notes(uint64_t root) const;

    // Directories and notes of the subtree at `root`, read from one snapshot.
    std::pair<Status, Subtree> subtree(uint64_t root) const;

  private:
    const TreeStore *store_;
};

#endif // KBSTORE_NAMESPACE_H
