#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

// The reserved identifier of the root directory.
constexpr uint64_t kRootDirId = 0;

struct DirRecord {
    bool live = false;
    bool attached = false; // has an owning edge; never set on the root
    uint64_t parent = 0;
    std::string name;
    std::map<std::string, uint64_t> subdirs; // name -> directory id
    std::map<std::string, uint64_t> notes;   // name -> note id
};

struct NoteRecord {
    bool live = false;
    bool attached = false;
    uint64_t parent = 0;
    std::string name;
};

// In-memory arena of directory and note records indexed by identifier, with
// the parent -> children adjacency kept inside each directory record. The
// index does no validation of its own; TreeStore::Transaction checks every
// change before applying it here.
class TreeIndex {
  public:
    TreeIndex() = default;
    ~TreeIndex() = default;

    const DirRecord *dir(uint64_t id) const;
    const NoteRecord *note(uint64_t id) const;

    bool has_dir(uint64_t id) const { return dir(id) != nullptr; }
    bool has_note(uint64_t id) const { return note(id) != nullptr; }

    void add_dir(uint64_t id);
    void add_note(uint64_t id);

    // Marks the record gone. Edges must already be unlinked.
    void drop_dir(uint64_t id);
    void drop_note(uint64_t id);

    // Puts back a record saved before drop_*().
    void restore_dir(uint64_t id, const DirRecord &record);
    void restore_note(uint64_t id, const NoteRecord &record);

    void link_dir(uint64_t parent, uint64_t child, const std::string &name);
    void unlink_dir(uint64_t child);
    void link_note(uint64_t parent, uint64_t child, const std::string &name);
    void unlink_note(uint64_t child);

    size_t dir_count() const { return live_dirs_; }
    size_t note_count() const { return live_notes_; }

    // Upper bound (exclusive) of the identifiers ever added.
    uint64_t dir_id_bound() const { return dirs_.size(); }
    uint64_t note_id_bound() const { return notes_.size(); }

  private:
    std::vector<DirRecord> dirs_;
    std::vector<NoteRecord> notes_;
    size_t live_dirs_ = 0;
    size_t live_notes_ = 0;
};
