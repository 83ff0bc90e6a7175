#include "tree_index.h"

const DirRecord *TreeIndex::dir(uint64_t id) const {
    if (id >= dirs_.size() || !dirs_[id].live)
        return nullptr;
    return &dirs_[id];
}

const NoteRecord *TreeIndex::note(uint64_t id) const {
    if (id >= notes_.size() || !notes_[id].live)
        return nullptr;
    return &notes_[id];
}

void TreeIndex::add_dir(uint64_t id) {
    if (id >= dirs_.size())
        dirs_.resize(id + 1);
    if (!dirs_[id].live)
        ++live_dirs_;
    dirs_[id] = DirRecord();
    dirs_[id].live = true;
}

void TreeIndex::add_note(uint64_t id) {
    if (id >= notes_.size())
        notes_.resize(id + 1);
    if (!notes_[id].live)
        ++live_notes_;
    notes_[id] = NoteRecord();
    notes_[id].live = true;
}

void TreeIndex::drop_dir(uint64_t id) {
    if (!has_dir(id))
        return;
    dirs_[id] = DirRecord();
    --live_dirs_;
}

void TreeIndex::drop_note(uint64_t id) {
    if (!has_note(id))
        return;
    notes_[id] = NoteRecord();
    --live_notes_;
}

void TreeIndex::restore_dir(uint64_t id, const DirRecord &record) {
    if (id >= dirs_.size())
        dirs_.resize(id + 1);
    if (!dirs_[id].live)
        ++live_dirs_;
    dirs_[id] = record;
    dirs_[id].live = true;
}

void TreeIndex::restore_note(uint64_t id, const NoteRecord &record) {
    if (id >= notes_.size())
        notes_.resize(id + 1);
    if (!notes_[id].live)
        ++live_notes_;
    notes_[id] = record;
    notes_[id].live = true;
}

void TreeIndex::link_dir(uint64_t parent, uint64_t child,
                         const std::string &name) {
    dirs_[parent].subdirs[name] = child;
    DirRecord &rec = dirs_[child];
    rec.attached = true;
    rec.parent = parent;
    rec.name = name;
}

void TreeIndex::unlink_dir(uint64_t child) {
    DirRecord &rec = dirs_[child];
    if (!rec.attached)
        return;
    if (rec.parent < dirs_.size())
        dirs_[rec.parent].subdirs.erase(rec.name);
    rec.attached = false;
    rec.parent = 0;
    rec.name.clear();
}

void TreeIndex::link_note(uint64_t parent, uint64_t child,
                          const std::string &name) {
    dirs_[parent].notes[name] = child;
    NoteRecord &rec = notes_[child];
    rec.attached = true;
    rec.parent = parent;
    rec.name = name;
}

void TreeIndex::unlink_note(uint64_t child) {
    NoteRecord &rec = notes_[child];
    if (!rec.attached)
        return;
    if (rec.parent < dirs_.size())
        dirs_[rec.parent].notes.erase(rec.name);
    rec.attached = false;
    rec.parent = 0;
    rec.name.clear();
}
