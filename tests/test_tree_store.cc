#include "test_helpers.h"

#include "ancestry.h"

#include <limits>

namespace {

StoreOptions options_for(const TempDir &dir, bool read_only = false) {
    StoreOptions options;
    options.db_path = dir.path();
    options.read_only = read_only;
    options.sync_writes = false;
    return options;
}

// Creates directory `id` under `parent` in its own transaction.
void add_dir(TreeStore &store, uint64_t parent, uint64_t id,
             const std::string &name) {
    auto txn = store.begin();
    REQUIRE(txn->insert_dir(id).ok());
    REQUIRE(txn->insert_dir_edge(parent, id, name).ok());
    REQUIRE(txn->commit().ok());
}

// Writes one raw value into a closed store, bypassing TreeStore.
void put_raw(const std::string &path, const std::string &family,
             const std::string &key, const std::string &value) {
    std::vector<rocksdb::ColumnFamilyDescriptor> families;
    for (const char *name : {"default", "notes", "dirs", "note_edges",
                             "dir_edges", "permissions"}) {
        families.emplace_back(name, rocksdb::ColumnFamilyOptions());
    }
    std::vector<rocksdb::ColumnFamilyHandle *> handles;
    rocksdb::DB *db = nullptr;
    rocksdb::Status st = rocksdb::DB::Open(rocksdb::Options(), path, families,
                                           &handles, &db);
    REQUIRE(st.ok());

    st = rocksdb::Status::NotFound(family);
    for (auto *handle : handles) {
        if (handle->GetName() == family)
            st = db->Put(rocksdb::WriteOptions(), handle, key, value);
    }
    for (auto *handle : handles)
        db->DestroyColumnFamilyHandle(handle);
    delete db;
    REQUIRE(st.ok());
}

std::string dir_row(uint64_t id) {
    DirRow row;
    row.set_id(id);
    return row.SerializeAsString();
}

std::string note_row(uint64_t id) {
    NoteRow row;
    row.set_id(id);
    return row.SerializeAsString();
}

} // namespace

TEST_CASE("A fresh store holds only the root") {
    TempDir dir;
    TreeStore store(options_for(dir));
    REQUIRE(store.init().ok());

    auto snap = store.snapshot();
    CHECK(snap.has_dir(kRootDirId));
    CHECK(snap.index().dir_count() == 1);
    CHECK(snap.index().note_count() == 0);
    CHECK_FALSE(snap.index().dir(kRootDirId)->attached);
    CHECK(store.next_dir_id() == 1);
    CHECK(store.next_note_id() == 1);

    auto [s, listing] = snap.list_children(kRootDirId);
    REQUIRE(s.ok());
    CHECK(listing.dirs_size() == 0);
    CHECK(listing.notes_size() == 0);
}

TEST_CASE("Directory edges are validated before they are staged") {
    TempDir dir;
    TreeStore store(options_for(dir));
    REQUIRE(store.init().ok());
    add_dir(store, kRootDirId, 1, "a");
    add_dir(store, kRootDirId, 2, "b");

    auto txn = store.begin();
    REQUIRE(txn->insert_dir(3).ok());

    CHECK(txn->insert_dir_edge(3, 3, "self").code() == Status::kSelfParent);
    CHECK(txn->insert_dir_edge(77, 3, "x").code() == Status::kUnknownParent);
    CHECK(txn->insert_dir_edge(kRootDirId, 78, "x").code() ==
          Status::kNotFound);
    CHECK(txn->insert_dir_edge(1, kRootDirId, "x").code() ==
          Status::kRootImmovable);
    CHECK(txn->insert_dir_edge(kRootDirId, 3, "a").code() ==
          Status::kDuplicateName);
    CHECK(txn->insert_dir_edge(kRootDirId, 3, "").code() ==
          Status::kInvalidArgument);
    CHECK(txn->insert_dir_edge(kRootDirId, 3, "x/y").code() ==
          Status::kInvalidArgument);
    // Directory 1 already has a parent.
    CHECK(txn->insert_dir_edge(2, 1, "again").code() ==
          Status::kDuplicateName);

    CHECK(txn->insert_dir_edge(2, 3, "c").ok());
    CHECK(txn->commit().ok());

    auto snap = store.snapshot();
    auto entry = snap.lookup_child(2, "c");
    REQUIRE(entry);
    CHECK(entry->id() == 3);
    CHECK(entry->kind() == ENTRY_DIRECTORY);
}

TEST_CASE("Note edges are validated before they are staged") {
    TempDir dir;
    TreeStore store(options_for(dir));
    REQUIRE(store.init().ok());

    auto txn = store.begin();
    REQUIRE(txn->insert_note(1, "one").ok());
    REQUIRE(txn->insert_note(2, "two").ok());
    CHECK(txn->insert_note(1, "again").code() == Status::kInvalidArgument);

    CHECK(txn->insert_note_edge(9, 1, "n").code() == Status::kUnknownParent);
    CHECK(txn->insert_note_edge(kRootDirId, 9, "n").code() ==
          Status::kNotFound);
    REQUIRE(txn->insert_note_edge(kRootDirId, 1, "n").ok());
    CHECK(txn->insert_note_edge(kRootDirId, 2, "n").code() ==
          Status::kDuplicateName);
    CHECK(txn->insert_note_edge(kRootDirId, 1, "m").code() ==
          Status::kDuplicateName);
    REQUIRE(txn->insert_note_edge(kRootDirId, 2, "m").ok());
    REQUIRE(txn->commit().ok());

    auto snap = store.snapshot();
    auto [s, note] = snap.read_note(2);
    REQUIRE(s.ok());
    CHECK(note.content() == "two");
    CHECK(snap.read_note(3).first.IsNotFound());
}

TEST_CASE("Removing an edge that is not there is a no-op") {
    TempDir dir;
    TreeStore store(options_for(dir));
    REQUIRE(store.init().ok());
    add_dir(store, kRootDirId, 1, "a");

    auto txn = store.begin();
    CHECK(txn->remove_dir_edge(42).ok());
    CHECK(txn->remove_note_edge(42).ok());
    CHECK(txn->remove_dir_edge(kRootDirId).ok());
    REQUIRE(txn->remove_dir_edge(1).ok());
    CHECK(txn->remove_dir_edge(1).ok());
    CHECK_FALSE(txn->index().dir(1)->attached);
}

TEST_CASE("erase_dir refuses the root and linked directories") {
    TempDir dir;
    TreeStore store(options_for(dir));
    REQUIRE(store.init().ok());
    add_dir(store, kRootDirId, 1, "a");
    add_dir(store, 1, 2, "b");

    auto txn = store.begin();
    CHECK(txn->erase_dir(kRootDirId).code() == Status::kRootUndeletable);
    CHECK(txn->erase_dir(1).code() == Status::kInvalidArgument);
    CHECK(txn->erase_dir(9).code() == Status::kNotFound);
    REQUIRE(txn->remove_dir_edge(1).ok());
    // Still has a child.
    CHECK(txn->erase_dir(1).code() == Status::kInvalidArgument);
}

TEST_CASE("A transaction dropped without commit leaves nothing behind") {
    TempDir dir;
    TreeStore store(options_for(dir));
    REQUIRE(store.init().ok());
    add_dir(store, kRootDirId, 1, "a");

    {
        auto txn = store.begin();
        REQUIRE(txn->insert_dir(2).ok());
        REQUIRE(txn->insert_dir_edge(1, 2, "b").ok());
        REQUIRE(txn->remove_dir_edge(1).ok());
        REQUIRE(txn->insert_dir_edge(2, 1, "a").ok());
    }

    auto snap = store.snapshot();
    CHECK_FALSE(snap.has_dir(2));
    REQUIRE(snap.has_dir(1));
    CHECK(snap.index().dir(1)->parent == kRootDirId);
    CHECK(snap.index().dir(1)->name == "a");
    CHECK(snap.index().dir(1)->subdirs.empty());
    CHECK(snap.index().dir_count() == 2);
}

TEST_CASE("Explicit rollback restores erased rows and edges") {
    TempDir dir;
    TreeStore store(options_for(dir));
    REQUIRE(store.init().ok());
    add_dir(store, kRootDirId, 1, "a");
    {
        auto txn = store.begin();
        REQUIRE(txn->insert_note(1, "body").ok());
        REQUIRE(txn->insert_note_edge(1, 1, "readme").ok());
        REQUIRE(txn->commit().ok());
    }

    auto txn = store.begin();
    REQUIRE(txn->remove_note_edge(1).ok());
    REQUIRE(txn->erase_note(1).ok());
    REQUIRE(txn->remove_dir_edge(1).ok());
    REQUIRE(txn->erase_dir(1).ok());
    CHECK_FALSE(txn->has_dir(1));
    txn->rollback();
    CHECK(txn->commit().code() == Status::kInvalidArgument);
    txn.reset();

    auto snap = store.snapshot();
    auto entry = snap.lookup_child(1, "readme");
    REQUIRE(entry);
    CHECK(entry->kind() == ENTRY_NOTE);
    CHECK(snap.lookup_child(kRootDirId, "a"));
    CHECK(snap.read_note(1).second.content() == "body");
}

TEST_CASE("lookup_child prefers the directory when names collide") {
    TempDir dir;
    TreeStore store(options_for(dir));
    REQUIRE(store.init().ok());
    add_dir(store, kRootDirId, 1, "shared");
    {
        auto txn = store.begin();
        REQUIRE(txn->insert_note(1, "").ok());
        REQUIRE(txn->insert_note_edge(kRootDirId, 1, "shared").ok());
        REQUIRE(txn->commit().ok());
    }

    auto snap = store.snapshot();
    auto any = snap.lookup_child(kRootDirId, "shared");
    REQUIRE(any);
    CHECK(any->kind() == ENTRY_DIRECTORY);
    auto note = snap.lookup_child(kRootDirId, "shared", ENTRY_NOTE);
    REQUIRE(note);
    CHECK(note->id() == 1);
    CHECK_FALSE(snap.lookup_child(kRootDirId, "other"));
    CHECK_FALSE(snap.lookup_child(99, "shared"));
}

TEST_CASE("list_children orders each kind by name") {
    TempDir dir;
    TreeStore store(options_for(dir));
    REQUIRE(store.init().ok());
    add_dir(store, kRootDirId, 1, "zeta");
    add_dir(store, kRootDirId, 2, "alpha");
    {
        auto txn = store.begin();
        REQUIRE(txn->insert_note(1, "").ok());
        REQUIRE(txn->insert_note_edge(kRootDirId, 1, "m").ok());
        REQUIRE(txn->insert_note(2, "").ok());
        REQUIRE(txn->insert_note_edge(kRootDirId, 2, "b").ok());
        REQUIRE(txn->commit().ok());
    }

    auto [s, listing] = store.snapshot().list_children(kRootDirId);
    REQUIRE(s.ok());
    REQUIRE(listing.dirs_size() == 2);
    CHECK(listing.dirs(0).name() == "alpha");
    CHECK(listing.dirs(1).name() == "zeta");
    REQUIRE(listing.notes_size() == 2);
    CHECK(listing.notes(0).name() == "b");
    CHECK(listing.notes(1).name() == "m");

    CHECK(store.snapshot().list_children(5).first.IsNotFound());
}

TEST_CASE("The tree survives a restart") {
    TempDir dir;
    {
        TreeStore store(options_for(dir));
        REQUIRE(store.init().ok());
        add_dir(store, kRootDirId, 1, "a");
        add_dir(store, 1, 2, "b");
        auto txn = store.begin();
        REQUIRE(txn->insert_note(4, "four").ok());
        REQUIRE(txn->insert_note_edge(2, 4, "n").ok());
        REQUIRE(txn->commit().ok());
    }

    TreeStore store(options_for(dir));
    REQUIRE(store.init().ok());
    CHECK(store.next_dir_id() == 3);
    CHECK(store.next_note_id() == 5);

    auto snap = store.snapshot();
    CHECK(snap.index().dir_count() == 3);
    CHECK(snap.index().dir(2)->parent == 1);
    CHECK(snap.index().note(4)->name == "n");
    CHECK(snap.read_note(4).second.content() == "four");

    AncestryOracle oracle(snap.index());
    CHECK(oracle.is_ancestor(1, 2));
}

TEST_CASE("A commit the database refuses is rolled back") {
    TempDir dir;
    {
        TreeStore store(options_for(dir));
        REQUIRE(store.init().ok());
        add_dir(store, kRootDirId, 1, "a");
    }

    TreeStore store(options_for(dir, true));
    REQUIRE(store.init().ok());

    auto txn = store.begin();
    REQUIRE(txn->insert_dir(2).ok());
    REQUIRE(txn->insert_dir_edge(1, 2, "b").ok());
    Status s = txn->commit();
    CHECK(s.IsStorageFailure());
    txn.reset();

    auto snap = store.snapshot();
    CHECK_FALSE(snap.has_dir(2));
    CHECK(snap.index().dir(1)->subdirs.empty());
    CHECK(store.next_dir_id() == 2);
}

TEST_CASE("A read-only store cannot be created from nothing") {
    TempDir dir;
    TreeStore store(options_for(dir, true));
    CHECK_FALSE(store.init().ok());
}

TEST_CASE("Permission records persist beside the tree") {
    TempDir dir;
    {
        TreeStore store(options_for(dir));
        REQUIRE(store.init().ok());
        PermissionRecord record;
        record.set_principal("alice");
        record.set_can_edit(true);
        REQUIRE(store.put_permission(record).ok());
        record.set_principal("bob");
        REQUIRE(store.put_permission(record).ok());
        REQUIRE(store.delete_permission("bob").ok());
    }

    TreeStore store(options_for(dir));
    REQUIRE(store.init().ok());
    auto [s, records] = store.load_permissions();
    REQUIRE(s.ok());
    REQUIRE(records.size() == 1);
    CHECK(records[0].principal() == "alice");
    CHECK(records[0].can_edit());
    CHECK_FALSE(records[0].can_receive_feedback());
}

TEST_CASE("Rows beyond the identifier counter are reported as corruption") {
    TempDir dir;
    {
        TreeStore store(options_for(dir));
        REQUIRE(store.init().ok());
        add_dir(store, kRootDirId, 1, "a");
    }

    const uint64_t max_id = std::numeric_limits<uint64_t>::max();
    SECTION("directory at the top of the id space") {
        put_raw(dir.path(), "dirs", std::to_string(max_id), dir_row(max_id));
    }
    SECTION("directory far past the counter") {
        const uint64_t far = 1000000000000ULL;
        put_raw(dir.path(), "dirs", std::to_string(far), dir_row(far));
    }
    SECTION("directory just past the counter") {
        put_raw(dir.path(), "dirs", "2", dir_row(2));
    }
    SECTION("note at the top of the id space") {
        put_raw(dir.path(), "notes", std::to_string(max_id),
                note_row(max_id));
    }

    TreeStore store(options_for(dir));
    Status s = store.init();
    CHECK(s.code() == Status::kCorruption);
}

TEST_CASE("Inserts with ids far past the counter are refused") {
    TempDir dir;
    TreeStore store(options_for(dir));
    REQUIRE(store.init().ok());

    const uint64_t max_id = std::numeric_limits<uint64_t>::max();
    auto txn = store.begin();
    CHECK(txn->insert_dir(max_id).code() == Status::kInvalidArgument);
    CHECK(txn->insert_dir(1000000000000ULL).code() ==
          Status::kInvalidArgument);
    CHECK(txn->insert_note(max_id, "").code() == Status::kInvalidArgument);
    CHECK_FALSE(txn->has_dir(max_id));
    CHECK(txn->index().dir_id_bound() == 1);

    // A few burned ids ahead of the counter are fine.
    CHECK(txn->insert_dir(5).ok());
    CHECK(txn->insert_note(3, "").ok());
}
