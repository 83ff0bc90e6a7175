#pragma once

#include "kbstore.pb.h"
#include "status.h"
#include "tree_index.h"

#include "rocksdb/db.h"
#include "rocksdb/write_batch.h"
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

struct StoreOptions {
    std::string db_path;
    bool read_only = false;  // open the database without write access
    bool sync_writes = true; // fsync every committed batch
};

// Persistent namespace of directories and notes. RocksDB holds the rows and
// edges (one column family per table); a TreeIndex mirrors the edges in
// memory for validation and traversal. All access goes through a Snapshot
// (shared lock) or a Transaction (exclusive lock).
class TreeStore {
  public:
    explicit TreeStore(const StoreOptions &options) : options_(options) {}
    ~TreeStore();

    TreeStore(const TreeStore &) = delete;
    TreeStore &operator=(const TreeStore &) = delete;

    Status init();

    // First identifiers not yet used, for seeding the allocators.
    uint64_t next_dir_id() const { return next_dir_id_; }
    uint64_t next_note_id() const { return next_note_id_; }

    // Const queries shared by snapshots and transactions.
    class Reader {
      public:
        const TreeIndex &index() const { return store_->index_; }

        bool has_dir(uint64_t id) const { return index().has_dir(id); }
        bool has_note(uint64_t id) const { return index().has_note(id); }

        // Directory namespace first, then the note namespace.
        std::optional<Entry> lookup_child(uint64_t parent,
                                          const std::string &name) const;
        std::optional<Entry> lookup_child(uint64_t parent,
                                          const std::string &name,
                                          EntryKind kind) const;

        // Directory children and note children, each ordered by name.
        std::pair<Status, Listing> list_children(uint64_t parent) const;

        std::pair<Status, Note> read_note(uint64_t id) const;

      protected:
        explicit Reader(const TreeStore *store) : store_(store) {}
        const TreeStore *store_;
    };

    class Snapshot : public Reader {
      private:
        friend class TreeStore;
        explicit Snapshot(const TreeStore *store)
            : Reader(store), lock_(store->mu_) {}

        std::shared_lock<std::shared_mutex> lock_;
    };

    // Stages changes in the index and in a single write batch. Nothing is
    // persisted until commit(); a transaction that is destroyed without a
    // successful commit puts the index back the way it found it.
    class Transaction : public Reader {
      public:
        ~Transaction();

        Transaction(const Transaction &) = delete;
        Transaction &operator=(const Transaction &) = delete;

        Status insert_dir(uint64_t id);
        Status insert_note(uint64_t id, const std::string &content);
        Status update_note(uint64_t id, const std::string &content);

        // The entity must already be detached and, for a directory,
        // childless.
        Status erase_dir(uint64_t id);
        Status erase_note(uint64_t id);

        Status insert_note_edge(uint64_t parent, uint64_t child,
                                const std::string &name);
        Status insert_dir_edge(uint64_t parent, uint64_t child,
                               const std::string &name);

        // Idempotent; children of a detached directory are left alone.
        Status remove_note_edge(uint64_t child);
        Status remove_dir_edge(uint64_t child);

        Status commit();
        void rollback();

      private:
        friend class TreeStore;
        explicit Transaction(TreeStore *store);

        Status put_row(rocksdb::ColumnFamilyHandle *cf, uint64_t id,
                       const google::protobuf::Message &row);

        TreeStore *mutable_store_;
        std::unique_lock<std::shared_mutex> lock_;
        rocksdb::WriteBatch batch_;
        std::vector<std::function<void(TreeIndex &)>> undo_;
        uint64_t next_dir_id_;
        uint64_t next_note_id_;
        bool done_ = false;
    };

    Snapshot snapshot() const { return Snapshot(this); }
    std::unique_ptr<Transaction> begin();

    // Permission records live beside the tree but outside its lock.
    std::pair<Status, std::vector<PermissionRecord>> load_permissions() const;
    Status put_permission(const PermissionRecord &record);
    Status delete_permission(const std::string &principal);

  private:
    Status open_db();
    Status init_counter(rocksdb::ColumnFamilyHandle *cf, uint64_t *next);
    Status ensure_root();
    Status load_rows();
    Status load_edges(rocksdb::ColumnFamilyHandle *cf, bool notes);
    Status verify();

    rocksdb::WriteOptions write_options() const;

    StoreOptions options_;
    rocksdb::DB *db_ = nullptr;
    std::vector<rocksdb::ColumnFamilyHandle *> handles_;
    rocksdb::ColumnFamilyHandle *cf_notes_ = nullptr;
    rocksdb::ColumnFamilyHandle *cf_dirs_ = nullptr;
    rocksdb::ColumnFamilyHandle *cf_note_edges_ = nullptr;
    rocksdb::ColumnFamilyHandle *cf_dir_edges_ = nullptr;
    rocksdb::ColumnFamilyHandle *cf_permissions_ = nullptr;

    mutable std::shared_mutex mu_;
    TreeIndex index_;
    uint64_t next_dir_id_ = 1;
    uint64_t next_note_id_ = 1;
};
