#include "tree_store.h"
#include "ancestry.h"
#include "util.h"

#include <butil/logging.h>
#include <cstdint>
#include <set>
#include <stdexcept>
#include <string>

namespace {

const char kCounterKey[] = "_counter";

// Ids index a dense arena, so a new id may run ahead of the persisted
// high-water mark only by the ids burned since startup.
const uint64_t kMaxIdGap = uint64_t(1) << 20;

const char kNotesCf[] = "notes";
const char kDirsCf[] = "dirs";
const char kNoteEdgesCf[] = "note_edges";
const char kDirEdgesCf[] = "dir_edges";
const char kPermissionsCf[] = "permissions";

std::string id_key(uint64_t id) { return std::to_string(id); }

bool parse_id_key(const rocksdb::Slice &key, uint64_t *id) {
    const std::string s = key.ToString();
    if (s.empty() || s.find_first_not_of("0123456789") != std::string::npos)
        return false;
    try {
        *id = std::stoull(s);
    } catch (const std::out_of_range &) {
        return false;
    }
    return true;
}

Status storage_error(const std::string &what, const rocksdb::Status &s) {
    return Status::StorageFailure(what + ": " + s.ToString());
}

Entry make_entry(EntryKind kind, uint64_t id, const std::string &name) {
    Entry e;
    e.set_kind(kind);
    e.set_id(id);
    e.set_name(name);
    return e;
}

} // namespace

TreeStore::~TreeStore() {
    if (db_ == nullptr)
        return;
    for (auto *handle : handles_) {
        db_->DestroyColumnFamilyHandle(handle);
    }
    handles_.clear();
    delete db_;
    db_ = nullptr;
}

Status TreeStore::init() {
    Status s = open_db();
    if (!s.ok())
        return s;

    // 1) Identifier high-water marks.
    s = init_counter(cf_dirs_, &next_dir_id_);
    if (!s.ok())
        return s;
    s = init_counter(cf_notes_, &next_note_id_);
    if (!s.ok())
        return s;

    // 2) Ensure root directory = 0 exists.
    s = ensure_root();
    if (!s.ok())
        return s;

    // 3) Mirror rows and edges in memory and check the tree shape.
    s = load_rows();
    if (!s.ok())
        return s;
    s = load_edges(cf_dir_edges_, false);
    if (!s.ok())
        return s;
    s = load_edges(cf_note_edges_, true);
    if (!s.ok())
        return s;
    s = verify();
    if (!s.ok())
        return s;

    LOG(INFO) << "Tree store loaded: " << index_.dir_count()
              << " directories, " << index_.note_count()
              << " notes, next ids dir=" << next_dir_id_
              << " note=" << next_note_id_;
    return Status::OK();
}

Status TreeStore::open_db() {
    // Set up options.
    rocksdb::Options options;
    options.create_if_missing = !options_.read_only;
    options.create_missing_column_families = !options_.read_only;

    rocksdb::ColumnFamilyOptions cf_options;
    cf_options.comparator = rocksdb::BytewiseComparator();

    // Define the column families.
    const std::vector<std::string> names = {
        rocksdb::kDefaultColumnFamilyName, kNotesCf, kDirsCf,
        kNoteEdgesCf, kDirEdgesCf, kPermissionsCf};
    std::vector<rocksdb::ColumnFamilyDescriptor> column_families;
    column_families.push_back(rocksdb::ColumnFamilyDescriptor(
        rocksdb::kDefaultColumnFamilyName, rocksdb::ColumnFamilyOptions()));
    for (size_t i = 1; i < names.size(); ++i) {
        column_families.push_back(
            rocksdb::ColumnFamilyDescriptor(names[i], cf_options));
    }

    // Open (or create) the DB.
    rocksdb::Status status;
    if (options_.read_only) {
        status = rocksdb::DB::OpenForReadOnly(options, options_.db_path,
                                              column_families, &handles_,
                                              &db_);
    } else {
        status = rocksdb::DB::Open(options, options_.db_path, column_families,
                                   &handles_, &db_);
    }
    if (!status.ok() || db_ == nullptr) {
        LOG(ERROR) << "Failed to open RocksDB at " << options_.db_path << ": "
                   << status.ToString();
        return storage_error("Failed to open RocksDB", status);
    }
    LOG(INFO) << "RocksDB opened at " << options_.db_path
              << (options_.read_only ? " (read-only)" : "");

    // Map the handles to the corresponding member variables.
    cf_notes_ = handles_[1];
    cf_dirs_ = handles_[2];
    cf_note_edges_ = handles_[3];
    cf_dir_edges_ = handles_[4];
    cf_permissions_ = handles_[5];

    // Verify on-disk column families exactly match what we expect.
    std::vector<std::string> existing_cfs;
    rocksdb::Status st = rocksdb::DB::ListColumnFamilies(
        rocksdb::DBOptions(), options_.db_path, &existing_cfs);
    if (!st.ok()) {
        LOG(ERROR) << "Cannot list column families: " << st.ToString();
        return storage_error("ListColumnFamilies failed", st);
    }
    std::set<std::string> seen(existing_cfs.begin(), existing_cfs.end());
    std::set<std::string> want(names.begin(), names.end());
    if (seen != want) {
        std::string on_disk;
        for (const auto &n : existing_cfs)
            on_disk += " " + n;
        LOG(ERROR) << "Column family mismatch, on disk:" << on_disk;
        return Status::Corruption(
            "Column family set on disk does not match schema");
    }
    return Status::OK();
}

Status TreeStore::init_counter(rocksdb::ColumnFamilyHandle *cf,
                               uint64_t *next) {
    std::string value;
    rocksdb::Status st = db_->Get(rocksdb::ReadOptions(), cf, kCounterKey,
                                  &value);
    if (st.IsNotFound()) {
        if (options_.read_only) {
            return Status::Corruption("Missing identifier counter in " +
                                      cf->GetName());
        }
        st = db_->Put(write_options(), cf, kCounterKey, "1");
        if (!st.ok()) {
            LOG(ERROR) << "Failed to create counter in " << cf->GetName()
                       << ": " << st.ToString();
            return storage_error("Failed to create counter", st);
        }
        *next = 1;
        LOG(INFO) << "Counter for " << cf->GetName() << " initialized to 1";
        return Status::OK();
    }
    if (!st.ok()) {
        return storage_error("Failed to get counter", st);
    }
    if (!parse_id_key(value, next)) {
        return Status::Corruption("Malformed counter in " + cf->GetName() +
                                  ": " + value);
    }
    return Status::OK();
}

Status TreeStore::ensure_root() {
    std::string value;
    rocksdb::Status st =
        db_->Get(rocksdb::ReadOptions(), cf_dirs_, id_key(kRootDirId), &value);
    if (st.ok()) {
        return Status::OK();
    }
    if (!st.IsNotFound()) {
        return storage_error("Failed to get root directory", st);
    }
    if (options_.read_only) {
        return Status::Corruption("Root directory is missing");
    }

    DirRow row;
    row.set_id(kRootDirId);
    std::string encoded;
    if (!row.SerializeToString(&encoded)) {
        throw std::runtime_error("Failed to serialize DirRow");
    }
    st = db_->Put(write_options(), cf_dirs_, id_key(kRootDirId), encoded);
    if (!st.ok()) {
        LOG(ERROR) << "Failed to create root directory: " << st.ToString();
        return storage_error("Failed to create root directory", st);
    }
    LOG(INFO) << "Root directory created with id=" << kRootDirId;
    return Status::OK();
}

Status TreeStore::load_rows() {
    std::unique_ptr<rocksdb::Iterator> it(
        db_->NewIterator(rocksdb::ReadOptions(), cf_dirs_));
    for (it->SeekToFirst(); it->Valid(); it->Next()) {
        if (it->key() == kCounterKey)
            continue;
        uint64_t id = 0;
        DirRow row;
        if (!parse_id_key(it->key(), &id) ||
            !row.ParseFromString(it->value().ToString()) || row.id() != id) {
            return Status::Corruption("Malformed directory row " +
                                      it->key().ToString());
        }
        if (id >= next_dir_id_) {
            return Status::Corruption("Directory row " + it->key().ToString() +
                                      " is beyond the identifier counter " +
                                      std::to_string(next_dir_id_));
        }
        index_.add_dir(id);
    }
    if (!it->status().ok())
        return storage_error("Scanning directories failed", it->status());

    it.reset(db_->NewIterator(rocksdb::ReadOptions(), cf_notes_));
    for (it->SeekToFirst(); it->Valid(); it->Next()) {
        if (it->key() == kCounterKey)
            continue;
        uint64_t id = 0;
        NoteRow row;
        if (!parse_id_key(it->key(), &id) ||
            !row.ParseFromString(it->value().ToString()) || row.id() != id) {
            return Status::Corruption("Malformed note row " +
                                      it->key().ToString());
        }
        if (id >= next_note_id_) {
            return Status::Corruption("Note row " + it->key().ToString() +
                                      " is beyond the identifier counter " +
                                      std::to_string(next_note_id_));
        }
        index_.add_note(id);
    }
    if (!it->status().ok())
        return storage_error("Scanning notes failed", it->status());
    return Status::OK();
}

Status TreeStore::load_edges(rocksdb::ColumnFamilyHandle *cf, bool notes) {
    std::unique_ptr<rocksdb::Iterator> it(
        db_->NewIterator(rocksdb::ReadOptions(), cf));
    for (it->SeekToFirst(); it->Valid(); it->Next()) {
        uint64_t child = 0;
        Edge edge;
        if (!parse_id_key(it->key(), &child) ||
            !edge.ParseFromString(it->value().ToString()) ||
            edge.child_id() != child) {
            return Status::Corruption("Malformed edge in " + cf->GetName() +
                                      ": " + it->key().ToString());
        }
        const DirRecord *parent = index_.dir(edge.parent_id());
        if (parent == nullptr) {
            return Status::Corruption("Edge " + it->key().ToString() +
                                      " in " + cf->GetName() +
                                      " points at missing directory " +
                                      std::to_string(edge.parent_id()));
        }
        if (!is_valid_name(edge.child_name())) {
            return Status::Corruption("Edge " + it->key().ToString() +
                                      " has an invalid name");
        }
        if (notes) {
            if (!index_.has_note(child) ||
                parent->notes.count(edge.child_name()) != 0) {
                return Status::Corruption("Inconsistent note edge " +
                                          it->key().ToString());
            }
            index_.link_note(edge.parent_id(), child, edge.child_name());
        } else {
            if (child == kRootDirId || !index_.has_dir(child) ||
                parent->subdirs.count(edge.child_name()) != 0) {
                return Status::Corruption("Inconsistent directory edge " +
                                          it->key().ToString());
            }
            index_.link_dir(edge.parent_id(), child, edge.child_name());
        }
    }
    if (!it->status().ok())
        return storage_error("Scanning " + cf->GetName() + " failed",
                             it->status());
    return Status::OK();
}

Status TreeStore::verify() {
    AncestryOracle oracle(index_);
    for (uint64_t id = 0; id < index_.dir_id_bound(); ++id) {
        if (index_.has_dir(id) && !oracle.rooted(id)) {
            LOG(ERROR) << "Directory " << id
                       << " is detached from the root or on a cycle";
            return Status::Corruption("Directory " + std::to_string(id) +
                                      " is not reachable from the root");
        }
    }
    for (uint64_t id = 0; id < index_.note_id_bound(); ++id) {
        const NoteRecord *rec = index_.note(id);
        if (rec != nullptr && !rec->attached) {
            LOG(ERROR) << "Note " << id << " has no parent";
            return Status::Corruption("Note " + std::to_string(id) +
                                      " has no parent");
        }
    }
    return Status::OK();
}

rocksdb::WriteOptions TreeStore::write_options() const {
    rocksdb::WriteOptions wo;
    wo.sync = options_.sync_writes;
    return wo;
}

std::unique_ptr<TreeStore::Transaction> TreeStore::begin() {
    return std::unique_ptr<Transaction>(new Transaction(this));
}

// --------------- reader ---------------

std::optional<Entry>
TreeStore::Reader::lookup_child(uint64_t parent,
                                const std::string &name) const {
    auto entry = lookup_child(parent, name, ENTRY_DIRECTORY);
    if (entry)
        return entry;
    return lookup_child(parent, name, ENTRY_NOTE);
}

std::optional<Entry> TreeStore::Reader::lookup_child(uint64_t parent,
                                                     const std::string &name,
                                                     EntryKind kind) const {
    const DirRecord *rec = index().dir(parent);
    if (rec == nullptr)
        return std::nullopt;
    const auto &children = kind == ENTRY_DIRECTORY ? rec->subdirs : rec->notes;
    auto it = children.find(name);
    if (it == children.end())
        return std::nullopt;
    return make_entry(kind, it->second, name);
}

std::pair<Status, Listing>
TreeStore::Reader::list_children(uint64_t parent) const {
    Listing listing;
    const DirRecord *rec = index().dir(parent);
    if (rec == nullptr) {
        return {Status::NotFound("No directory with id " +
                                 std::to_string(parent)),
                listing};
    }
    for (const auto &[name, id] : rec->subdirs)
        *listing.add_dirs() = make_entry(ENTRY_DIRECTORY, id, name);
    for (const auto &[name, id] : rec->notes)
        *listing.add_notes() = make_entry(ENTRY_NOTE, id, name);
    return {Status::OK(), listing};
}

std::pair<Status, Note> TreeStore::Reader::read_note(uint64_t id) const {
    Note note;
    if (!has_note(id)) {
        return {Status::NotFound("No note with id " + std::to_string(id)),
                note};
    }
    std::string value;
    rocksdb::Status st = store_->db_->Get(rocksdb::ReadOptions(),
                                          store_->cf_notes_, id_key(id), &value);
    if (!st.ok()) {
        return {storage_error("read_note failed", st), note};
    }
    NoteRow row;
    if (!row.ParseFromString(value)) {
        return {Status::Corruption("Failed to deserialize note " +
                                   std::to_string(id)),
                note};
    }
    note.set_id(row.id());
    note.set_content(row.content());
    return {Status::OK(), note};
}

// --------------- transaction ---------------

TreeStore::Transaction::Transaction(TreeStore *store)
    : Reader(store), mutable_store_(store), lock_(store->mu_),
      next_dir_id_(store->next_dir_id_), next_note_id_(store->next_note_id_) {
}

TreeStore::Transaction::~Transaction() {
    if (!done_)
        rollback();
}

Status TreeStore::Transaction::put_row(rocksdb::ColumnFamilyHandle *cf,
                                       uint64_t id,
                                       const google::protobuf::Message &row) {
    std::string value;
    if (!row.SerializeToString(&value)) {
        throw std::runtime_error("Failed to serialize " +
                                 row.GetTypeName());
    }
    rocksdb::Status st = batch_.Put(cf, id_key(id), value);
    if (!st.ok())
        return storage_error("Staging write failed", st);
    return Status::OK();
}

Status TreeStore::Transaction::insert_dir(uint64_t id) {
    if (has_dir(id)) {
        return Status::InvalidArgument("Directory " + std::to_string(id) +
                                       " already exists");
    }
    if (id >= next_dir_id_ && id - next_dir_id_ >= kMaxIdGap) {
        return Status::InvalidArgument("Directory id " + std::to_string(id) +
                                       " is out of range");
    }
    DirRow row;
    row.set_id(id);
    Status s = put_row(mutable_store_->cf_dirs_, id, row);
    if (!s.ok())
        return s;
    if (id >= next_dir_id_) {
        next_dir_id_ = id + 1;
        rocksdb::Status st = batch_.Put(mutable_store_->cf_dirs_, kCounterKey,
                                        std::to_string(next_dir_id_));
        if (!st.ok())
            return storage_error("Staging counter failed", st);
    }
    mutable_store_->index_.add_dir(id);
    undo_.push_back([id](TreeIndex &index) { index.drop_dir(id); });
    return Status::OK();
}

Status TreeStore::Transaction::insert_note(uint64_t id,
                                           const std::string &content) {
    if (has_note(id)) {
        return Status::InvalidArgument("Note " + std::to_string(id) +
                                       " already exists");
    }
    if (id >= next_note_id_ && id - next_note_id_ >= kMaxIdGap) {
        return Status::InvalidArgument("Note id " + std::to_string(id) +
                                       " is out of range");
    }
    NoteRow row;
    row.set_id(id);
    row.set_content(content);
    Status s = put_row(mutable_store_->cf_notes_, id, row);
    if (!s.ok())
        return s;
    if (id >= next_note_id_) {
        next_note_id_ = id + 1;
        rocksdb::Status st = batch_.Put(mutable_store_->cf_notes_, kCounterKey,
                                        std::to_string(next_note_id_));
        if (!st.ok())
            return storage_error("Staging counter failed", st);
    }
    mutable_store_->index_.add_note(id);
    undo_.push_back([id](TreeIndex &index) { index.drop_note(id); });
    return Status::OK();
}

Status TreeStore::Transaction::update_note(uint64_t id,
                                           const std::string &content) {
    if (!has_note(id)) {
        return Status::NotFound("No note with id " + std::to_string(id));
    }
    NoteRow row;
    row.set_id(id);
    row.set_content(content);
    return put_row(mutable_store_->cf_notes_, id, row);
}

Status TreeStore::Transaction::erase_dir(uint64_t id) {
    const DirRecord *rec = index().dir(id);
    if (rec == nullptr) {
        return Status::NotFound("No directory with id " + std::to_string(id));
    }
    if (id == kRootDirId) {
        return Status::RootUndeletable("The root directory cannot be erased");
    }
    if (rec->attached || !rec->subdirs.empty() || !rec->notes.empty()) {
        return Status::InvalidArgument("Directory " + std::to_string(id) +
                                       " is still linked");
    }
    rocksdb::Status st = batch_.Delete(mutable_store_->cf_dirs_, id_key(id));
    if (!st.ok())
        return storage_error("Staging delete failed", st);
    DirRecord saved = *rec;
    mutable_store_->index_.drop_dir(id);
    undo_.push_back(
        [id, saved](TreeIndex &index) { index.restore_dir(id, saved); });
    return Status::OK();
}

Status TreeStore::Transaction::erase_note(uint64_t id) {
    const NoteRecord *rec = index().note(id);
    if (rec == nullptr) {
        return Status::NotFound("No note with id " + std::to_string(id));
    }
    if (rec->attached) {
        return Status::InvalidArgument("Note " + std::to_string(id) +
                                       " is still linked");
    }
    rocksdb::Status st = batch_.Delete(mutable_store_->cf_notes_, id_key(id));
    if (!st.ok())
        return storage_error("Staging delete failed", st);
    NoteRecord saved = *rec;
    mutable_store_->index_.drop_note(id);
    undo_.push_back(
        [id, saved](TreeIndex &index) { index.restore_note(id, saved); });
    return Status::OK();
}

Status TreeStore::Transaction::insert_note_edge(uint64_t parent,
                                                uint64_t child,
                                                const std::string &name) {
    if (!is_valid_name(name)) {
        return Status::InvalidArgument("Invalid name '" + name + "'");
    }
    const DirRecord *p = index().dir(parent);
    if (p == nullptr) {
        return Status::UnknownParent("No directory with id " +
                                     std::to_string(parent));
    }
    const NoteRecord *c = index().note(child);
    if (c == nullptr) {
        return Status::NotFound("No note with id " + std::to_string(child));
    }
    if (c->attached) {
        return Status::DuplicateName("Note " + std::to_string(child) +
                                     " already has a parent");
    }
    if (p->notes.count(name) != 0) {
        return Status::DuplicateName("A note named '" + name +
                                     "' already exists");
    }

    Edge edge;
    edge.set_parent_id(parent);
    edge.set_child_id(child);
    edge.set_child_name(name);
    Status s = put_row(mutable_store_->cf_note_edges_, child, edge);
    if (!s.ok())
        return s;
    mutable_store_->index_.link_note(parent, child, name);
    undo_.push_back([child](TreeIndex &index) { index.unlink_note(child); });
    return Status::OK();
}

Status TreeStore::Transaction::insert_dir_edge(uint64_t parent, uint64_t child,
                                               const std::string &name) {
    if (!is_valid_name(name)) {
        return Status::InvalidArgument("Invalid name '" + name + "'");
    }
    if (parent == child) {
        return Status::SelfParent("Directory " + std::to_string(child) +
                                  " cannot be its own parent");
    }
    const DirRecord *p = index().dir(parent);
    if (p == nullptr) {
        return Status::UnknownParent("No directory with id " +
                                     std::to_string(parent));
    }
    const DirRecord *c = index().dir(child);
    if (c == nullptr) {
        return Status::NotFound("No directory with id " +
                                std::to_string(child));
    }
    if (child == kRootDirId) {
        return Status::RootImmovable("The root directory cannot have a parent");
    }
    if (c->attached) {
        return Status::DuplicateName("Directory " + std::to_string(child) +
                                     " already has a parent");
    }
    if (p->subdirs.count(name) != 0) {
        return Status::DuplicateName("A directory named '" + name +
                                     "' already exists");
    }

    Edge edge;
    edge.set_parent_id(parent);
    edge.set_child_id(child);
    edge.set_child_name(name);
    Status s = put_row(mutable_store_->cf_dir_edges_, child, edge);
    if (!s.ok())
        return s;
    mutable_store_->index_.link_dir(parent, child, name);
    undo_.push_back([child](TreeIndex &index) { index.unlink_dir(child); });
    return Status::OK();
}

Status TreeStore::Transaction::remove_note_edge(uint64_t child) {
    const NoteRecord *rec = index().note(child);
    if (rec == nullptr || !rec->attached)
        return Status::OK();
    uint64_t parent = rec->parent;
    std::string name = rec->name;
    rocksdb::Status st = batch_.Delete(mutable_store_->cf_note_edges_, id_key(child));
    if (!st.ok())
        return storage_error("Staging delete failed", st);
    mutable_store_->index_.unlink_note(child);
    undo_.push_back([parent, child, name](TreeIndex &index) {
        index.link_note(parent, child, name);
    });
    return Status::OK();
}

Status TreeStore::Transaction::remove_dir_edge(uint64_t child) {
    const DirRecord *rec = index().dir(child);
    if (rec == nullptr || !rec->attached)
        return Status::OK();
    uint64_t parent = rec->parent;
    std::string name = rec->name;
    rocksdb::Status st = batch_.Delete(mutable_store_->cf_dir_edges_, id_key(child));
    if (!st.ok())
        return storage_error("Staging delete failed", st);
    mutable_store_->index_.unlink_dir(child);
    undo_.push_back([parent, child, name](TreeIndex &index) {
        index.link_dir(parent, child, name);
    });
    return Status::OK();
}

Status TreeStore::Transaction::commit() {
    if (done_) {
        return Status::InvalidArgument("Transaction already finished");
    }
    if (batch_.Count() > 0) {
        rocksdb::Status st = mutable_store_->db_->Write(
            mutable_store_->write_options(), &batch_);
        if (!st.ok()) {
            LOG(ERROR) << "Commit of " << batch_.Count()
                       << " staged writes failed, rolling back: "
                       << st.ToString();
            rollback();
            return storage_error("Commit failed", st);
        }
    }
    mutable_store_->next_dir_id_ = next_dir_id_;
    mutable_store_->next_note_id_ = next_note_id_;
    undo_.clear();
    done_ = true;
    return Status::OK();
}

void TreeStore::Transaction::rollback() {
    if (done_)
        return;
    for (auto it = undo_.rbegin(); it != undo_.rend(); ++it) {
        (*it)(mutable_store_->index_);
    }
    if (!undo_.empty()) {
        LOG(WARNING) << "Rolled back " << undo_.size() << " staged changes";
    }
    undo_.clear();
    batch_.Clear();
    done_ = true;
}

// --------------- permissions ---------------

std::pair<Status, std::vector<PermissionRecord>>
TreeStore::load_permissions() const {
    std::vector<PermissionRecord> records;
    std::unique_ptr<rocksdb::Iterator> it(
        db_->NewIterator(rocksdb::ReadOptions(), cf_permissions_));
    for (it->SeekToFirst(); it->Valid(); it->Next()) {
        PermissionRecord record;
        if (!record.ParseFromString(it->value().ToString()) ||
            record.principal() != it->key().ToString()) {
            return {Status::Corruption("Malformed permission record " +
                                       it->key().ToString()),
                    {}};
        }
        records.push_back(std::move(record));
    }
    if (!it->status().ok())
        return {storage_error("Scanning permissions failed", it->status()),
                {}};
    return {Status::OK(), std::move(records)};
}

Status TreeStore::put_permission(const PermissionRecord &record) {
    std::string value;
    if (!record.SerializeToString(&value)) {
        throw std::runtime_error("Failed to serialize PermissionRecord");
    }
    rocksdb::Status st =
        db_->Put(write_options(), cf_permissions_, record.principal(), value);
    if (!st.ok())
        return storage_error("put_permission failed", st);
    return Status::OK();
}

Status TreeStore::delete_permission(const std::string &principal) {
    rocksdb::Status st =
        db_->Delete(write_options(), cf_permissions_, principal);
    if (!st.ok())
        return storage_error("delete_permission failed", st);
    return Status::OK();
}
