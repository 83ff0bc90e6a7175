#include "server.h"

#include <brpc/closure_guard.h>
#include <butil/logging.h>

void to_result(const Status &s, Result *result) {
    result->set_code(static_cast<int32_t>(s.code()));
    result->set_message(s.ok() ? "" : s.ToString());
}

// --------------- mutations ---------------

void KbServiceImpl::create_directory(google::protobuf::RpcController *cntl,
                                     const CreateDirectoryRequest *request,
                                     CreateResponse *response,
                                     google::protobuf::Closure *done) {
    brpc::ClosureGuard done_guard(done);
    (void)cntl;
    VLOG(1) << "[create_directory] parent: " << request->parent_id()
            << ", name: " << request->name();
    auto [s, id] = engine_->create_directory(
        request->principal(), request->parent_id(), request->name());
    to_result(s, response->mutable_result());
    response->set_id(id);
}

void KbServiceImpl::create_note(google::protobuf::RpcController *cntl,
                                const CreateNoteRequest *request,
                                CreateResponse *response,
                                google::protobuf::Closure *done) {
    brpc::ClosureGuard done_guard(done);
    (void)cntl;
    VLOG(1) << "[create_note] parent: " << request->parent_id()
            << ", name: " << request->name();
    auto [s, id] =
        engine_->create_note(request->principal(), request->parent_id(),
                             request->name(), request->content());
    to_result(s, response->mutable_result());
    response->set_id(id);
}

void KbServiceImpl::move_directory(google::protobuf::RpcController *cntl,
                                   const MoveRequest *request,
                                   MutationResponse *response,
                                   google::protobuf::Closure *done) {
    brpc::ClosureGuard done_guard(done);
    (void)cntl;
    VLOG(1) << "[move_directory] id: " << request->id()
            << ", new parent: " << request->new_parent_id();
    Status s = engine_->move_directory(request->principal(), request->id(),
                                       request->new_parent_id(),
                                       request->new_name());
    to_result(s, response->mutable_result());
}

void KbServiceImpl::rename_directory(google::protobuf::RpcController *cntl,
                                     const RenameRequest *request,
                                     MutationResponse *response,
                                     google::protobuf::Closure *done) {
    brpc::ClosureGuard done_guard(done);
    (void)cntl;
    Status s = engine_->rename_directory(request->principal(), request->id(),
                                         request->new_name());
    to_result(s, response->mutable_result());
}

void KbServiceImpl::move_note(google::protobuf::RpcController *cntl,
                              const MoveRequest *request,
                              MutationResponse *response,
                              google::protobuf::Closure *done) {
    brpc::ClosureGuard done_guard(done);
    (void)cntl;
    VLOG(1) << "[move_note] id: " << request->id()
            << ", new parent: " << request->new_parent_id();
    Status s = engine_->move_note(request->principal(), request->id(),
                                  request->new_parent_id(),
                                  request->new_name());
    to_result(s, response->mutable_result());
}

void KbServiceImpl::rename_note(google::protobuf::RpcController *cntl,
                                const RenameRequest *request,
                                MutationResponse *response,
                                google::protobuf::Closure *done) {
    brpc::ClosureGuard done_guard(done);
    (void)cntl;
    Status s = engine_->rename_note(request->principal(), request->id(),
                                    request->new_name());
    to_result(s, response->mutable_result());
}

void KbServiceImpl::update_note(google::protobuf::RpcController *cntl,
                                const UpdateNoteRequest *request,
                                MutationResponse *response,
                                google::protobuf::Closure *done) {
    brpc::ClosureGuard done_guard(done);
    (void)cntl;
    Status s = engine_->update_note(request->principal(), request->id(),
                                    request->content());
    to_result(s, response->mutable_result());
}

void KbServiceImpl::delete_note(google::protobuf::RpcController *cntl,
                                const DeleteRequest *request,
                                MutationResponse *response,
                                google::protobuf::Closure *done) {
    brpc::ClosureGuard done_guard(done);
    (void)cntl;
    VLOG(1) << "[delete_note] id: " << request->id();
    Status s = engine_->delete_note(request->principal(), request->id());
    to_result(s, response->mutable_result());
}

void KbServiceImpl::delete_directory(google::protobuf::RpcController *cntl,
                                     const DeleteRequest *request,
                                     MutationResponse *response,
                                     google::protobuf::Closure *done) {
    brpc::ClosureGuard done_guard(done);
    (void)cntl;
    VLOG(1) << "[delete_directory] id: " << request->id();
    Status s = engine_->delete_directory(request->principal(), request->id());
    to_result(s, response->mutable_result());
}

// --------------- queries ---------------

void KbServiceImpl::lookup_child(google::protobuf::RpcController *cntl,
                                 const LookupRequest *request,
                                 EntryResponse *response,
                                 google::protobuf::Closure *done) {
    brpc::ClosureGuard done_guard(done);
    (void)cntl;
    auto entry = ns_->lookup_child(request->parent_id(), request->name());
    if (!entry) {
        to_result(Status::NotFound("No child '" + request->name() + "'"),
                  response->mutable_result());
        return;
    }
    to_result(Status::OK(), response->mutable_result());
    *response->mutable_entry() = *entry;
}

void KbServiceImpl::resolve_path(google::protobuf::RpcController *cntl,
                                 const PathRequest *request,
                                 EntryResponse *response,
                                 google::protobuf::Closure *done) {
    brpc::ClosureGuard done_guard(done);
    (void)cntl;
    auto [s, entry] = ns_->resolve_path(request->path());
    to_result(s, response->mutable_result());
    if (s.ok())
        *response->mutable_entry() = entry;
}

void KbServiceImpl::list_children(google::protobuf::RpcController *cntl,
                                  const DirectoryRequest *request,
                                  ListingResponse *response,
                                  google::protobuf::Closure *done) {
    brpc::ClosureGuard done_guard(done);
    (void)cntl;
    auto [s, listing] = ns_->list_children(request->id());
    to_result(s, response->mutable_result());
    if (s.ok())
        response->mutable_listing()->Swap(&listing);
}

void KbServiceImpl::read_note(google::protobuf::RpcController *cntl,
                              const NoteRequest *request,
                              NoteResponse *response,
                              google::protobuf::Closure *done) {
    brpc::ClosureGuard done_guard(done);
    (void)cntl;
    auto [s, note] = ns_->read_note(request->id());
    to_result(s, response->mutable_result());
    if (s.ok())
        response->mutable_note()->Swap(&note);
}

void KbServiceImpl::is_ancestor(google::protobuf::RpcController *cntl,
                                const AncestorRequest *request,
                                AncestorResponse *response,
                                google::protobuf::Closure *done) {
    brpc::ClosureGuard done_guard(done);
    (void)cntl;
    to_result(Status::OK(), response->mutable_result());
    response->set_is_ancestor(
        ns_->is_ancestor(request->candidate_id(), request->target_id()));
}

void KbServiceImpl::subtree(google::protobuf::RpcController *cntl,
                            const DirectoryRequest *request,
                            SubtreeResponse *response,
                            google::protobuf::Closure *done) {
    brpc::ClosureGuard done_guard(done);
    (void)cntl;
    auto [s, tree] = ns_->subtree(request->id());
    to_result(s, response->mutable_result());
    if (!s.ok())
        return;
    for (uint64_t id : tree.dirs)
        response->add_dir_ids(id);
    for (uint64_t id : tree.notes)
        response->add_note_ids(id);
}

// --------------- permissions ---------------

void KbServiceImpl::set_permissions(google::protobuf::RpcController *cntl,
                                    const SetPermissionsRequest *request,
                                    MutationResponse *response,
                                    google::protobuf::Closure *done) {
    brpc::ClosureGuard done_guard(done);
    (void)cntl;
    LOG(INFO) << "[set_permissions] " << request->principal()
              << " -> " << request->record().principal();
    Status s = gate_->grant(request->principal(), request->record());
    to_result(s, response->mutable_result());
}

void KbServiceImpl::get_permissions(google::protobuf::RpcController *cntl,
                                    const PrincipalRequest *request,
                                    PermissionsResponse *response,
                                    google::protobuf::Closure *done) {
    brpc::ClosureGuard done_guard(done);
    (void)cntl;
    to_result(Status::OK(), response->mutable_result());
    *response->mutable_record() = gate_->get(request->principal());
}
