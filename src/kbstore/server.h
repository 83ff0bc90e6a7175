#pragma once

#include "engine.h"
#include "kbstore.pb.h"
#include "namespace.h"
#include "permissions.h"

#include <brpc/server.h>

class KbServiceImpl : public KbService {
  public:
    KbServiceImpl(MutationEngine *engine, const Namespace *ns,
                  PermissionGate *gate)
        : engine_(engine), ns_(ns), gate_(gate) {}
    virtual ~KbServiceImpl() {}

    // Mutations
    void create_directory(::google::protobuf::RpcController *cntl,
                          const ::CreateDirectoryRequest *request,
                          ::CreateResponse *response,
                          ::google::protobuf::Closure *done) override;
    void create_note(::google::protobuf::RpcController *cntl,
                     const ::CreateNoteRequest *request,
                     ::CreateResponse *response,
                     ::google::protobuf::Closure *done) override;
    void move_directory(::google::protobuf::RpcController *cntl,
                        const ::MoveRequest *request,
                        ::MutationResponse *response,
                        ::google::protobuf::Closure *done) override;
    void rename_directory(::google::protobuf::RpcController *cntl,
                          const ::RenameRequest *request,
                          ::MutationResponse *response,
                          ::google::protobuf::Closure *done) override;
    void move_note(::google::protobuf::RpcController *cntl,
                   const ::MoveRequest *request, ::MutationResponse *response,
                   ::google::protobuf::Closure *done) override;
    void rename_note(::google::protobuf::RpcController *cntl,
                     const ::RenameRequest *request,
                     ::MutationResponse *response,
                     ::google::protobuf::Closure *done) override;
    void update_note(::google::protobuf::RpcController *cntl,
                     const ::UpdateNoteRequest *request,
                     ::MutationResponse *response,
                     ::google::protobuf::Closure *done) override;
    void delete_note(::google::protobuf::RpcController *cntl,
                     const ::DeleteRequest *request,
                     ::MutationResponse *response,
                     ::google::protobuf::Closure *done) override;
    void delete_directory(::google::protobuf::RpcController *cntl,
                          const ::DeleteRequest *request,
                          ::MutationResponse *response,
                          ::google::protobuf::Closure *done) override;

    // Queries
    void lookup_child(::google::protobuf::RpcController *cntl,
                      const ::LookupRequest *request,
                      ::EntryResponse *response,
                      ::google::protobuf::Closure *done) override;
    void resolve_path(::google::protobuf::RpcController *cntl,
                      const ::PathRequest *request, ::EntryResponse *response,
                      ::google::protobuf::Closure *done) override;
    void list_children(::google::protobuf::RpcController *cntl,
                       const ::DirectoryRequest *request,
                       ::ListingResponse *response,
                       ::google::protobuf::Closure *done) override;
    void read_note(::google::protobuf::RpcController *cntl,
                   const ::NoteRequest *request, ::NoteResponse *response,
                   ::google::protobuf::Closure *done) override;
    void is_ancestor(::google::protobuf::RpcController *cntl,
                     const ::AncestorRequest *request,
                     ::AncestorResponse *response,
                     ::google::protobuf::Closure *done) override;
    void subtree(::google::protobuf::RpcController *cntl,
                 const ::DirectoryRequest *request,
                 ::SubtreeResponse *response,
                 ::google::protobuf::Closure *done) override;

    // Permission records
    void set_permissions(::google::protobuf::RpcController *cntl,
                         const ::SetPermissionsRequest *request,
                         ::MutationResponse *response,
                         ::google::protobuf::Closure *done) override;
    void get_permissions(::google::protobuf::RpcController *cntl,
                         const ::PrincipalRequest *request,
                         ::PermissionsResponse *response,
                         ::google::protobuf::Closure *done) override;

  private:
    MutationEngine *engine_;
    const Namespace *ns_;
    PermissionGate *gate_;
};

// Copies a Status into the wire result.
void to_result(const Status &s, Result *result);
