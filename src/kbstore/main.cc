#include "engine.h"
#include "id_allocator.h"
#include "namespace.h"
#include "permissions.h"
#include "server.h"
#include "tree_store.h"

#include <brpc/server.h>
#include <butil/logging.h>
#include <gflags/gflags.h>
#include <string>

DEFINE_int32(port, 8100, "Listen port of the knowledge base service");
DEFINE_string(host, "0.0.0.0", "Address the service binds to");
DEFINE_string(db_path, "/tmp/kbstore", "Path to the RocksDB directory");
DEFINE_bool(read_only, false,
            "Open the database read-only; every mutation then fails");
DEFINE_bool(sync_writes, true, "fsync every committed transaction");
DEFINE_string(admin, "",
              "Principal granted every capability at startup and the only one "
              "allowed to change permissions over RPC (empty: none)");
DEFINE_int32(idle_timeout_sec, -1,
             "Close connections idle for this long (-1: never)");

int main(int argc, char *argv[]) {
    gflags::ParseCommandLineFlags(&argc, &argv, true);

    StoreOptions store_options;
    store_options.db_path = FLAGS_db_path;
    store_options.read_only = FLAGS_read_only;
    store_options.sync_writes = FLAGS_sync_writes;

    TreeStore store(store_options);
    if (auto st = store.init(); !st.ok()) {
        LOG(ERROR) << "Failed to initialise tree store: " << st.ToString();
        return -1;
    }
    LOG(INFO) << "Tree store initialised";

    PermissionGate gate(&store, FLAGS_admin);
    if (auto st = gate.init(); !st.ok()) {
        LOG(ERROR) << "Failed to load permissions: " << st.ToString();
        return -1;
    }
    if (!FLAGS_admin.empty()) {
        PermissionRecord admin;
        admin.set_principal(FLAGS_admin);
        admin.set_can_edit(true);
        admin.set_can_receive_feedback(true);
        if (auto st = gate.set(admin); !st.ok()) {
            LOG(ERROR) << "Failed to grant " << FLAGS_admin << ": "
                       << st.ToString();
            return -1;
        }
    }

    IdAllocator dir_ids("directory", store.next_dir_id());
    IdAllocator note_ids("note", store.next_note_id());
    MutationEngine engine(&store, &dir_ids, &note_ids, &gate);
    Namespace ns(&store);

    brpc::Server server;
    KbServiceImpl kb_service(&engine, &ns, &gate);

    if (server.AddService(&kb_service, brpc::SERVER_DOESNT_OWN_SERVICE) != 0) {
        LOG(ERROR) << "Fail to add service";
        return -1;
    }

    std::string server_address = FLAGS_host + ":" + std::to_string(FLAGS_port);
    brpc::ServerOptions options;
    options.idle_timeout_sec = FLAGS_idle_timeout_sec;
    if (server.Start(server_address.c_str(), &options) != 0) {
        LOG(ERROR) << "Failed to start RPC server";
        return -1;
    }

    LOG(INFO) << "Knowledge base service is running on "
              << server.listen_address();

    // Wait until Ctrl-C is pressed, then Stop() and Join() the server.
    server.RunUntilAskedToQuit();
    LOG(INFO) << "Knowledge base service is going to quit";
    return 0;
}
