#pragma once

// ConcordCore - leader-elected synchronisation of a local SQLite cache
// through a shared directory or a cloud object store.
//
// Usage:
//   #include <ConcordCore.hpp>
//
//   auto config = concord::load_config("concord.json");
//   concord::sync_session session(config);
//
//   // After committing a change to the local cache:
//   session.track(concord::operation_type::insert, "projects", {{"id", int64_t{7}}, {"name", "Atlas"}});
//
//   session.trigger_auto_sync();      // on a timer
//   session.trigger_shutdown_sync();  // before exit

#include "concord/log.hpp"
#include "concord/types.hpp"
#include "concord/db.hpp"
#include "concord/operation_log.hpp"
#include "concord/sync_metadata.hpp"
#include "concord/coordination.hpp"
#include "concord/shared_directory_backend.hpp"
#include "concord/object_store.hpp"
#include "concord/cloud_store_backend.hpp"
#include "concord/merger.hpp"
#include "concord/sync_manager.hpp"
#include "concord/config.hpp"
