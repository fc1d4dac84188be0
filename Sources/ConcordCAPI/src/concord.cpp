#include "concord.h"
#include <ConcordCore.hpp>
#include <cstdlib>
#include <cstring>
#include <string>

// Thread-local error message storage
static thread_local std::string g_last_error;

static void set_error(const std::string& msg) {
    g_last_error = msg;
}

static void clear_error() {
    g_last_error.clear();
}

// =============================================================================
// Opaque Type Definitions (internal)
// =============================================================================

struct concord_session {
    concord::sync_session session;

    explicit concord_session(concord::concord_config config) : session(std::move(config)) {}
};

// =============================================================================
// Error Handling
// =============================================================================

extern "C" const char* concord_last_error(void) {
    return g_last_error.empty() ? nullptr : g_last_error.c_str();
}

// =============================================================================
// Session Lifecycle
// =============================================================================

extern "C" concord_session_t* concord_session_open(const char* config_path) {
    if (!config_path) {
        set_error("config_path is null");
        return nullptr;
    }
    try {
        clear_error();
        return new concord_session(concord::load_config(config_path));
    } catch (const std::exception& e) {
        set_error(e.what());
        LOG_ERROR("capi", "Failed to open session: %s", e.what());
        return nullptr;
    }
}

extern "C" concord_session_t* concord_session_open_json(const char* config_json) {
    if (!config_json) {
        set_error("config_json is null");
        return nullptr;
    }
    try {
        clear_error();
        return new concord_session(concord::parse_config(config_json));
    } catch (const std::exception& e) {
        set_error(e.what());
        LOG_ERROR("capi", "Failed to open session: %s", e.what());
        return nullptr;
    }
}

extern "C" void concord_session_close(concord_session_t* session) {
    delete session;
}

// =============================================================================
// Operation Tracking
// =============================================================================

extern "C" concord_status_t concord_track(concord_session_t* session,
                                          concord_operation_type_t type,
                                          const char* table,
                                          const char* row_json) {
    if (!session || !table || !row_json) {
        set_error("session, table and row_json are required");
        return CONCORD_ERROR_NULL_POINTER;
    }

    concord::operation_type op_type;
    switch (type) {
        case CONCORD_OP_INSERT: op_type = concord::operation_type::insert; break;
        case CONCORD_OP_UPDATE: op_type = concord::operation_type::update; break;
        case CONCORD_OP_DELETE: op_type = concord::operation_type::remove; break;
        default:
            set_error("unknown operation type");
            return CONCORD_ERROR_INVALID_ARGUMENT;
    }

    try {
        auto record = concord::record_from_json(row_json);
        if (!record) {
            set_error("row_json must be a JSON object");
            return CONCORD_ERROR_INVALID_ARGUMENT;
        }

        if (!session->session.track(op_type, table, *record)) {
            set_error("operation could not be written to the journal");
            return CONCORD_ERROR_IO;
        }
        clear_error();
        return CONCORD_OK;
    } catch (const std::exception& e) {
        set_error(e.what());
        LOG_ERROR("capi", "Failed to track %s on %s: %s", concord::to_string(op_type).c_str(), table, e.what());
        return CONCORD_ERROR_INVALID_ARGUMENT;
    }
}

extern "C" size_t concord_pending_operations(concord_session_t* session) {
    if (!session) return 0;
    try {
        return session->session.log().size();
    } catch (const std::exception& e) {
        set_error(e.what());
        return 0;
    }
}

// =============================================================================
// Sync
// =============================================================================

template <typename Fn>
static concord_status_t run_trigger(concord_session_t* session, Fn&& fn) {
    if (!session) {
        set_error("session is null");
        return CONCORD_ERROR_NULL_POINTER;
    }
    try {
        if (fn(session->session)) {
            clear_error();
            return CONCORD_OK;
        }
        auto* manager = session->session.manager();
        set_error(manager ? manager->last_error_message() : "sync failed");
        return CONCORD_ERROR_SYNC_FAILED;
    } catch (const std::exception& e) {
        set_error(e.what());
        return CONCORD_ERROR_SYNC_FAILED;
    }
}

extern "C" concord_status_t concord_trigger_manual_sync(concord_session_t* session) {
    return run_trigger(session, [](concord::sync_session& s) { return s.trigger_manual_sync(); });
}

extern "C" concord_status_t concord_trigger_auto_sync(concord_session_t* session) {
    return run_trigger(session, [](concord::sync_session& s) { return s.trigger_auto_sync(); });
}

extern "C" concord_status_t concord_trigger_idle_sync(concord_session_t* session) {
    return run_trigger(session, [](concord::sync_session& s) { return s.trigger_idle_sync(); });
}

extern "C" concord_status_t concord_trigger_shutdown_sync(concord_session_t* session) {
    return run_trigger(session, [](concord::sync_session& s) { return s.trigger_shutdown_sync(); });
}

extern "C" bool concord_is_sync_needed(concord_session_t* session) {
    if (!session) return false;
    try {
        return session->session.is_sync_needed();
    } catch (const std::exception& e) {
        set_error(e.what());
        return false;
    }
}

extern "C" concord_status_t concord_start_background_sync(concord_session_t* session, int64_t interval_ms) {
    if (!session) {
        set_error("session is null");
        return CONCORD_ERROR_NULL_POINTER;
    }
    if (interval_ms <= 0) {
        set_error("interval_ms must be positive");
        return CONCORD_ERROR_INVALID_ARGUMENT;
    }
    if (auto* scheduler = session->session.scheduler()) {
        try {
            scheduler->start(std::chrono::milliseconds(interval_ms));
        } catch (const std::exception& e) {
            set_error(e.what());
            return CONCORD_ERROR_SYNC_FAILED;
        }
    }
    return CONCORD_OK;
}

extern "C" void concord_stop_background_sync(concord_session_t* session) {
    if (session && session->session.scheduler()) {
        session->session.scheduler()->stop();
    }
}

extern "C" char* concord_status_json(concord_session_t* session) {
    if (!session) {
        set_error("session is null");
        return nullptr;
    }
    try {
        std::string status = session->session.status_json();
        char* out = static_cast<char*>(std::malloc(status.size() + 1));
        if (!out) {
            set_error("out of memory");
            return nullptr;
        }
        std::memcpy(out, status.c_str(), status.size() + 1);
        return out;
    } catch (const std::exception& e) {
        set_error(e.what());
        return nullptr;
    }
}

extern "C" void concord_string_free(char* str) {
    std::free(str);
}
