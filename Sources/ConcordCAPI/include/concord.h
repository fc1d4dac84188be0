#ifndef CONCORD_C_API_H
#define CONCORD_C_API_H

#include <stdint.h>
#include <stddef.h>
#include <stdbool.h>

#ifdef __cplusplus
extern "C" {
#endif

// =============================================================================
// Opaque Types
// =============================================================================

typedef struct concord_session concord_session_t;

// =============================================================================
// Error Handling
// =============================================================================

typedef enum {
    CONCORD_OK = 0,
    CONCORD_ERROR_NULL_POINTER = -1,
    CONCORD_ERROR_INVALID_ARGUMENT = -2,
    CONCORD_ERROR_SYNC_FAILED = -3,
    CONCORD_ERROR_IO = -4,
} concord_status_t;

// Get the last error message (thread-local), NULL when none
const char* concord_last_error(void);

// =============================================================================
// Session Lifecycle
// =============================================================================

// Open a session from a JSON configuration file. A missing file gives a
// local-only session. Returns NULL on a malformed configuration.
concord_session_t* concord_session_open(const char* config_path);

// Open a session from configuration JSON text
concord_session_t* concord_session_open_json(const char* config_json);

// Stops background sync and frees the session. Does not sync; call
// concord_trigger_shutdown_sync first.
void concord_session_close(concord_session_t* session);

// =============================================================================
// Operation Tracking
// =============================================================================

typedef enum {
    CONCORD_OP_INSERT = 0,
    CONCORD_OP_UPDATE = 1,
    CONCORD_OP_DELETE = 2,
} concord_operation_type_t;

// Record a mutation already committed to the local cache.
// row_json is a JSON object of column values (for deletes, the removed row).
concord_status_t concord_track(concord_session_t* session,
                               concord_operation_type_t type,
                               const char* table,
                               const char* row_json);

size_t concord_pending_operations(concord_session_t* session);

// =============================================================================
// Sync
// =============================================================================

concord_status_t concord_trigger_manual_sync(concord_session_t* session);
concord_status_t concord_trigger_auto_sync(concord_session_t* session);
concord_status_t concord_trigger_idle_sync(concord_session_t* session);

// Short-timeout sync before exit. Check the result: anything but CONCORD_OK
// means local changes were not published and remain only in the journal,
// to be sent by the next session. Failures are not reported anywhere else
// unless logging is enabled.
concord_status_t concord_trigger_shutdown_sync(concord_session_t* session);

bool concord_is_sync_needed(concord_session_t* session);

// Run auto sync on a background thread every interval_ms
concord_status_t concord_start_background_sync(concord_session_t* session, int64_t interval_ms);
void concord_stop_background_sync(concord_session_t* session);

// Diagnostics as JSON. Caller frees with concord_string_free.
char* concord_status_json(concord_session_t* session);
void concord_string_free(char* str);

#ifdef __cplusplus
}
#endif

#endif // CONCORD_C_API_H
