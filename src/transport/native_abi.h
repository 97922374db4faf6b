// NOLINTBEGIN(modernize-deprecated-headers, cppcoreguidelines-macro-usage, modernize-use-using)

#pragma once
#include <stddef.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

#define RELAY_ABI_VERSION 1

#if defined(__GNUC__)
#define RELAY_EXPORT __attribute__((visibility("default")))
#else
#define RELAY_EXPORT
#endif

typedef enum RelayStatus {
    RELAY_OK = 0,
    RELAY_ERR_NULL_ARGUMENT = 1,
    RELAY_ERR_ALLOCATION = 2,
} RelayStatus;

// Owned by the engine library; released with relay_free_buffer exactly once.
typedef struct RelayBuffer {
    uint8_t* data_;
    size_t len_;
    size_t capacity_;
} RelayBuffer;

typedef struct RelayEngine RelayEngine;

// options_json may be NULL for defaults. Returns NULL when the options cannot be decoded.
RELAY_EXPORT RelayEngine* relay_create_engine(const char* options_json);

// Returns NULL on success, otherwise an encoded error released with relay_free_string.
RELAY_EXPORT char* relay_init(RelayEngine* engine);

// ---- Encoded-message framing. Results are released with relay_free_string.
RELAY_EXPORT char* relay_execute_request(RelayEngine* engine, const char* request_json);
RELAY_EXPORT char* relay_execute_batch(RelayEngine* engine, const char* requests_json);
RELAY_EXPORT void relay_free_string(char* str);

// ---- Raw-buffer framing. On RELAY_OK *out holds a buffer released with relay_free_buffer.
RELAY_EXPORT int32_t relay_execute_request_direct(RelayEngine* engine, const char* request_json, RelayBuffer** out);
RELAY_EXPORT int32_t relay_execute_batch_direct(RelayEngine* engine, const char* requests_json, RelayBuffer** out);

RELAY_EXPORT RelayBuffer* relay_allocate_buffer(size_t size);
RELAY_EXPORT void relay_free_buffer(RelayBuffer* buffer);

// Number of buffers allocated and not yet released.
RELAY_EXPORT size_t relay_live_buffer_count(void);

RELAY_EXPORT void relay_shutdown(RelayEngine* engine);
RELAY_EXPORT void relay_destroy_engine(RelayEngine* engine);

// NOLINTBEGIN(readability-identifier-naming)
typedef RelayEngine* (*RelayCreateEngineFn)(const char*);
typedef char* (*RelayInitFn)(RelayEngine*);
typedef char* (*RelayExecuteFn)(RelayEngine*, const char*);
typedef int32_t (*RelayExecuteDirectFn)(RelayEngine*, const char*, RelayBuffer**);
typedef RelayBuffer* (*RelayAllocateBufferFn)(size_t);
typedef void (*RelayFreeBufferFn)(RelayBuffer*);
typedef void (*RelayFreeStringFn)(char*);
typedef size_t (*RelayLiveBufferCountFn)(void);
typedef void (*RelayEngineFn)(RelayEngine*);
// NOLINTEND(readability-identifier-naming)

#ifdef __cplusplus
}
#endif

// NOLINTEND(modernize-deprecated-headers, cppcoreguidelines-macro-usage, modernize-use-using)
