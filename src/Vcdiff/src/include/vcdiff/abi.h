#pragma once

// Contract exported by every backend module (libvcdiff_<name>.so).

#include <stddef.h>
#include <stdint.h>

#if defined(__GNUC__)
#define VCDIFF_API __attribute__((visibility("default")))
#define VCDIFF_CALLING_CONVENTION
#else
#define VCDIFF_API
#define VCDIFF_CALLING_CONVENTION
#endif

#define VCDIFF_BACKEND_DIFF_SYMBOL "vcdiff_backend_diff"
#define VCDIFF_BACKEND_PATCH_SYMBOL "vcdiff_backend_patch"
#define VCDIFF_BACKEND_FREE_SYMBOL "vcdiff_backend_free"

#ifdef __cplusplus
extern "C" {
#endif

typedef void (*vcdiff_error_logger_t)(void *opaque, const char *errmsg);

typedef enum _vcdiff_endpoint_type {
  vcdiff_endpoint_type_buffer = 0,
  vcdiff_endpoint_type_stream = 1
} vcdiff_endpoint_type;

// A buffer endpoint points at data/size. A stream endpoint carries a
// borrowed file descriptor that the module must never close.
typedef struct _vcdiff_endpoint {
  vcdiff_endpoint_type type;
  const uint8_t *data;
  size_t size;
  int fd;
} vcdiff_endpoint;

typedef enum _vcdiff_status_type {
  vcdiff_status_type_success = 0,
  vcdiff_status_type_error = 1,
  vcdiff_status_type_invalid_arg = 2,
  vcdiff_status_type_out_of_memory = 3,
  vcdiff_status_type_io_error = 4,
  vcdiff_status_type_unsuitable_source = 5,
  vcdiff_status_type_corrupt_delta = 6,
  vcdiff_status_type_size_too_large = 7
} vcdiff_status_type;

// input is the target for diff and the delta for patch. When output is a
// stream the result is written to it, otherwise the module allocates
// result/result_size which the caller releases with vcdiff_backend_free.
typedef struct _vcdiff_backend_ctx {
  vcdiff_error_logger_t error_logger;
  void *error_logger_opaque;
  vcdiff_endpoint source;
  vcdiff_endpoint input;
  vcdiff_endpoint output;
  uint8_t *result;
  size_t result_size;
  vcdiff_status_type status;
} vcdiff_backend_ctx;

typedef int32_t (VCDIFF_CALLING_CONVENTION *vcdiff_backend_fn_t)(vcdiff_backend_ctx *p_ctx);

VCDIFF_API int32_t VCDIFF_CALLING_CONVENTION vcdiff_backend_diff(vcdiff_backend_ctx *p_ctx);
VCDIFF_API int32_t VCDIFF_CALLING_CONVENTION vcdiff_backend_patch(vcdiff_backend_ctx *p_ctx);
VCDIFF_API int32_t VCDIFF_CALLING_CONVENTION vcdiff_backend_free(vcdiff_backend_ctx *p_ctx);

#ifdef __cplusplus
}
#endif
