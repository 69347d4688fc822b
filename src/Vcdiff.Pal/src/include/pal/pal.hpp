#pragma once

#ifndef PAL_UNUSED
#define PAL_UNUSED(x) (void)(x)
#endif

#ifndef TRUE
#define TRUE 1
#endif
#ifndef FALSE
#define FALSE 0
#endif

#if defined(PAL_PLATFORM_LINUX)
#include <limits.h>
#include <cstdio>
#include <cstddef>
#include <cstdint>
#include <sys/stat.h>
#define PAL_MAX_PATH PATH_MAX
#define PAL_DIRECTORY_SEPARATOR_STR "/"
#define PAL_DIRECTORY_SEPARATOR_C '/'
#define PAL_LIBRARY_PREFIX "lib"
#define PAL_LIBRARY_SUFFIX ".so"
#if defined(__GNUC__)
#define PAL_API __attribute__((visibility("default")))
#define PAL_CALLING_CONVENTION
#else
#define PAL_API
#define PAL_CALLING_CONVENTION
#endif
#else
#error Unsupported platform
#endif

#include "pal_module.hpp"

#include <plog/Log.h>

#ifdef __cplusplus
extern "C" {
#endif

// - Primitives
typedef int BOOL;
typedef int pal_fd_t;

// - Generic

PAL_API BOOL PAL_CALLING_CONVENTION pal_load_library(const char* name_in, void** instance_out, char** error_out);
PAL_API BOOL PAL_CALLING_CONVENTION pal_is_library_loaded(const char* name_in);
PAL_API BOOL PAL_CALLING_CONVENTION pal_free_library(void* instance_in);
PAL_API BOOL PAL_CALLING_CONVENTION pal_getprocaddress(void* instance_in, const char* name_in, void** ptr_out);
PAL_API BOOL PAL_CALLING_CONVENTION pal_process_get_real_path(char **real_path_out);
PAL_API BOOL PAL_CALLING_CONVENTION pal_process_get_cwd(char **cwd_out);
PAL_API BOOL PAL_CALLING_CONVENTION pal_process_get_name(char **exe_name_out);

// - Environment

PAL_API BOOL PAL_CALLING_CONVENTION pal_env_set(const char* name_in, const char* value_in);
PAL_API BOOL PAL_CALLING_CONVENTION pal_env_get(const char* environment_variable_in, char** environment_variable_value_out);

// - Filesystem

PAL_API BOOL PAL_CALLING_CONVENTION pal_fs_rmfile(const char* filename_in);

// - File descriptors
// Descriptors are always borrowed, none of these functions close them.

PAL_API BOOL PAL_CALLING_CONVENTION pal_fd_is_seekable(pal_fd_t fd_in);
PAL_API BOOL PAL_CALLING_CONVENTION pal_fd_get_size(pal_fd_t fd_in, uint64_t* size_out);
PAL_API BOOL PAL_CALLING_CONVENTION pal_fd_read(pal_fd_t fd_in, char* buffer_in, size_t buffer_len_in, size_t* bytes_read_out);
PAL_API BOOL PAL_CALLING_CONVENTION pal_fd_pread(pal_fd_t fd_in, char* buffer_in, size_t buffer_len_in, uint64_t offset_in, size_t* bytes_read_out);
PAL_API BOOL PAL_CALLING_CONVENTION pal_fd_write(pal_fd_t fd_in, const char* data_in, size_t data_len_in);
PAL_API BOOL PAL_CALLING_CONVENTION pal_fd_mmap(pal_fd_t fd_in, size_t length_in, void** addr_out);
PAL_API BOOL PAL_CALLING_CONVENTION pal_fd_munmap(void* addr_in, size_t length_in);

// - Path
PAL_API BOOL PAL_CALLING_CONVENTION pal_path_get_directory_name_from_file_path(const char * path_in, char ** path_out);
PAL_API BOOL PAL_CALLING_CONVENTION pal_path_combine(const char* path1, const char* path2, char** path_out);

// - String

PAL_API BOOL PAL_CALLING_CONVENTION pal_str_is_null_or_whitespace(const char* str);

#ifdef __cplusplus
}
#endif

