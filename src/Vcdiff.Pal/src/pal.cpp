#include "pal/pal.hpp"

#if defined(PAL_PLATFORM_LINUX)
#include <sys/types.h>
#include <sys/mman.h> // mmap
#include <unistd.h> // read, pread, lseek
#include <libgen.h> // dirname
#include <dlfcn.h> // dlopen
#include <cerrno>
static const char* symlink_entrypoint_executable = "/proc/self/exe";
#endif

#include <cstdlib>
#include <cstring>
#include <string>

// - Generic

PAL_API BOOL PAL_CALLING_CONVENTION pal_load_library(const char * name_in, void** instance_out, char** error_out)
{
    if (name_in == nullptr
        || instance_out == nullptr)
    {
        return FALSE;
    }

#if defined(PAL_PLATFORM_LINUX)
    auto instance = dlopen(name_in, RTLD_NOW | RTLD_LOCAL);
    if (!instance)
    {
        const auto* const dl_error = dlerror();
        LOGD << "Failed to load dynamic library: " << name_in << ". Error: " << (dl_error == nullptr ? "unknown" : dl_error);
        if (error_out != nullptr && dl_error != nullptr)
        {
            *error_out = strdup(dl_error);
        }
        return FALSE;
    }

    *instance_out = instance;
    return TRUE;
#else
    return FALSE;
#endif
}

PAL_API BOOL PAL_CALLING_CONVENTION pal_is_library_loaded(const char* name_in)
{
    if (name_in == nullptr)
    {
        return FALSE;
    }

#if defined(PAL_PLATFORM_LINUX)
    // RTLD_NOLOAD only succeeds for objects already mapped, it bumps the refcount.
    auto instance = dlopen(name_in, RTLD_NOW | RTLD_NOLOAD);
    if (instance == nullptr)
    {
        dlerror();
        return FALSE;
    }
    dlclose(instance);
    return TRUE;
#else
    return FALSE;
#endif
}

PAL_API BOOL PAL_CALLING_CONVENTION pal_free_library(void* instance_in)
{
    if (instance_in == nullptr)
    {
        return FALSE;
    }
#if defined(PAL_PLATFORM_LINUX)
    return 0 == dlclose(instance_in) ? TRUE : FALSE;
#else
    return FALSE;
#endif
}

PAL_API BOOL PAL_CALLING_CONVENTION pal_getprocaddress(void* instance_in, const char* name_in, void** ptr_out)
{
    if (instance_in == nullptr
        || name_in == nullptr
        || ptr_out == nullptr)
    {
        return FALSE;
    }

#if defined(PAL_PLATFORM_LINUX)
    dlerror();
    auto dlsym_ptr_out = dlsym(instance_in, name_in);
    if (dlerror() != nullptr)
    {
        return FALSE;
    }
    *ptr_out = dlsym_ptr_out;
    return TRUE;
#else
    return FALSE;
#endif
}

PAL_API BOOL PAL_CALLING_CONVENTION pal_process_get_real_path(char **real_path_out)
{
    if (real_path_out == nullptr)
    {
        return FALSE;
    }

#if defined(PAL_PLATFORM_LINUX)
    char real_path[PAL_MAX_PATH];
    if (realpath(symlink_entrypoint_executable, real_path) != nullptr && real_path[0] != '\0')
    {
        *real_path_out = strdup(real_path);
        return TRUE;
    }
    return FALSE;
#else
    return FALSE;
#endif
}

PAL_API BOOL PAL_CALLING_CONVENTION pal_process_get_cwd(char **cwd_out)
{
    char* real_path = nullptr;
    if (!pal_process_get_real_path(&real_path))
    {
        return FALSE;
    }

    char* real_path_cwd = nullptr;
    const auto success = pal_path_get_directory_name_from_file_path(real_path, &real_path_cwd);
    free(real_path);
    if (!success)
    {
        return FALSE;
    }

    *cwd_out = real_path_cwd;

    return TRUE;
}

PAL_API BOOL PAL_CALLING_CONVENTION pal_process_get_name(char **exe_name_out)
{
    char* real_path = nullptr;
    if (!pal_process_get_real_path(&real_path))
    {
        return FALSE;
    }

    const std::string real_path_str(real_path);
    free(real_path);

    const auto directory_separator_pos = real_path_str.find_last_of(PAL_DIRECTORY_SEPARATOR_C);
    if (std::string::npos == directory_separator_pos)
    {
        return FALSE;
    }

    const auto exe_name = real_path_str.substr(directory_separator_pos + 1);
    *exe_name_out = strdup(exe_name.c_str());

    return TRUE;
}

// - Environment
PAL_API BOOL PAL_CALLING_CONVENTION pal_env_set(const char* name_in, const char* value_in)
{
    if (name_in == nullptr)
    {
        return FALSE;
    }
#if defined(PAL_PLATFORM_LINUX)
    const auto success = value_in == nullptr ? unsetenv(name_in) : setenv(name_in, value_in, 1 /* overwrite */);
    return success == 0;
#else
    return FALSE;
#endif
}

PAL_API BOOL PAL_CALLING_CONVENTION pal_env_get(const char * environment_variable_in, char ** environment_variable_value_out)
{
    if (environment_variable_in == nullptr
        || environment_variable_value_out == nullptr)
    {
        return FALSE;
    }

#if defined(PAL_PLATFORM_LINUX)
    const auto value = ::getenv(environment_variable_in);
    if (value == nullptr)
    {
        return FALSE;
    }
    *environment_variable_value_out = strdup(value);
    return TRUE;
#else
    return FALSE;
#endif
}

// - Path

#if defined(PAL_PLATFORM_LINUX)
inline int unix_path_combine_cleanup(char *path)
{
    char *str;
    char *parent_dir;
    char *current_dir;
    char *tail;

    if (0 == strlen(path)) {
        return 0;
    }

    /* resolve parent dir */
    while (TRUE) {
        str = strstr(path, "/../");
        if (nullptr == str) {
            break;
        }

        *str = 0;
        if (nullptr == strchr(path, '/')) {
            return 1;
        }
        parent_dir = strrchr(path, '/') + 1;

        current_dir = str + 4;

        /* replace parent dir */
        memmove(parent_dir, current_dir, strlen(current_dir) + 1);
    }

    /* resolve current dir */
    while (TRUE) {
        str = strstr(path, "/./");
        if (nullptr == str) {
            break;
        }

        memmove(str + 1, str + 3, strlen(str + 3) + 1);
    }

    /* remove tail '/' or '/.' */
    tail = path + strlen(path) - 1;
    if ('/' == *tail && tail != path) {
        *tail = 0;
    }
    else if (strlen(path) >= 2 && 0 == strcmp(tail - 1, "/.")) {
        *(tail - 1) = 0;
    }

    return 0;
}

inline char* unix_path_combine(const char *path1, const char *path2, char *buffer, const size_t buffer_len)
{
    if (pal_str_is_null_or_whitespace(path1)
        || pal_str_is_null_or_whitespace(path2)) {
        return nullptr;
    }

    if (strlen(path1) + strlen(path2) + 2 > buffer_len) {
        return nullptr;
    }

    if ('/' == path2[0]) {
        strcpy(buffer, path2);
    } else {
        strcpy(buffer, path1);

        if ('/' != path1[strlen(path1) - 1]) {
            strcat(buffer, "/");
        }

        strcat(buffer, path2);
    }

    return 0 == unix_path_combine_cleanup(buffer) ? buffer : nullptr;
}
#endif

PAL_API BOOL PAL_CALLING_CONVENTION pal_path_get_directory_name_from_file_path(const char * path_in, char ** path_out)
{
    if (path_in == nullptr)
    {
        return FALSE;
    }

#if defined(PAL_PLATFORM_LINUX)
    auto path_in_cpy = strdup(path_in);
    auto dir = dirname(path_in_cpy);
    if (dir != nullptr)
    {
        // dirname() may return a pointer into path_in_cpy, copy before releasing it.
        *path_out = strdup(dir);
        free(path_in_cpy);
        return TRUE;
    }
    free(path_in_cpy);
    return FALSE;
#else
    return FALSE;
#endif
}

PAL_API BOOL PAL_CALLING_CONVENTION pal_path_combine(const char * path1, const char * path2, char ** path_out)
{
    if (path1 == nullptr
        || path2 == nullptr)
    {
        return FALSE;
    }
#if defined(PAL_PLATFORM_LINUX)
    char buffer[PAL_MAX_PATH];
    if (nullptr == unix_path_combine(path1, path2, buffer, sizeof buffer))
    {
        return FALSE;
    }
    *path_out = strdup(buffer);
    return TRUE;
#else
    return FALSE;
#endif
}

// - Filesystem

PAL_API BOOL PAL_CALLING_CONVENTION pal_fs_rmfile(const char* filename_in)
{
    if (filename_in == nullptr)
    {
        return FALSE;
    }
#if defined(PAL_PLATFORM_LINUX)
    const auto status = remove(filename_in);
    if (status != 0)
    {
        LOGE << "Error removing file: " << filename_in << ". Errno: " << errno << ". Error code: " << std::strerror(errno);
        return FALSE;
    }
    return TRUE;
#else
    return FALSE;
#endif
}

// - File descriptors

PAL_API BOOL PAL_CALLING_CONVENTION pal_fd_is_seekable(pal_fd_t fd_in)
{
    if (fd_in < 0)
    {
        return FALSE;
    }

#if defined(PAL_PLATFORM_LINUX)
    struct stat st = {};
    if (fstat(fd_in, &st) != 0)
    {
        return FALSE;
    }

    // Pipes, sockets and terminals fail lseek with ESPIPE, character devices
    // may accept lseek without being addressable so they are rejected too.
    if (!S_ISREG(st.st_mode) && !S_ISBLK(st.st_mode))
    {
        return FALSE;
    }

    return lseek(fd_in, 0, SEEK_CUR) != static_cast<off_t>(-1) ? TRUE : FALSE;
#else
    return FALSE;
#endif
}

PAL_API BOOL PAL_CALLING_CONVENTION pal_fd_get_size(pal_fd_t fd_in, uint64_t* size_out)
{
    if (fd_in < 0
        || size_out == nullptr)
    {
        return FALSE;
    }

#if defined(PAL_PLATFORM_LINUX)
    struct stat st = {};
    if (fstat(fd_in, &st) != 0)
    {
        const auto error = errno;
        LOGE << "fstat failed. Fd: " << fd_in << ". Errno: " << error << ". Error code: " << std::strerror(error);
        errno = error;
        return FALSE;
    }

    if (S_ISBLK(st.st_mode))
    {
        const auto end = lseek(fd_in, 0, SEEK_END);
        if (end == static_cast<off_t>(-1))
        {
            return FALSE;
        }
        *size_out = static_cast<uint64_t>(end);
        return TRUE;
    }

    *size_out = static_cast<uint64_t>(st.st_size);
    return TRUE;
#else
    return FALSE;
#endif
}

PAL_API BOOL PAL_CALLING_CONVENTION pal_fd_read(pal_fd_t fd_in, char* buffer_in, size_t buffer_len_in, size_t* bytes_read_out)
{
    if (fd_in < 0
        || buffer_in == nullptr
        || bytes_read_out == nullptr)
    {
        return FALSE;
    }

#if defined(PAL_PLATFORM_LINUX)
    // Fill the whole buffer unless end of file is reached, a short count means eof.
    size_t total = 0;
    while (total < buffer_len_in)
    {
        const auto n = read(fd_in, buffer_in + total, buffer_len_in - total);
        if (n < 0)
        {
            if (errno == EINTR)
            {
                continue;
            }
            const auto error = errno;
            LOGE << "read failed. Fd: " << fd_in << ". Errno: " << error << ". Error code: " << std::strerror(error);
            errno = error;
            return FALSE;
        }
        if (n == 0)
        {
            break;
        }
        total += static_cast<size_t>(n);
    }
    *bytes_read_out = total;
    return TRUE;
#else
    return FALSE;
#endif
}

PAL_API BOOL PAL_CALLING_CONVENTION pal_fd_pread(pal_fd_t fd_in, char* buffer_in, size_t buffer_len_in, uint64_t offset_in, size_t* bytes_read_out)
{
    if (fd_in < 0
        || buffer_in == nullptr
        || bytes_read_out == nullptr)
    {
        return FALSE;
    }

#if defined(PAL_PLATFORM_LINUX)
    size_t total = 0;
    while (total < buffer_len_in)
    {
        const auto n = pread(fd_in, buffer_in + total, buffer_len_in - total, static_cast<off_t>(offset_in + total));
        if (n < 0)
        {
            if (errno == EINTR)
            {
                continue;
            }
            const auto error = errno;
            LOGE << "pread failed. Fd: " << fd_in << ". Offset: " << offset_in << ". Errno: " << error << ". Error code: " << std::strerror(error);
            errno = error;
            return FALSE;
        }
        if (n == 0)
        {
            break;
        }
        total += static_cast<size_t>(n);
    }
    *bytes_read_out = total;
    return TRUE;
#else
    return FALSE;
#endif
}

PAL_API BOOL PAL_CALLING_CONVENTION pal_fd_write(pal_fd_t fd_in, const char* data_in, size_t data_len_in)
{
    if (fd_in < 0
        || (data_in == nullptr && data_len_in > 0))
    {
        return FALSE;
    }

#if defined(PAL_PLATFORM_LINUX)
    size_t total = 0;
    while (total < data_len_in)
    {
        const auto n = write(fd_in, data_in + total, data_len_in - total);
        if (n < 0)
        {
            if (errno == EINTR)
            {
                continue;
            }
            const auto error = errno;
            LOGE << "write failed. Fd: " << fd_in << ". Errno: " << error << ". Error code: " << std::strerror(error);
            errno = error;
            return FALSE;
        }
        total += static_cast<size_t>(n);
    }
    return TRUE;
#else
    return FALSE;
#endif
}

PAL_API BOOL PAL_CALLING_CONVENTION pal_fd_mmap(pal_fd_t fd_in, size_t length_in, void** addr_out)
{
    if (fd_in < 0
        || length_in == 0
        || addr_out == nullptr)
    {
        return FALSE;
    }

#if defined(PAL_PLATFORM_LINUX)
    auto addr = mmap(nullptr, length_in, PROT_READ, MAP_SHARED, fd_in, 0);
    if (addr == MAP_FAILED)
    {
        const auto error = errno;
        LOGE << "mmap failed. Fd: " << fd_in << ". Length: " << length_in << ". Errno: " << error << ". Error code: " << std::strerror(error);
        errno = error;
        return FALSE;
    }
    *addr_out = addr;
    return TRUE;
#else
    return FALSE;
#endif
}

PAL_API BOOL PAL_CALLING_CONVENTION pal_fd_munmap(void* addr_in, size_t length_in)
{
    if (addr_in == nullptr
        || length_in == 0)
    {
        return FALSE;
    }

#if defined(PAL_PLATFORM_LINUX)
    return munmap(addr_in, length_in) == 0 ? TRUE : FALSE;
#else
    return FALSE;
#endif
}

// - String

PAL_API BOOL PAL_CALLING_CONVENTION pal_str_is_null_or_whitespace(const char* str)
{
    if (str == nullptr)
    {
        return TRUE;
    }

#if defined(PAL_PLATFORM_LINUX)
    const std::string value(str);
    const auto empty_or_whitespace = value.empty() || value.find_first_not_of(' ') == std::string::npos;
    return empty_or_whitespace ? TRUE : FALSE;
#else
    return FALSE;
#endif
}
