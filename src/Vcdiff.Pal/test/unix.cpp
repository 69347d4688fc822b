#include "gtest/gtest.h"
#include "pal/pal.hpp"
#include "tests/support/utils.hpp"

#include <cstring>
#include <string>
#include <vector>

using testutils = vcdiff::support::util::test_utils;
using vcdiff::support::util::pipe_pair;
using vcdiff::support::util::temp_file;

namespace
{

    struct path_combine_test_case
    {
    public:
        const char *path1;
        const char *path2;
        const char *value;

        path_combine_test_case() = delete;

        path_combine_test_case(const char* path1, const char* path2, const char* value) :
            path1(path1), path2(path2), value(value)
        {

        }
    };

    std::vector<path_combine_test_case> path_combine_test_cases = {
        path_combine_test_case("/a/b/c", "/c/d/e", "/c/d/e"),
        path_combine_test_case("/a/b/c", "d", "/a/b/c/d"),
        path_combine_test_case("/a/b/c/", "d", "/a/b/c/d"),
        path_combine_test_case("/usr/lib", "libvcdiff_xdelta3.so", "/usr/lib/libvcdiff_xdelta3.so"),
        path_combine_test_case("", "", nullptr),
        path_combine_test_case(nullptr, nullptr, nullptr)
    };

    TEST(PAL_PATH_UNIX, pal_path_combine)
    {
        ASSERT_GT(path_combine_test_cases.size(), 0u);

        for (const auto &test_case : path_combine_test_cases)
        {
            char* path_combined = nullptr;
            const auto expected_success = test_case.value == nullptr ? FALSE : TRUE;
            ASSERT_EQ(pal_path_combine(test_case.path1, test_case.path2, &path_combined), expected_success);
            ASSERT_STREQ(path_combined, test_case.value);
            free(path_combined);
        }
    }

    TEST(PAL_PATH_UNIX, pal_path_get_directory_name_from_file_path)
    {
        char* directory = nullptr;
        ASSERT_TRUE(pal_path_get_directory_name_from_file_path("/opt/vcdiff/libvcdiff_test.so", &directory));
        ASSERT_STREQ(directory, "/opt/vcdiff");
        free(directory);
    }

    TEST(PAL_ENV_UNIX, pal_env_get_variable_Reads_PATH_Variable)
    {
        char *environment_variable = nullptr;
        ASSERT_TRUE(pal_env_get("PATH", &environment_variable));
        ASSERT_NE(environment_variable, nullptr);
        free(environment_variable);
    }

    TEST(PAL_ENV_UNIX, pal_env_set_Then_pal_env_get)
    {
        const auto name = "VCDIFF_TEST_" + testutils::build_random_str();
        char* value = nullptr;
        ASSERT_FALSE(pal_env_get(name.c_str(), &value));

        ASSERT_TRUE(pal_env_set(name.c_str(), "/opt/vcdiff"));
        ASSERT_TRUE(pal_env_get(name.c_str(), &value));
        ASSERT_STREQ(value, "/opt/vcdiff");
        free(value);

        ASSERT_TRUE(pal_env_set(name.c_str(), nullptr));
        value = nullptr;
        ASSERT_FALSE(pal_env_get(name.c_str(), &value));
    }

    TEST(PAL_STR_UNIX, pal_str_is_null_or_whitespace)
    {
        ASSERT_TRUE(pal_str_is_null_or_whitespace(nullptr));
        ASSERT_TRUE(pal_str_is_null_or_whitespace(""));
        ASSERT_TRUE(pal_str_is_null_or_whitespace("   "));
        ASSERT_FALSE(pal_str_is_null_or_whitespace(" a "));
    }

    TEST(PAL_FS_UNIX, pal_fs_rmfile)
    {
        std::string filename;
        {
            temp_file file(testutils::to_bytes("x"));
            ASSERT_TRUE(file.is_open());
            filename = file.filename();
            ASSERT_EQ(access(filename.c_str(), F_OK), 0);
        }
        ASSERT_NE(access(filename.c_str(), F_OK), 0);
        ASSERT_FALSE(pal_fs_rmfile(filename.c_str()));
    }

    TEST(PAL_GENERIC_UNIX, pal_process_get_name_ReturnsThisProcessExeName)
    {
        char *exe_name = nullptr;
        ASSERT_TRUE(pal_process_get_name(&exe_name));
        ASSERT_NE(exe_name, nullptr);
        ASSERT_STREQ(exe_name, "vcdiff_tests");
        free(exe_name);
    }

    TEST(PAL_GENERIC_UNIX, pal_load_library_Fails_With_Diagnostic_For_Missing_Library)
    {
        void* instance = nullptr;
        char* error = nullptr;
        ASSERT_FALSE(pal_load_library("libvcdiff_does_not_exist.so", &instance, &error));
        ASSERT_EQ(instance, nullptr);
        ASSERT_NE(error, nullptr);
        ASSERT_NE(std::strstr(error, "libvcdiff_does_not_exist.so"), nullptr);
        free(error);
    }

    TEST(PAL_GENERIC_UNIX, pal_is_library_loaded_Returns_False_For_Unmapped_Library)
    {
        ASSERT_FALSE(pal_is_library_loaded("libvcdiff_does_not_exist.so"));
        ASSERT_FALSE(pal_is_library_loaded(nullptr));
    }

    TEST(PAL_GENERIC_UNIX, pal_module_Reports_Load_Error)
    {
        pal_module module("libvcdiff_does_not_exist.so");
        ASSERT_FALSE(module.is_loaded());
        ASSERT_FALSE(module.get_load_error().empty());

        void (*fn)() = nullptr;
        ASSERT_FALSE(module.try_bind("vcdiff_backend_diff", &fn));
        ASSERT_EQ(fn, nullptr);
    }

    TEST(PAL_FD_UNIX, pal_fd_is_seekable_Regular_File)
    {
        temp_file file(testutils::to_bytes("hello"));
        ASSERT_TRUE(file.is_open());
        ASSERT_TRUE(pal_fd_is_seekable(file.fd()));

        uint64_t size = 0;
        ASSERT_TRUE(pal_fd_get_size(file.fd(), &size));
        ASSERT_EQ(size, 5u);
    }

    TEST(PAL_FD_UNIX, pal_fd_is_seekable_Pipe_Is_Not)
    {
        pipe_pair pipe;
        ASSERT_GE(pipe.read_fd(), 0);
        ASSERT_FALSE(pal_fd_is_seekable(pipe.read_fd()));
        ASSERT_FALSE(pal_fd_is_seekable(pipe.write_fd()));
        ASSERT_FALSE(pal_fd_is_seekable(-1));
    }

    TEST(PAL_FD_UNIX, pal_fd_pread_Leaves_Offset_Untouched)
    {
        temp_file file(testutils::to_bytes("hello world"));
        ASSERT_TRUE(file.is_open());

        char buffer[5] = {};
        size_t bytes_read = 0;
        ASSERT_TRUE(pal_fd_pread(file.fd(), buffer, sizeof(buffer), 6, &bytes_read));
        ASSERT_EQ(bytes_read, 5u);
        ASSERT_EQ(std::string(buffer, bytes_read), "world");

        ASSERT_TRUE(pal_fd_read(file.fd(), buffer, sizeof(buffer), &bytes_read));
        ASSERT_EQ(std::string(buffer, bytes_read), "hello");
    }

    TEST(PAL_FD_UNIX, pal_fd_read_Short_Count_At_Eof)
    {
        temp_file file(testutils::to_bytes("abc"));
        ASSERT_TRUE(file.is_open());

        char buffer[16] = {};
        size_t bytes_read = 0;
        ASSERT_TRUE(pal_fd_read(file.fd(), buffer, sizeof(buffer), &bytes_read));
        ASSERT_EQ(bytes_read, 3u);
        ASSERT_TRUE(pal_fd_read(file.fd(), buffer, sizeof(buffer), &bytes_read));
        ASSERT_EQ(bytes_read, 0u);
    }

    TEST(PAL_FD_UNIX, pal_fd_write_Through_Pipe)
    {
        pipe_pair pipe;
        ASSERT_GE(pipe.write_fd(), 0);

        const std::string text = "streamed";
        ASSERT_TRUE(pal_fd_write(pipe.write_fd(), text.c_str(), text.size()));
        pipe.close_write();

        char buffer[32] = {};
        size_t bytes_read = 0;
        ASSERT_TRUE(pal_fd_read(pipe.read_fd(), buffer, sizeof(buffer), &bytes_read));
        ASSERT_EQ(std::string(buffer, bytes_read), text);
    }

    TEST(PAL_FD_UNIX, pal_fd_mmap_Maps_File_Content)
    {
        temp_file file(testutils::to_bytes("mapped content"));
        ASSERT_TRUE(file.is_open());

        void* addr = nullptr;
        ASSERT_TRUE(pal_fd_mmap(file.fd(), 14, &addr));
        ASSERT_NE(addr, nullptr);
        ASSERT_EQ(std::string(static_cast<const char*>(addr), 14), "mapped content");
        ASSERT_TRUE(pal_fd_munmap(addr, 14));

        ASSERT_FALSE(pal_fd_mmap(file.fd(), 0, &addr));
    }

}
