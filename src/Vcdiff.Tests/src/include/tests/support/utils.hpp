#pragma once

#include "pal/pal.hpp"
#include "nanoid/nanoid.h"

#include <cstdint>
#include <cstdlib>
#include <string>
#include <vector>

#include <fcntl.h>
#include <unistd.h>

namespace vcdiff
{
    namespace support
    {
        namespace util
        {
            // A scratch file in the working directory, removed on destruction.
            class temp_file
            {
                std::string m_filename;
                int m_fd;

            public:
                temp_file() = delete;
                temp_file(const temp_file&) = delete;
                temp_file& operator=(const temp_file&) = delete;

                explicit temp_file(const std::vector<uint8_t>& content) :
                    m_filename(build_filename()),
                    m_fd(open(m_filename.c_str(), O_RDWR | O_CREAT | O_TRUNC, 0600))
                {
                    if (m_fd >= 0)
                    {
                        const auto* const data = reinterpret_cast<const char*>(content.data());
                        if (!pal_fd_write(m_fd, data, content.size())
                            || lseek(m_fd, 0, SEEK_SET) != 0)
                        {
                            close(m_fd);
                            m_fd = -1;
                        }
                    }
                }

                ~temp_file()
                {
                    if (m_fd >= 0)
                    {
                        close(m_fd);
                    }
                    pal_fs_rmfile(m_filename.c_str());
                }

                int fd() const
                {
                    return m_fd;
                }

                bool is_open() const
                {
                    return m_fd >= 0;
                }

                const std::string& filename() const
                {
                    return m_filename;
                }

                // Whole file content, independent of the current offset.
                std::vector<uint8_t> read_all() const
                {
                    std::vector<uint8_t> content;
                    uint64_t size = 0;
                    if (m_fd < 0 || !pal_fd_get_size(m_fd, &size))
                    {
                        return content;
                    }

                    content.resize(static_cast<size_t>(size));
                    size_t bytes_read = 0;
                    if (size > 0
                        && !pal_fd_pread(m_fd, reinterpret_cast<char*>(content.data()), content.size(), 0, &bytes_read))
                    {
                        content.clear();
                        return content;
                    }
                    content.resize(bytes_read);
                    return content;
                }

            private:
                static std::string build_filename()
                {
                    char* working_dir = nullptr;
                    if (!pal_process_get_cwd(&working_dir))
                    {
                        return nanoid::generate() + ".tmp";
                    }

                    char* filename = nullptr;
                    const auto combined = pal_path_combine(working_dir, (nanoid::generate() + ".tmp").c_str(), &filename);
                    free(working_dir);
                    if (!combined)
                    {
                        return nanoid::generate() + ".tmp";
                    }

                    std::string filename_str(filename);
                    free(filename);
                    return filename_str;
                }
            };

            // Both ends of an anonymous pipe, closed on destruction.
            class pipe_pair
            {
                int m_fds[2];

            public:
                pipe_pair() : m_fds{ -1, -1 }
                {
                    if (pipe(m_fds) != 0)
                    {
                        m_fds[0] = -1;
                        m_fds[1] = -1;
                    }
                }

                pipe_pair(const pipe_pair&) = delete;
                pipe_pair& operator=(const pipe_pair&) = delete;

                ~pipe_pair()
                {
                    close_read();
                    close_write();
                }

                int read_fd() const
                {
                    return m_fds[0];
                }

                int write_fd() const
                {
                    return m_fds[1];
                }

                void close_read()
                {
                    if (m_fds[0] >= 0)
                    {
                        close(m_fds[0]);
                        m_fds[0] = -1;
                    }
                }

                void close_write()
                {
                    if (m_fds[1] >= 0)
                    {
                        close(m_fds[1]);
                        m_fds[1] = -1;
                    }
                }
            };

            class test_utils
            {
            public:
                static std::vector<uint8_t> to_bytes(const std::string& str)
                {
                    return std::vector<uint8_t>(str.begin(), str.end());
                }

                static std::string to_string(const std::vector<uint8_t>& bytes)
                {
                    return std::string(bytes.begin(), bytes.end());
                }

                static std::string build_random_str()
                {
                    return nanoid::generate();
                }

                static std::string build_random_filename(const std::string& ext = ".txt")
                {
                    return build_random_str() + ext;
                }

                static std::string path_combine(const std::string& path1, const std::string& path2)
                {
                    char* path_combined = nullptr;
                    if (!pal_path_combine(path1.c_str(), path2.c_str(), &path_combined))
                    {
                        return std::string();
                    }
                    std::string path_combined_str(path_combined);
                    free(path_combined);
                    return path_combined_str;
                }

                static std::string get_process_cwd()
                {
                    char* working_dir = nullptr;
                    if (!pal_process_get_cwd(&working_dir))
                    {
                        return std::string();
                    }
                    std::string working_dir_str(working_dir);
                    free(working_dir);
                    return working_dir_str;
                }
            };
        }
    }
}
