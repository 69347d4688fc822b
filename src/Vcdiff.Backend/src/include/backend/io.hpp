#pragma once

#include "vcdiff/abi.h"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

// Endpoint plumbing shared by the backend modules. Nothing in here throws
// across the module boundary, failures are reported with bool returns.

namespace vcdiff {
namespace backend_io {

    // Block size used when reading source and input data.
    constexpr size_t block_size = 64 * 1024;

    // Sets p_ctx->status, forwards message to the host and returns 0.
    int32_t fail(vcdiff_backend_ctx* p_ctx, vcdiff_status_type status, const std::string& message);
    // Same, with strerror(error_number) appended when error_number is set.
    int32_t fail(vcdiff_backend_ctx* p_ctx, vcdiff_status_type status, const std::string& message, int error_number);

    // "message: <strerror>", or message alone when error_number is 0.
    std::string with_error_number(const std::string& message, int error_number);

    // Checks the pointers and endpoint types before any work is done.
    bool validate_ctx(vcdiff_backend_ctx* p_ctx);

    // Releases a result allocated by output_writer::commit.
    int32_t release(vcdiff_backend_ctx* p_ctx);

    // Reads an input endpoint front to back.
    class input_reader
    {
        const vcdiff_endpoint& m_endpoint;
        size_t m_offset;
        bool m_eof;
        int m_last_errno;

    public:
        explicit input_reader(const vcdiff_endpoint& endpoint);

        // A short read means end of input was reached.
        bool read(uint8_t* buffer, size_t buffer_len, size_t* bytes_read_out);
        bool read_all(std::vector<uint8_t>* bytes_out);
        bool eof() const;
        // errno of the last failed read, 0 when none failed.
        int last_errno() const;
    };

    // Random access to the source endpoint. A stream source is read with
    // pread and its file offset is never moved.
    class source_reader
    {
        const vcdiff_endpoint& m_endpoint;
        uint64_t m_size;
        void* m_mapping;
        size_t m_mapping_size;
        int m_last_errno;

    public:
        explicit source_reader(const vcdiff_endpoint& endpoint);
        source_reader(const source_reader&) = delete;
        source_reader& operator=(const source_reader&) = delete;
        ~source_reader();

        // Fails with unsuitable_source when a stream is not random-access.
        vcdiff_status_type open();
        uint64_t size() const;
        bool read_at(uint64_t offset, uint8_t* buffer, size_t buffer_len, size_t* bytes_read_out);
        // Whole source as one contiguous range. Stream sources are mapped
        // and unmapped again when the reader goes out of scope.
        bool map(const uint8_t** data_out);
        int last_errno() const;
    };

    // Writes to the output stream or collects the result in memory.
    class output_writer
    {
        const vcdiff_endpoint& m_endpoint;
        bool m_to_stream;
        std::vector<uint8_t> m_buffer;
        uint64_t m_bytes_written;
        int m_last_errno;

    public:
        output_writer(const vcdiff_endpoint& endpoint, bool to_stream);

        bool write(const uint8_t* data, size_t data_len);
        uint64_t bytes_written() const;
        // Hands the collected bytes to p_ctx->result. A no-op for streams.
        bool commit(vcdiff_backend_ctx* p_ctx);
        int last_errno() const;
    };

    bool output_is_stream(const vcdiff_backend_ctx* p_ctx);

}
}
