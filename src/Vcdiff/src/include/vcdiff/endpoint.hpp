#pragma once

#include "vcdiff/abi.h"

#include <cstdint>
#include <string>
#include <vector>

namespace vcdiff {

    using bytes = std::vector<uint8_t>;

    enum class endpoint_kind
    {
        buffer,
        stream
    };

    // input is the target of a diff or the delta of a patch.
    enum class endpoint_role
    {
        source,
        input,
        output
    };

    const char* to_string(endpoint_kind kind);
    const char* to_string(endpoint_role role);

    // One argument of a diff or patch call: an owned in-memory buffer or a
    // borrowed file descriptor. The descriptor is never closed by this library.
    //
    // A source stream must be random-access; it is read by absolute offset
    // and its file offset is left untouched. Input streams are read from
    // their current offset to end of file, output streams are written at
    // their current offset. Buffers fit every role.
    class endpoint
    {
        endpoint_kind m_kind;
        endpoint_role m_role;
        bytes m_buffer;
        int m_fd;

        endpoint(endpoint_kind kind, endpoint_role role, bytes buffer, int fd);

    public:
        static endpoint from_buffer(bytes buffer);
        static endpoint from_buffer(const std::string& buffer);
        // Throws unsuitable_source_handle when role is source and fd is not
        // seekable, invalid_endpoint when fd is negative.
        static endpoint from_stream(int fd, endpoint_role role);

        endpoint_kind kind() const;
        endpoint_role role() const;
        bool is_stream() const;
        const bytes& buffer() const;
        int fd() const;

        vcdiff_endpoint to_abi() const;
    };

    // Role checks for one call, run before a backend sees the arguments so a
    // rejected call never produces partial output. output may be nullptr.
    void validate_arguments(const endpoint& source, const endpoint& input, const endpoint* output);

}
