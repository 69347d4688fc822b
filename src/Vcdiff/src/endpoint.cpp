#include "vcdiff/endpoint.hpp"
#include "vcdiff/errors.hpp"
#include "pal/pal.hpp"

#include <utility>

namespace vcdiff {

    const char* to_string(const endpoint_kind kind)
    {
        switch (kind)
        {
        case endpoint_kind::buffer:
            return "buffer";
        case endpoint_kind::stream:
            return "stream";
        }
        return "unknown";
    }

    const char* to_string(const endpoint_role role)
    {
        switch (role)
        {
        case endpoint_role::source:
            return "source";
        case endpoint_role::input:
            return "input";
        case endpoint_role::output:
            return "output";
        }
        return "unknown";
    }

    endpoint::endpoint(const endpoint_kind kind, const endpoint_role role, bytes buffer, const int fd) :
        m_kind(kind),
        m_role(role),
        m_buffer(std::move(buffer)),
        m_fd(fd)
    {

    }

    endpoint endpoint::from_buffer(bytes buffer)
    {
        return endpoint(endpoint_kind::buffer, endpoint_role::input, std::move(buffer), -1);
    }

    endpoint endpoint::from_buffer(const std::string& buffer)
    {
        return from_buffer(bytes(buffer.begin(), buffer.end()));
    }

    endpoint endpoint::from_stream(const int fd, const endpoint_role role)
    {
        if (fd < 0)
        {
            throw invalid_endpoint("Invalid file descriptor for " + std::string(to_string(role)) + " stream: " + std::to_string(fd));
        }

        if (role == endpoint_role::source && !pal_fd_is_seekable(fd))
        {
            LOGE << "Source stream is not random-access. Fd: " << fd;
            throw unsuitable_source_handle("Source file descriptor " + std::to_string(fd)
                + " must be backed by a seekable or mappable file, not a pipe or socket");
        }

        return endpoint(endpoint_kind::stream, role, bytes(), fd);
    }

    endpoint_kind endpoint::kind() const
    {
        return m_kind;
    }

    endpoint_role endpoint::role() const
    {
        return m_role;
    }

    bool endpoint::is_stream() const
    {
        return m_kind == endpoint_kind::stream;
    }

    const bytes& endpoint::buffer() const
    {
        return m_buffer;
    }

    int endpoint::fd() const
    {
        return m_fd;
    }

    vcdiff_endpoint endpoint::to_abi() const
    {
        vcdiff_endpoint abi_endpoint = {};
        switch (m_kind)
        {
        case endpoint_kind::buffer:
            abi_endpoint.type = vcdiff_endpoint_type_buffer;
            abi_endpoint.data = m_buffer.data();
            abi_endpoint.size = m_buffer.size();
            abi_endpoint.fd = -1;
            break;
        case endpoint_kind::stream:
            abi_endpoint.type = vcdiff_endpoint_type_stream;
            abi_endpoint.data = nullptr;
            abi_endpoint.size = 0;
            abi_endpoint.fd = m_fd;
            break;
        }
        return abi_endpoint;
    }

    void validate_arguments(const endpoint& source, const endpoint& input, const endpoint* output)
    {
        switch (source.kind())
        {
        case endpoint_kind::buffer:
            break;
        case endpoint_kind::stream:
            if (source.role() == endpoint_role::output)
            {
                throw invalid_endpoint("An output stream cannot be used as source");
            }
            // Streams tagged with another role have not been checked yet.
            if (!pal_fd_is_seekable(source.fd()))
            {
                LOGE << "Source stream is not random-access. Fd: " << source.fd();
                throw unsuitable_source_handle("Source file descriptor " + std::to_string(source.fd())
                    + " must be backed by a seekable or mappable file, not a pipe or socket");
            }
            break;
        }

        switch (input.kind())
        {
        case endpoint_kind::buffer:
            break;
        case endpoint_kind::stream:
            if (input.role() == endpoint_role::output)
            {
                throw invalid_endpoint("An output stream cannot be used as target or delta");
            }
            break;
        }

        if (output == nullptr)
        {
            return;
        }

        switch (output->kind())
        {
        case endpoint_kind::buffer:
            throw invalid_endpoint("Output must be a stream, omit the output argument to receive a buffer");
        case endpoint_kind::stream:
            if (output->role() != endpoint_role::output)
            {
                throw invalid_endpoint("Stream used as output was created with role " + std::string(to_string(output->role())));
            }
            break;
        }
    }

}
