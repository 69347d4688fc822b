#include "backend/io.hpp"
#include "pal/pal.hpp"

#include <cerrno>
#include <cstring>
#include <new>

namespace vcdiff {
namespace backend_io {

    int32_t fail(vcdiff_backend_ctx* p_ctx, const vcdiff_status_type status, const std::string& message)
    {
        if (p_ctx == nullptr)
        {
            return 0;
        }

        p_ctx->status = status == vcdiff_status_type_success ? vcdiff_status_type_error : status;

        if (p_ctx->error_logger != nullptr)
        {
            p_ctx->error_logger(p_ctx->error_logger_opaque, message.c_str());
        }

        return 0;
    }

    int32_t fail(vcdiff_backend_ctx* p_ctx, const vcdiff_status_type status, const std::string& message, const int error_number)
    {
        return fail(p_ctx, status, with_error_number(message, error_number));
    }

    std::string with_error_number(const std::string& message, const int error_number)
    {
        if (error_number == 0)
        {
            return message;
        }

        return message + ": " + std::strerror(error_number);
    }

    bool validate_ctx(vcdiff_backend_ctx* p_ctx)
    {
        if (p_ctx == nullptr)
        {
            return false;
        }

        if (p_ctx->result != nullptr
            || p_ctx->result_size != 0)
        {
            fail(p_ctx, vcdiff_status_type_invalid_arg, "Result must be empty before the call");
            return false;
        }

        const vcdiff_endpoint* endpoints[] = { &p_ctx->source, &p_ctx->input };
        for (const auto* endpoint : endpoints)
        {
            switch (endpoint->type)
            {
            case vcdiff_endpoint_type_buffer:
                if (endpoint->data == nullptr && endpoint->size > 0)
                {
                    fail(p_ctx, vcdiff_status_type_invalid_arg, "Buffer endpoint has a size but no data");
                    return false;
                }
                break;
            case vcdiff_endpoint_type_stream:
                if (endpoint->fd < 0)
                {
                    fail(p_ctx, vcdiff_status_type_invalid_arg, "Stream endpoint has an invalid file descriptor");
                    return false;
                }
                break;
            default:
                fail(p_ctx, vcdiff_status_type_invalid_arg, "Unknown endpoint type");
                return false;
            }
        }

        if (p_ctx->output.type == vcdiff_endpoint_type_stream
            && p_ctx->output.fd < 0)
        {
            fail(p_ctx, vcdiff_status_type_invalid_arg, "Output stream has an invalid file descriptor");
            return false;
        }

        p_ctx->status = vcdiff_status_type_success;
        return true;
    }

    int32_t release(vcdiff_backend_ctx* p_ctx)
    {
        if (p_ctx == nullptr)
        {
            return 0;
        }

        if (p_ctx->result != nullptr)
        {
            delete[] p_ctx->result;
            p_ctx->result = nullptr;
            p_ctx->result_size = 0;
        }

        return 1;
    }

    bool output_is_stream(const vcdiff_backend_ctx* p_ctx)
    {
        return p_ctx != nullptr && p_ctx->output.type == vcdiff_endpoint_type_stream;
    }

    // - input_reader

    input_reader::input_reader(const vcdiff_endpoint& endpoint) :
        m_endpoint(endpoint),
        m_offset(0),
        m_eof(false),
        m_last_errno(0)
    {

    }

    bool input_reader::read(uint8_t* buffer, const size_t buffer_len, size_t* bytes_read_out)
    {
        if (buffer == nullptr
            || bytes_read_out == nullptr)
        {
            return false;
        }

        *bytes_read_out = 0;

        if (m_eof)
        {
            return true;
        }

        switch (m_endpoint.type)
        {
        case vcdiff_endpoint_type_buffer:
        {
            const auto remaining = m_endpoint.size - m_offset;
            const auto count = remaining < buffer_len ? remaining : buffer_len;
            if (count > 0)
            {
                std::memcpy(buffer, m_endpoint.data + m_offset, count);
            }
            m_offset += count;
            *bytes_read_out = count;
            break;
        }
        case vcdiff_endpoint_type_stream:
            errno = 0;
            if (!pal_fd_read(m_endpoint.fd, reinterpret_cast<char*>(buffer), buffer_len, bytes_read_out))
            {
                m_last_errno = errno;
                return false;
            }
            m_offset += *bytes_read_out;
            break;
        default:
            return false;
        }

        if (*bytes_read_out < buffer_len)
        {
            m_eof = true;
        }

        return true;
    }

    bool input_reader::read_all(std::vector<uint8_t>* bytes_out)
    {
        if (bytes_out == nullptr)
        {
            return false;
        }

        std::vector<uint8_t> block(block_size);
        while (!m_eof)
        {
            size_t bytes_read = 0;
            if (!read(block.data(), block.size(), &bytes_read))
            {
                return false;
            }
            bytes_out->insert(bytes_out->end(), block.begin(), block.begin() + bytes_read);
        }

        return true;
    }

    bool input_reader::eof() const
    {
        return m_eof;
    }

    int input_reader::last_errno() const
    {
        return m_last_errno;
    }

    // - source_reader

    source_reader::source_reader(const vcdiff_endpoint& endpoint) :
        m_endpoint(endpoint),
        m_size(0),
        m_mapping(nullptr),
        m_mapping_size(0),
        m_last_errno(0)
    {

    }

    source_reader::~source_reader()
    {
        if (m_mapping != nullptr)
        {
            pal_fd_munmap(m_mapping, m_mapping_size);
            m_mapping = nullptr;
        }
    }

    vcdiff_status_type source_reader::open()
    {
        switch (m_endpoint.type)
        {
        case vcdiff_endpoint_type_buffer:
            m_size = m_endpoint.size;
            return vcdiff_status_type_success;
        case vcdiff_endpoint_type_stream:
            if (!pal_fd_is_seekable(m_endpoint.fd))
            {
                return vcdiff_status_type_unsuitable_source;
            }
            errno = 0;
            if (!pal_fd_get_size(m_endpoint.fd, &m_size))
            {
                m_last_errno = errno;
                return vcdiff_status_type_io_error;
            }
            return vcdiff_status_type_success;
        default:
            return vcdiff_status_type_invalid_arg;
        }
    }

    uint64_t source_reader::size() const
    {
        return m_size;
    }

    bool source_reader::read_at(const uint64_t offset, uint8_t* buffer, const size_t buffer_len, size_t* bytes_read_out)
    {
        if (buffer == nullptr
            || bytes_read_out == nullptr)
        {
            return false;
        }

        *bytes_read_out = 0;

        if (offset >= m_size)
        {
            return true;
        }

        switch (m_endpoint.type)
        {
        case vcdiff_endpoint_type_buffer:
        {
            const auto remaining = static_cast<size_t>(m_size - offset);
            const auto count = remaining < buffer_len ? remaining : buffer_len;
            std::memcpy(buffer, m_endpoint.data + offset, count);
            *bytes_read_out = count;
            return true;
        }
        case vcdiff_endpoint_type_stream:
            errno = 0;
            if (!pal_fd_pread(m_endpoint.fd, reinterpret_cast<char*>(buffer), buffer_len, offset, bytes_read_out))
            {
                m_last_errno = errno;
                return false;
            }
            return true;
        default:
            return false;
        }
    }

    bool source_reader::map(const uint8_t** data_out)
    {
        if (data_out == nullptr)
        {
            return false;
        }

        static const uint8_t empty[1] = { 0 };

        switch (m_endpoint.type)
        {
        case vcdiff_endpoint_type_buffer:
            *data_out = m_endpoint.data != nullptr ? m_endpoint.data : empty;
            return true;
        case vcdiff_endpoint_type_stream:
            if (m_size == 0)
            {
                *data_out = empty;
                return true;
            }
            if (m_size > static_cast<uint64_t>(SIZE_MAX))
            {
                m_last_errno = EFBIG;
                return false;
            }
            if (m_mapping == nullptr)
            {
                errno = 0;
                if (!pal_fd_mmap(m_endpoint.fd, static_cast<size_t>(m_size), &m_mapping))
                {
                    m_last_errno = errno;
                    m_mapping = nullptr;
                    return false;
                }
                m_mapping_size = static_cast<size_t>(m_size);
            }
            *data_out = static_cast<const uint8_t*>(m_mapping);
            return true;
        default:
            return false;
        }
    }

    int source_reader::last_errno() const
    {
        return m_last_errno;
    }

    // - output_writer

    output_writer::output_writer(const vcdiff_endpoint& endpoint, const bool to_stream) :
        m_endpoint(endpoint),
        m_to_stream(to_stream),
        m_bytes_written(0),
        m_last_errno(0)
    {

    }

    bool output_writer::write(const uint8_t* data, const size_t data_len)
    {
        if (data_len == 0)
        {
            return true;
        }

        if (data == nullptr)
        {
            return false;
        }

        if (m_to_stream)
        {
            errno = 0;
            if (!pal_fd_write(m_endpoint.fd, reinterpret_cast<const char*>(data), data_len))
            {
                m_last_errno = errno;
                return false;
            }
        }
        else
        {
            try
            {
                m_buffer.insert(m_buffer.end(), data, data + data_len);
            }
            catch (const std::bad_alloc&)
            {
                m_last_errno = ENOMEM;
                return false;
            }
        }

        m_bytes_written += data_len;
        return true;
    }

    uint64_t output_writer::bytes_written() const
    {
        return m_bytes_written;
    }

    bool output_writer::commit(vcdiff_backend_ctx* p_ctx)
    {
        if (p_ctx == nullptr)
        {
            return false;
        }

        if (m_to_stream
            || m_buffer.empty())
        {
            return true;
        }

        auto* const result = new (std::nothrow) uint8_t[m_buffer.size()];
        if (result == nullptr)
        {
            m_last_errno = ENOMEM;
            return false;
        }

        std::memcpy(result, m_buffer.data(), m_buffer.size());
        p_ctx->result = result;
        p_ctx->result_size = m_buffer.size();

        std::vector<uint8_t>().swap(m_buffer);
        return true;
    }

    int output_writer::last_errno() const
    {
        return m_last_errno;
    }

}
}
