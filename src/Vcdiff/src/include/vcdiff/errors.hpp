#pragma once

#include "vcdiff/abi.h"

#include <stdexcept>
#include <string>
#include <utility>

namespace vcdiff {

    class error : public std::runtime_error
    {
    public:
        explicit error(const std::string& what) : std::runtime_error(what)
        {

        }
    };

    // No override, nothing loaded and no candidate module could be loaded.
    class no_backend_available final : public error
    {
    public:
        explicit no_backend_available(const std::string& what) : error(what)
        {

        }
    };

    class backend_load_error final : public error
    {
        std::string m_backend_id;

    public:
        backend_load_error(std::string backend_id, const std::string& reason) :
            error("Unable to load vcdiff backend " + backend_id + ": " + reason),
            m_backend_id(std::move(backend_id))
        {

        }

        const std::string& backend_id() const
        {
            return m_backend_id;
        }
    };

    // A stream passed as source is not random-access (pipe, socket, tty).
    class unsuitable_source_handle final : public error
    {
    public:
        explicit unsuitable_source_handle(const std::string& what) : error(what)
        {

        }
    };

    class invalid_endpoint final : public error
    {
    public:
        explicit invalid_endpoint(const std::string& what) : error(what)
        {

        }
    };

    // Raised for any failure reported by a backend. what() is the backend's
    // own diagnostic, unmodified.
    class backend_operation_error final : public error
    {
        std::string m_backend_id;
        vcdiff_status_type m_status;

    public:
        backend_operation_error(std::string backend_id, const vcdiff_status_type status, const std::string& message) :
            error(message),
            m_backend_id(std::move(backend_id)),
            m_status(status)
        {

        }

        const std::string& backend_id() const
        {
            return m_backend_id;
        }

        vcdiff_status_type status() const
        {
            return m_status;
        }
    };

}
