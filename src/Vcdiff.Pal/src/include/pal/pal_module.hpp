#pragma once

#include <string>

// Owns a handle to a dynamic library, released on destruction.
class pal_module final
{
    void* m_module;
    std::string m_filename;
    std::string m_load_error;

public:
    explicit pal_module(const std::string& filename);
    pal_module(const pal_module&) noexcept = delete;
    pal_module& operator=(const pal_module&) noexcept = delete;
    pal_module(pal_module&&) noexcept = delete;
    pal_module& operator=(pal_module&&) noexcept = delete;
    ~pal_module();

    bool is_loaded() const;
    const std::string& get_filename() const;
    // Loader diagnostic when is_loaded() is false.
    const std::string& get_load_error() const;

    template<typename T>
    bool try_bind(const std::string& fn, T* fn_out)
    {
        auto* const ptr_fn = _bind(fn);
        if (ptr_fn == nullptr)
        {
            return false;
        }
        *fn_out = reinterpret_cast<T>(ptr_fn);
        return true;
    }

private:
    void* _bind(const std::string& fn);
};
