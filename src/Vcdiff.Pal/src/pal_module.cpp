#include "pal/pal.hpp"
#include "pal/pal_module.hpp"

#include <cstdlib>

pal_module::pal_module(const std::string& filename) :
    m_module(nullptr),
    m_filename(filename)
{
    char* load_error = nullptr;
    if (!pal_load_library(filename.c_str(), &m_module, &load_error))
    {
        m_module = nullptr;
        m_load_error = load_error == nullptr ? std::string("unknown error") : std::string(load_error);
        free(load_error);
    }
}

pal_module::~pal_module()
{
    const auto ptr = m_module;
    if (ptr != nullptr)
    {
        pal_free_library(ptr);
        m_module = nullptr;
    }
}

bool pal_module::is_loaded() const
{
    return m_module != nullptr;
}

const std::string& pal_module::get_filename() const
{
    return m_filename;
}

const std::string& pal_module::get_load_error() const
{
    return m_load_error;
}

void* pal_module::_bind(const std::string& fn)
{
    if (!this->is_loaded())
    {
        LOGE << "Failed to bind symbol because module is not loaded. Symbol: " << fn << ". Module: " << get_filename();
        return nullptr;
    }

    void* ptr_fn = nullptr;
    if (!pal_getprocaddress(m_module, fn.c_str(), &ptr_fn) || ptr_fn == nullptr)
    {
        LOGE << "Failed to bind symbol: " << fn << ". Module: " << get_filename();
        return nullptr;
    }
    return ptr_fn;
}
