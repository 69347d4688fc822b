#include "vcdiff/registry.hpp"
#include "vcdiff/errors.hpp"
#include "vcdiff/module_backend.hpp"
#include "pal/pal.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <exception>
#include <memory>
#include <utility>

namespace vcdiff {

    registry_options::registry_options() :
        candidates({ "vcdiff/xdelta3", "vcdiff/openvcdiff" }),
        reserved({ "vcdiff/test" })
    {

    }

    registry_options registry_options::from_environment()
    {
        registry_options options;

        char* module_directory = nullptr;
        if (pal_env_get("VCDIFF_BACKEND_PATH", &module_directory))
        {
            if (!pal_str_is_null_or_whitespace(module_directory))
            {
                options.module_directory = module_directory;
            }
            free(module_directory);
        }

        return options;
    }

    bool parse_backend_id(const std::string& id, std::string* id_namespace_out, std::string* name_out)
    {
        const auto separator_pos = id.find('/');
        if (separator_pos == std::string::npos
            || separator_pos == 0
            || separator_pos + 1 == id.size())
        {
            return false;
        }

        const auto id_namespace = id.substr(0, separator_pos);
        const auto name = id.substr(separator_pos + 1);

        // The name becomes part of a file name.
        const auto valid_char = [](const char c)
        {
            return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-';
        };

        if (!std::all_of(id_namespace.begin(), id_namespace.end(), valid_char)
            || !std::all_of(name.begin(), name.end(), valid_char))
        {
            return false;
        }

        if (id_namespace_out != nullptr)
        {
            *id_namespace_out = id_namespace;
        }
        if (name_out != nullptr)
        {
            *name_out = name;
        }
        return true;
    }

    registry::registry(registry_options options) :
        m_options(std::move(options)),
        m_active(nullptr)
    {

    }

    std::unique_ptr<registry> registry::from_environment()
    {
        std::unique_ptr<registry> r(new registry(registry_options::from_environment()));

        char* backend_id = nullptr;
        if (pal_env_get("VCDIFF_BACKEND", &backend_id))
        {
            if (!pal_str_is_null_or_whitespace(backend_id))
            {
                LOGD << "Backend override from environment: " << backend_id;
                r->set_backend_override(backend_id);
            }
            free(backend_id);
        }

        return r;
    }

    registry& registry::instance()
    {
        // Never destroyed, backend modules stay mapped until the process exits.
        static auto* const process_registry = from_environment().release();
        return *process_registry;
    }

    const registry_options& registry::options() const
    {
        return m_options;
    }

    void registry::add(const std::string& id, backend_factory factory)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_factories[id] = std::move(factory);
    }

    backend& registry::load(const std::string& id)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return load_unlocked(id);
    }

    bool registry::is_loaded(const std::string& id) const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_loaded.find(id) != m_loaded.end();
    }

    std::vector<std::string> registry::loaded_backends() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        std::vector<std::string> ids;
        for (const auto& loaded : m_loaded)
        {
            ids.emplace_back(loaded.first);
        }
        return ids;
    }

    void registry::set_backend_override(const std::string& id)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (id == m_selected)
        {
            return;
        }

        LOGD << "Backend override changed from '" << m_selected << "' to '" << id << "'";

        m_selected = id;
        m_active = nullptr;
    }

    std::string registry::backend_override() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_selected;
    }

    backend& registry::resolve()
    {
        std::lock_guard<std::mutex> lock(m_mutex);

        if (m_active != nullptr)
        {
            return *m_active;
        }

        // 1. Explicit override, no fallback.
        if (!m_selected.empty())
        {
            m_active = &load_unlocked(m_selected);
            return *m_active;
        }

        // 2. Something already loaded by the caller.
        auto* const already_loaded = find_already_loaded_unlocked();
        if (already_loaded != nullptr)
        {
            LOGD << "Adopting already loaded backend: " << already_loaded->id();
            m_selected = already_loaded->id();
            m_active = already_loaded;
            return *m_active;
        }

        // 3. Probe candidates in priority order.
        std::string failures;
        for (const auto& candidate : m_options.candidates)
        {
            try
            {
                auto& candidate_backend = load_unlocked(candidate);
                LOGI << "Resolved vcdiff backend: " << candidate;
                m_selected = candidate;
                m_active = &candidate_backend;
                return *m_active;
            }
            catch (const backend_load_error& e)
            {
                LOGD << "Backend candidate unavailable: " << e.what();
                failures += failures.empty() ? candidate : ", " + candidate;
            }
        }

        // 4. Exhausted.
        LOGE << "No vcdiff backend could be loaded. Tried: " << failures;
        throw no_backend_available("Unable to find any vcdiff backend modules, at least one backend module must be installed"
            + (failures.empty() ? std::string() : " (tried " + failures + ")"));
    }

    std::string registry::which_backend()
    {
        return resolve().id();
    }

    std::string registry::module_filename(const std::string& id) const
    {
        std::string name;
        if (!parse_backend_id(id, nullptr, &name))
        {
            return std::string();
        }

        const auto filename = std::string(PAL_LIBRARY_PREFIX) + id_namespace + "_" + name + PAL_LIBRARY_SUFFIX;
        if (m_options.module_directory.empty())
        {
            return filename;
        }

        char* path = nullptr;
        if (!pal_path_combine(m_options.module_directory.c_str(), filename.c_str(), &path))
        {
            return std::string();
        }

        std::string path_str(path);
        free(path);
        return path_str;
    }

    backend& registry::load_unlocked(const std::string& id)
    {
        const auto loaded = m_loaded.find(id);
        if (loaded != m_loaded.end())
        {
            return *loaded->second;
        }

        std::unique_ptr<backend> instance;

        const auto factory = m_factories.find(id);
        if (factory != m_factories.end())
        {
            try
            {
                instance = factory->second(id);
            }
            catch (const backend_load_error&)
            {
                throw;
            }
            catch (const std::exception& e)
            {
                throw backend_load_error(id, e.what());
            }

            if (instance == nullptr)
            {
                throw backend_load_error(id, "factory returned no backend");
            }
        }
        else
        {
            std::string id_namespace_str;
            if (!parse_backend_id(id, &id_namespace_str, nullptr)
                || id_namespace_str != id_namespace)
            {
                throw backend_load_error(id, "identifier must have the form " + std::string(id_namespace) + "/<name>");
            }

            const auto filename = module_filename(id);
            if (filename.empty())
            {
                throw backend_load_error(id, "unable to build module path in " + m_options.module_directory);
            }

            instance = module_backend::load(id, filename);
        }

        auto& instance_ref = *instance;
        m_loaded.emplace(id, std::move(instance));
        return instance_ref;
    }

    backend* registry::find_already_loaded_unlocked()
    {
        // std::map iterates in identifier order, which is the tie-break.
        for (const auto& loaded : m_loaded)
        {
            if (!is_reserved(loaded.first))
            {
                return loaded.second.get();
            }
        }

        // Candidate modules the dynamic linker already mapped, e.g. linked
        // directly into the executable.
        for (const auto& candidate : m_options.candidates)
        {
            if (is_reserved(candidate)
                || m_factories.find(candidate) != m_factories.end())
            {
                continue;
            }

            const auto filename = module_filename(candidate);
            if (filename.empty()
                || !pal_is_library_loaded(filename.c_str()))
            {
                continue;
            }

            try
            {
                return &load_unlocked(candidate);
            }
            catch (const backend_load_error& e)
            {
                LOGW << "Backend module is mapped but unusable: " << e.what();
            }
        }

        return nullptr;
    }

    bool registry::is_reserved(const std::string& id) const
    {
        return std::find(m_options.reserved.begin(), m_options.reserved.end(), id) != m_options.reserved.end();
    }

    scoped_backend_override::scoped_backend_override(const std::string& id) :
        scoped_backend_override(registry::instance(), id)
    {

    }

    scoped_backend_override::scoped_backend_override(registry& context, const std::string& id) :
        m_registry(context),
        m_previous(context.backend_override())
    {
        m_registry.set_backend_override(id);
    }

    scoped_backend_override::~scoped_backend_override()
    {
        try
        {
            m_registry.set_backend_override(m_previous);
        }
        catch (const std::exception& e)
        {
            LOGE << "Failed to restore backend override '" << m_previous << "': " << e.what();
        }
    }

}
