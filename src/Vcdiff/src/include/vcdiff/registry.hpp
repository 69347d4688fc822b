#pragma once

#include "vcdiff/backend.hpp"

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace vcdiff {

    using backend_factory = std::function<std::unique_ptr<backend>(const std::string& id)>;

    struct registry_options
    {
        // Probed in order when nothing is selected or already loaded.
        std::vector<std::string> candidates;
        // Test-support backends, never adopted by already-loaded detection.
        std::vector<std::string> reserved;
        // Directory backend modules are loaded from. Empty uses the dynamic
        // linker search path.
        std::string module_directory;

        registry_options();

        // Reads VCDIFF_BACKEND_PATH.
        static registry_options from_environment();
    };

    // Resolves which backend services a call and caches the answer. All
    // members are safe to call from several threads.
    class registry
    {
        registry_options m_options;
        std::map<std::string, backend_factory> m_factories;
        std::map<std::string, std::unique_ptr<backend>> m_loaded;
        std::string m_selected;
        backend* m_active;
        mutable std::mutex m_mutex;

    public:
        static constexpr const char* id_namespace = "vcdiff";

        explicit registry(registry_options options = registry_options());
        registry(const registry&) = delete;
        registry& operator=(const registry&) = delete;

        // Options come from the environment and VCDIFF_BACKEND, when set, is
        // the initial override.
        static std::unique_ptr<registry> from_environment();

        // Process-wide registry built by from_environment().
        static registry& instance();

        const registry_options& options() const;

        // Registers an in-process backend, used instead of a module lookup.
        void add(const std::string& id, backend_factory factory);

        // Loads id, or returns it when already loaded. Throws backend_load_error.
        backend& load(const std::string& id);
        bool is_loaded(const std::string& id) const;
        std::vector<std::string> loaded_backends() const;

        // Empty id clears the override so the next call resolves again.
        void set_backend_override(const std::string& id);
        std::string backend_override() const;

        // Throws backend_load_error for a failing override and
        // no_backend_available when nothing can be found.
        backend& resolve();
        std::string which_backend();

        std::string module_filename(const std::string& id) const;

    private:
        backend& load_unlocked(const std::string& id);
        backend* find_already_loaded_unlocked();
        bool is_reserved(const std::string& id) const;
    };

    // Sets an override for the lifetime of the guard, then restores the
    // previous selection, also when the scope is left by an exception.
    class scoped_backend_override final
    {
        registry& m_registry;
        std::string m_previous;

    public:
        explicit scoped_backend_override(const std::string& id);
        scoped_backend_override(registry& context, const std::string& id);
        scoped_backend_override(const scoped_backend_override&) = delete;
        scoped_backend_override& operator=(const scoped_backend_override&) = delete;
        // Never throws, a failed restore is logged.
        ~scoped_backend_override();
    };

    bool parse_backend_id(const std::string& id, std::string* id_namespace_out, std::string* name_out);

}
