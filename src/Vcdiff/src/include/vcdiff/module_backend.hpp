#pragma once

#include "vcdiff/abi.h"
#include "vcdiff/backend.hpp"

#include <memory>
#include <string>

class pal_module;

namespace vcdiff {

    // Adapts a loaded backend module (vcdiff/abi.h) to the backend class.
    class module_backend final : public backend
    {
        std::string m_id;
        std::unique_ptr<pal_module> m_module;
        vcdiff_backend_fn_t m_diff;
        vcdiff_backend_fn_t m_patch;
        vcdiff_backend_fn_t m_free;

        module_backend(std::string id, std::unique_ptr<pal_module> module,
            vcdiff_backend_fn_t diff_fn, vcdiff_backend_fn_t patch_fn, vcdiff_backend_fn_t free_fn);

    public:
        module_backend(const module_backend&) = delete;
        module_backend& operator=(const module_backend&) = delete;
        ~module_backend() override;

        // Loads filename and binds the contract symbols. Throws backend_load_error.
        static std::unique_ptr<module_backend> load(const std::string& id, const std::string& filename);

        const std::string& id() const override;

        bytes diff(const endpoint& source, const endpoint& target) override;
        void diff(const endpoint& source, const endpoint& target, const endpoint& output) override;

        bytes patch(const endpoint& source, const endpoint& delta) override;
        void patch(const endpoint& source, const endpoint& delta, const endpoint& output) override;

    private:
        bytes invoke(vcdiff_backend_fn_t fn, const char* operation,
            const endpoint& source, const endpoint& input, const endpoint* output);
    };

}
