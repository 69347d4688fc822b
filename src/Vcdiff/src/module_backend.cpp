#include "vcdiff/module_backend.hpp"
#include "vcdiff/errors.hpp"
#include "pal/pal.hpp"

#include <new>
#include <string>
#include <utility>

namespace {

    void module_error_logger(void* opaque, const char* errmsg)
    {
        if (errmsg == nullptr)
        {
            return;
        }

        LOGE << "Backend error: " << errmsg;

        auto* const last_error = static_cast<std::string*>(opaque);
        if (last_error != nullptr)
        {
            *last_error = errmsg;
        }
    }

}

namespace vcdiff {

    module_backend::module_backend(std::string id, std::unique_ptr<pal_module> module,
        const vcdiff_backend_fn_t diff_fn, const vcdiff_backend_fn_t patch_fn, const vcdiff_backend_fn_t free_fn) :
        m_id(std::move(id)),
        m_module(std::move(module)),
        m_diff(diff_fn),
        m_patch(patch_fn),
        m_free(free_fn)
    {

    }

    module_backend::~module_backend() = default;

    std::unique_ptr<module_backend> module_backend::load(const std::string& id, const std::string& filename)
    {
        auto module = std::make_unique<pal_module>(filename);
        if (!module->is_loaded())
        {
            throw backend_load_error(id, module->get_load_error());
        }

        vcdiff_backend_fn_t diff_fn = nullptr;
        vcdiff_backend_fn_t patch_fn = nullptr;
        vcdiff_backend_fn_t free_fn = nullptr;

        if (!module->try_bind(VCDIFF_BACKEND_DIFF_SYMBOL, &diff_fn))
        {
            throw backend_load_error(id, "module " + filename + " does not export " VCDIFF_BACKEND_DIFF_SYMBOL);
        }

        if (!module->try_bind(VCDIFF_BACKEND_PATCH_SYMBOL, &patch_fn))
        {
            throw backend_load_error(id, "module " + filename + " does not export " VCDIFF_BACKEND_PATCH_SYMBOL);
        }

        if (!module->try_bind(VCDIFF_BACKEND_FREE_SYMBOL, &free_fn))
        {
            throw backend_load_error(id, "module " + filename + " does not export " VCDIFF_BACKEND_FREE_SYMBOL);
        }

        LOGD << "Loaded backend module: " << filename << ". Backend: " << id;

        return std::unique_ptr<module_backend>(new module_backend(id, std::move(module), diff_fn, patch_fn, free_fn));
    }

    const std::string& module_backend::id() const
    {
        return m_id;
    }

    bytes module_backend::diff(const endpoint& source, const endpoint& target)
    {
        return invoke(m_diff, "diff", source, target, nullptr);
    }

    void module_backend::diff(const endpoint& source, const endpoint& target, const endpoint& output)
    {
        invoke(m_diff, "diff", source, target, &output);
    }

    bytes module_backend::patch(const endpoint& source, const endpoint& delta)
    {
        return invoke(m_patch, "patch", source, delta, nullptr);
    }

    void module_backend::patch(const endpoint& source, const endpoint& delta, const endpoint& output)
    {
        invoke(m_patch, "patch", source, delta, &output);
    }

    bytes module_backend::invoke(const vcdiff_backend_fn_t fn, const char* operation,
        const endpoint& source, const endpoint& input, const endpoint* output)
    {
        validate_arguments(source, input, output);

        std::string last_error;

        vcdiff_backend_ctx ctx = {};
        ctx.error_logger = &module_error_logger;
        ctx.error_logger_opaque = &last_error;
        ctx.source = source.to_abi();
        ctx.input = input.to_abi();
        ctx.output.type = vcdiff_endpoint_type_buffer;
        ctx.output.fd = -1;
        if (output != nullptr)
        {
            ctx.output = output->to_abi();
        }
        ctx.result = nullptr;
        ctx.result_size = 0;
        ctx.status = vcdiff_status_type_success;

        if (!fn(&ctx))
        {
            const auto status = ctx.status == vcdiff_status_type_success ? vcdiff_status_type_error : ctx.status;
            m_free(&ctx);

            if (last_error.empty())
            {
                last_error = m_id + " " + operation + " failed with status " + std::to_string(status);
            }

            if (status == vcdiff_status_type_unsuitable_source)
            {
                throw unsuitable_source_handle(last_error);
            }

            throw backend_operation_error(m_id, status, last_error);
        }

        bytes result;
        if (output == nullptr && ctx.result != nullptr)
        {
            try
            {
                result.assign(ctx.result, ctx.result + ctx.result_size);
            }
            catch (const std::bad_alloc&)
            {
                m_free(&ctx);
                throw;
            }
        }

        m_free(&ctx);

        return result;
    }

}
