#include "vcdiff/vcdiff.hpp"

namespace vcdiff {

    bytes diff(const endpoint& source, const endpoint& target)
    {
        return diff(registry::instance(), source, target);
    }

    void diff(const endpoint& source, const endpoint& target, const endpoint& output)
    {
        diff(registry::instance(), source, target, output);
    }

    bytes patch(const endpoint& source, const endpoint& delta)
    {
        return patch(registry::instance(), source, delta);
    }

    void patch(const endpoint& source, const endpoint& delta, const endpoint& output)
    {
        patch(registry::instance(), source, delta, output);
    }

    std::string which_backend()
    {
        return registry::instance().which_backend();
    }

    void set_backend_override(const std::string& id)
    {
        registry::instance().set_backend_override(id);
    }

    // Endpoints are validated after resolution and before any backend,
    // in-process or module, sees them.

    bytes diff(registry& context, const endpoint& source, const endpoint& target)
    {
        auto& resolved = context.resolve();
        validate_arguments(source, target, nullptr);
        return resolved.diff(source, target);
    }

    void diff(registry& context, const endpoint& source, const endpoint& target, const endpoint& output)
    {
        auto& resolved = context.resolve();
        validate_arguments(source, target, &output);
        resolved.diff(source, target, output);
    }

    bytes patch(registry& context, const endpoint& source, const endpoint& delta)
    {
        auto& resolved = context.resolve();
        validate_arguments(source, delta, nullptr);
        return resolved.patch(source, delta);
    }

    void patch(registry& context, const endpoint& source, const endpoint& delta, const endpoint& output)
    {
        auto& resolved = context.resolve();
        validate_arguments(source, delta, &output);
        resolved.patch(source, delta, output);
    }

}
