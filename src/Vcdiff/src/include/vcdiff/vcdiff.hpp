#pragma once

#include "vcdiff/backend.hpp"
#include "vcdiff/endpoint.hpp"
#include "vcdiff/errors.hpp"
#include "vcdiff/registry.hpp"

#include <string>

namespace vcdiff {

    // Resolve a backend and dispatch to it. Arguments are forwarded as is and
    // backend errors propagate unchanged. The overloads without a registry
    // use registry::instance().

    bytes diff(const endpoint& source, const endpoint& target);
    void diff(const endpoint& source, const endpoint& target, const endpoint& output);
    bytes patch(const endpoint& source, const endpoint& delta);
    void patch(const endpoint& source, const endpoint& delta, const endpoint& output);
    std::string which_backend();
    void set_backend_override(const std::string& id);

    bytes diff(registry& context, const endpoint& source, const endpoint& target);
    void diff(registry& context, const endpoint& source, const endpoint& target, const endpoint& output);
    bytes patch(registry& context, const endpoint& source, const endpoint& delta);
    void patch(registry& context, const endpoint& source, const endpoint& delta, const endpoint& output);

}
