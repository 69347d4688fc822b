#pragma once

#include "vcdiff/endpoint.hpp"

#include <string>

namespace vcdiff {

    // The two-operation contract every codec satisfies. Overloads without an
    // output return the result, the others write it to the output stream.
    class backend
    {
    public:
        virtual ~backend() = default;

        virtual const std::string& id() const = 0;

        virtual bytes diff(const endpoint& source, const endpoint& target) = 0;
        virtual void diff(const endpoint& source, const endpoint& target, const endpoint& output) = 0;

        virtual bytes patch(const endpoint& source, const endpoint& delta) = 0;
        virtual void patch(const endpoint& source, const endpoint& delta, const endpoint& output) = 0;
    };

}
