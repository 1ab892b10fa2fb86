// blockbridge Graphics Abstraction Layer
// sampler.hpp - GPU sampler interface

#pragma once

#include "types.hpp"

namespace blockbridge::graphics {

// Abstract GPU sampler class
// Implemented by the host backend
class Sampler {
public:
    virtual ~Sampler() = default;

    // Non-copyable
    Sampler(const Sampler&) = delete;
    Sampler& operator=(const Sampler&) = delete;

    // Properties
    [[nodiscard]] virtual FilterMode get_min_filter() const = 0;
    [[nodiscard]] virtual FilterMode get_mag_filter() const = 0;

protected:
    Sampler() = default;
};

}  // namespace blockbridge::graphics
