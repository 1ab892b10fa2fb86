// blockbridge Graphics Abstraction Layer
// pipeline.hpp - Render pipeline and bind group interfaces

#pragma once

#include "types.hpp"

namespace blockbridge::graphics {

// Abstract render pipeline class
// Implemented by the host backend
class Pipeline {
public:
    virtual ~Pipeline() = default;

    // Non-copyable
    Pipeline(const Pipeline&) = delete;
    Pipeline& operator=(const Pipeline&) = delete;

    // Properties
    [[nodiscard]] virtual PrimitiveTopology get_topology() const = 0;

protected:
    Pipeline() = default;
};

// Shape of one bind group slot (which bindings, which resource kinds)
class BindGroupLayout {
public:
    virtual ~BindGroupLayout() = default;

    // Non-copyable
    BindGroupLayout(const BindGroupLayout&) = delete;
    BindGroupLayout& operator=(const BindGroupLayout&) = delete;

    [[nodiscard]] virtual const std::vector<BindGroupLayoutEntry>& get_entries() const = 0;

protected:
    BindGroupLayout() = default;
};

// Concrete resources bound against a BindGroupLayout
class BindGroup {
public:
    virtual ~BindGroup() = default;

    // Non-copyable
    BindGroup(const BindGroup&) = delete;
    BindGroup& operator=(const BindGroup&) = delete;

    [[nodiscard]] virtual const BindGroupLayout* get_layout() const = 0;

protected:
    BindGroup() = default;
};

}  // namespace blockbridge::graphics
