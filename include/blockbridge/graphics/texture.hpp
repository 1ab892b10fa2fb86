// blockbridge Graphics Abstraction Layer
// texture.hpp - GPU texture interface

#pragma once

#include "types.hpp"

namespace blockbridge::graphics {

// Abstract GPU texture class (2D only)
// Implemented by the host backend
class Texture {
public:
    virtual ~Texture() = default;

    // Non-copyable
    Texture(const Texture&) = delete;
    Texture& operator=(const Texture&) = delete;

    // Properties
    [[nodiscard]] virtual TextureFormat get_format() const = 0;
    [[nodiscard]] virtual uint32_t get_width() const = 0;
    [[nodiscard]] virtual uint32_t get_height() const = 0;
    [[nodiscard]] virtual TextureUsage get_usage() const = 0;

protected:
    Texture() = default;
};

}  // namespace blockbridge::graphics
