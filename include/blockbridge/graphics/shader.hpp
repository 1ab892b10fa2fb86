// blockbridge Graphics Abstraction Layer
// shader.hpp - GPU shader interface

#pragma once

#include "types.hpp"

#include <string>

namespace blockbridge::graphics {

// Abstract GPU shader module
// Implemented by the host backend
class Shader {
public:
    virtual ~Shader() = default;

    // Non-copyable
    Shader(const Shader&) = delete;
    Shader& operator=(const Shader&) = delete;

    // Properties
    [[nodiscard]] virtual ShaderStage get_stage() const = 0;
    [[nodiscard]] virtual const std::string& get_entry_point() const = 0;

protected:
    Shader() = default;
};

}  // namespace blockbridge::graphics
