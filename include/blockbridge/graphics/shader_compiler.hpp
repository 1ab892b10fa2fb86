// blockbridge Graphics Abstraction Layer
// shader_compiler.hpp - GLSL to SPIR-V compilation and reflection

#pragma once

#include "types.hpp"

#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace blockbridge::graphics {

// ============================================================================
// Shader Compilation Options
// ============================================================================

struct ShaderCompileOptions {
    ShaderStage stage = ShaderStage::Vertex;
    std::string entry_point = "main";
    std::vector<std::string> defines;  // Preprocessor definitions
    std::string debug_name;            // Used in log messages only
    bool generate_debug_info = false;
    bool optimize = true;
    bool generate_reflection = true;
};

// ============================================================================
// Compiled Shader Result
// ============================================================================

struct CompiledShader {
    bool success = false;
    std::string error_message;
    std::vector<uint8_t> spirv_bytecode;
    ShaderReflection reflection;
};

// ============================================================================
// Shader Compiler
// ============================================================================

// Compiles Vulkan-flavoured GLSL 450 to SPIR-V and reflects its resource bindings
class ShaderCompiler {
public:
    ShaderCompiler();
    ~ShaderCompiler();

    // Non-copyable
    ShaderCompiler(const ShaderCompiler&) = delete;
    ShaderCompiler& operator=(const ShaderCompiler&) = delete;

    // Move-only
    ShaderCompiler(ShaderCompiler&&) noexcept;
    ShaderCompiler& operator=(ShaderCompiler&&) noexcept;

    // Compile GLSL source to SPIR-V; failures are reported through CompiledShader::success
    [[nodiscard]] CompiledShader compile_glsl(std::string_view source, const ShaderCompileOptions& options);

    // Extract reflection data from SPIR-V bytecode
    [[nodiscard]] std::optional<ShaderReflection> reflect_spirv(std::span<const uint8_t> spirv, ShaderStage stage);

    // Number of successful compilations performed by this instance
    [[nodiscard]] size_t get_compiled_count() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

// Get human-readable name for shader stage
[[nodiscard]] const char* shader_stage_name(ShaderStage stage);

}  // namespace blockbridge::graphics
