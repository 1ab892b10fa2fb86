// blockbridge Graphics Abstraction Layer
// shader_compiler.cpp - GLSL to SPIR-V compilation and reflection

#include <blockbridge/core/logger.hpp>
#include <blockbridge/graphics/shader_compiler.hpp>

#include <cstring>
#include <glslang/Public/ResourceLimits.h>
#include <glslang/Public/ShaderLang.h>
#include <glslang/SPIRV/GlslangToSpv.h>
#include <mutex>
#include <spirv_cross/spirv_cross.hpp>

namespace blockbridge::graphics {

using core::log_category::GRAPHICS;

namespace {

// Initialize glslang once per process
std::once_flag glslang_init_flag;

void initialize_glslang() {
    std::call_once(glslang_init_flag, []() { glslang::InitializeProcess(); });
}

EShLanguage to_glslang_stage(ShaderStage stage) {
    switch (stage) {
        case ShaderStage::Vertex:
            return EShLangVertex;
        case ShaderStage::Fragment:
            return EShLangFragment;
        default:
            return EShLangVertex;
    }
}

std::string member_type_name(const spirv_cross::SPIRType& member_type) {
    if (member_type.basetype == spirv_cross::SPIRType::Float) {
        if (member_type.columns == 4 && member_type.vecsize == 4) {
            return "mat4";
        }
        if (member_type.vecsize == 4) {
            return "vec4";
        }
        if (member_type.vecsize == 3) {
            return "vec3";
        }
        if (member_type.vecsize == 2) {
            return "vec2";
        }
        return "float";
    }
    if (member_type.basetype == spirv_cross::SPIRType::UInt) {
        return "uint";
    }
    if (member_type.basetype == spirv_cross::SPIRType::Int) {
        return "int";
    }
    return "unknown";
}

ShaderResourceBinding resource_binding(spirv_cross::Compiler& compiler, const spirv_cross::Resource& resource) {
    ShaderResourceBinding binding;
    binding.name = resource.name;
    binding.set = compiler.get_decoration(resource.id, spv::DecorationDescriptorSet);
    binding.binding = compiler.get_decoration(resource.id, spv::DecorationBinding);
    return binding;
}

ShaderReflection extract_reflection(spirv_cross::Compiler& compiler, ShaderStage stage) {
    ShaderReflection reflection;
    reflection.stage = stage;

    spirv_cross::ShaderResources resources = compiler.get_shader_resources();

    // Uniform buffers
    for (const auto& ubo : resources.uniform_buffers) {
        ShaderUniformBuffer uniform_buffer;
        uniform_buffer.name = ubo.name;
        uniform_buffer.set = compiler.get_decoration(ubo.id, spv::DecorationDescriptorSet);
        uniform_buffer.binding = compiler.get_decoration(ubo.id, spv::DecorationBinding);

        const auto& type = compiler.get_type(ubo.base_type_id);
        uniform_buffer.size = compiler.get_declared_struct_size(type);

        for (uint32_t i = 0; i < type.member_types.size(); ++i) {
            ShaderUniformMember member;
            member.name = compiler.get_member_name(ubo.base_type_id, i);
            member.offset = compiler.type_struct_member_offset(type, i);
            member.size = compiler.get_declared_struct_member_size(type, i);
            member.type_name = member_type_name(compiler.get_type(type.member_types[i]));
            uniform_buffer.members.push_back(member);
        }

        reflection.uniform_buffers.push_back(uniform_buffer);
    }

    // Separate textures and samplers
    for (const auto& image : resources.separate_images) {
        reflection.separate_images.push_back(resource_binding(compiler, image));
    }
    for (const auto& sampler : resources.separate_samplers) {
        reflection.separate_samplers.push_back(resource_binding(compiler, sampler));
    }

    // Stage inputs
    for (const auto& input : resources.stage_inputs) {
        ShaderStageInput stage_input;
        stage_input.name = input.name;
        stage_input.location = compiler.get_decoration(input.id, spv::DecorationLocation);
        reflection.inputs.push_back(stage_input);
    }

    // Stage outputs
    for (const auto& output : resources.stage_outputs) {
        ShaderStageInput stage_output;
        stage_output.name = output.name;
        stage_output.location = compiler.get_decoration(output.id, spv::DecorationLocation);
        reflection.outputs.push_back(stage_output);
    }

    return reflection;
}

}  // namespace

// ============================================================================
// ShaderCompiler Implementation
// ============================================================================

struct ShaderCompiler::Impl {
    size_t compiled_count = 0;
};

ShaderCompiler::ShaderCompiler() : impl_(std::make_unique<Impl>()) {
    initialize_glslang();
}

ShaderCompiler::~ShaderCompiler() = default;

ShaderCompiler::ShaderCompiler(ShaderCompiler&&) noexcept = default;
ShaderCompiler& ShaderCompiler::operator=(ShaderCompiler&&) noexcept = default;

CompiledShader ShaderCompiler::compile_glsl(std::string_view source, const ShaderCompileOptions& options) {
    CompiledShader result;
    result.reflection.stage = options.stage;
    result.reflection.entry_point = options.entry_point;

    EShLanguage glslang_stage = to_glslang_stage(options.stage);
    glslang::TShader shader(glslang_stage);

    const char* source_str = source.data();
    int source_len = static_cast<int>(source.size());
    shader.setStringsWithLengths(&source_str, &source_len, 1);
    shader.setEntryPoint(options.entry_point.c_str());
    shader.setSourceEntryPoint(options.entry_point.c_str());

    shader.setEnvInput(glslang::EShSourceGlsl, glslang_stage, glslang::EShClientVulkan, 100);
    shader.setEnvClient(glslang::EShClientVulkan, glslang::EShTargetVulkan_1_1);
    shader.setEnvTarget(glslang::EShTargetSpv, glslang::EShTargetSpv_1_3);

    std::string preamble;
    for (const auto& define : options.defines) {
        preamble += "#define " + define + "\n";
    }
    if (!preamble.empty()) {
        shader.setPreamble(preamble.c_str());
    }

    EShMessages messages = static_cast<EShMessages>(EShMsgSpvRules | EShMsgVulkanRules);
    if (options.generate_debug_info) {
        messages = static_cast<EShMessages>(messages | EShMsgDebugInfo);
    }

    const TBuiltInResource* resources = GetDefaultResources();
    if (!shader.parse(resources, 450, false, messages)) {
        result.error_message = shader.getInfoLog();
        BLOCKBRIDGE_LOG_ERROR(GRAPHICS, "GLSL compilation failed for '{}': {}", options.debug_name,
                              result.error_message);
        return result;
    }

    glslang::TProgram program;
    program.addShader(&shader);
    if (!program.link(messages)) {
        result.error_message = program.getInfoLog();
        BLOCKBRIDGE_LOG_ERROR(GRAPHICS, "GLSL linking failed for '{}': {}", options.debug_name, result.error_message);
        return result;
    }

    std::vector<uint32_t> spirv;
    spv::SpvBuildLogger logger;
    glslang::SpvOptions spv_options;
    spv_options.generateDebugInfo = options.generate_debug_info;
    spv_options.disableOptimizer = !options.optimize;

    glslang::GlslangToSpv(*program.getIntermediate(glslang_stage), spirv, &logger, &spv_options);

    if (spirv.empty()) {
        result.error_message = "SPIR-V generation failed: " + logger.getAllMessages();
        BLOCKBRIDGE_LOG_ERROR(GRAPHICS, "SPIR-V generation failed for '{}'", options.debug_name);
        return result;
    }

    result.spirv_bytecode.resize(spirv.size() * sizeof(uint32_t));
    std::memcpy(result.spirv_bytecode.data(), spirv.data(), result.spirv_bytecode.size());

    if (options.generate_reflection) {
        auto reflection_result = reflect_spirv(result.spirv_bytecode, options.stage);
        if (!reflection_result) {
            result.error_message = "SPIR-V reflection failed";
            return result;
        }
        result.reflection = std::move(*reflection_result);
        result.reflection.entry_point = options.entry_point;
    }

    result.success = true;
    ++impl_->compiled_count;
    BLOCKBRIDGE_LOG_DEBUG(GRAPHICS, "Compiled {} shader '{}' ({} bytes SPIR-V)", shader_stage_name(options.stage),
                          options.debug_name, result.spirv_bytecode.size());
    return result;
}

std::optional<ShaderReflection> ShaderCompiler::reflect_spirv(std::span<const uint8_t> spirv, ShaderStage stage) {
    if (spirv.empty() || spirv.size() % 4 != 0) {
        BLOCKBRIDGE_LOG_ERROR(GRAPHICS, "Invalid SPIR-V bytecode ({} bytes)", spirv.size());
        return std::nullopt;
    }

    std::vector<uint32_t> spirv_words(spirv.size() / 4);
    std::memcpy(spirv_words.data(), spirv.data(), spirv.size());

    try {
        spirv_cross::Compiler compiler(std::move(spirv_words));
        return extract_reflection(compiler, stage);
    } catch (const spirv_cross::CompilerError& e) {
        BLOCKBRIDGE_LOG_ERROR(GRAPHICS, "SPIR-V reflection failed: {}", e.what());
        return std::nullopt;
    }
}

size_t ShaderCompiler::get_compiled_count() const {
    return impl_->compiled_count;
}

const char* shader_stage_name(ShaderStage stage) {
    switch (stage) {
        case ShaderStage::Vertex:
            return "Vertex";
        case ShaderStage::Fragment:
            return "Fragment";
        default:
            return "Unknown";
    }
}

}  // namespace blockbridge::graphics
