// blockbridge GL Translation
// legacy_shaders.hpp - Embedded GLSL sources for the legacy pipelines
//
// Bind group 0 (matrix4): binding 0 = uniform block with one mat4.
// Bind group 1 (texture): binding 0 = texture2D, binding 1 = sampler.

#pragma once

#include <string_view>

namespace blockbridge::gl::shaders {

inline constexpr std::string_view POS_COL_FLOAT3_VERT = R"(#version 450
layout(set = 0, binding = 0) uniform Matrix {
    mat4 view_proj;
} u_matrix;

layout(location = 0) in vec3 a_position;
layout(location = 1) in vec3 a_color;

layout(location = 0) out vec4 v_color;

void main() {
    v_color = vec4(a_color, 1.0);
    gl_Position = u_matrix.view_proj * vec4(a_position, 1.0);
}
)";

inline constexpr std::string_view POS_COL_UINT_VERT = R"(#version 450
layout(set = 0, binding = 0) uniform Matrix {
    mat4 view_proj;
} u_matrix;

layout(location = 0) in vec3 a_position;
layout(location = 1) in uint a_color;

layout(location = 0) out vec4 v_color;

void main() {
    v_color = unpackUnorm4x8(a_color);
    gl_Position = u_matrix.view_proj * vec4(a_position, 1.0);
}
)";

// Shared by both vertex-colored pipelines
inline constexpr std::string_view POS_COL_FRAG = R"(#version 450
layout(location = 0) in vec4 v_color;
layout(location = 0) out vec4 f_color;

void main() {
    f_color = v_color;
}
)";

inline constexpr std::string_view POS_TEX_VERT = R"(#version 450
layout(set = 0, binding = 0) uniform Matrix {
    mat4 view_proj;
} u_matrix;

layout(location = 0) in vec3 a_position;
layout(location = 1) in vec2 a_uv;

layout(location = 0) out vec2 v_uv;

void main() {
    v_uv = a_uv;
    gl_Position = u_matrix.view_proj * vec4(a_position, 1.0);
}
)";

inline constexpr std::string_view POS_TEX_FRAG = R"(#version 450
layout(set = 1, binding = 0) uniform texture2D t_texture;
layout(set = 1, binding = 1) uniform sampler t_sampler;

layout(location = 0) in vec2 v_uv;
layout(location = 0) out vec4 f_color;

void main() {
    f_color = texture(sampler2D(t_texture, t_sampler), v_uv);
}
)";

inline constexpr std::string_view CLEAR_COLOR_VERT = R"(#version 450
layout(location = 0) in vec2 a_position;
layout(location = 1) in vec3 a_color;

layout(location = 0) out vec3 v_color;

void main() {
    v_color = a_color;
    gl_Position = vec4(a_position, 0.0, 1.0);
}
)";

inline constexpr std::string_view CLEAR_COLOR_FRAG = R"(#version 450
layout(location = 0) in vec3 v_color;
layout(location = 0) out vec4 f_color;

void main() {
    f_color = vec4(v_color, 1.0);
}
)";

}  // namespace blockbridge::gl::shaders
