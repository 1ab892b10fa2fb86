// blockbridge Graphics Abstraction Layer
// graphics.hpp - Main include for the graphics abstraction

#pragma once

// Include all graphics headers
#include "buffer.hpp"
#include "command_buffer.hpp"
#include "device.hpp"
#include "pipeline.hpp"
#include "sampler.hpp"
#include "shader.hpp"
#include "shader_compiler.hpp"
#include "texture.hpp"
#include "types.hpp"
