// blockbridge GL Translation
// command.cpp - Legacy pipeline helpers

#include <blockbridge/gl/command.hpp>

#include <spdlog/fmt/fmt.h>

#include <stdexcept>

namespace blockbridge::gl {

LegacyPipeline pipeline_from_index(int index) {
    switch (index) {
        case 0:
            return LegacyPipeline::PosColUint;
        case 1:
            return LegacyPipeline::PosTex;
        case 2:
            return LegacyPipeline::PosColFloat3;
        default:
            throw std::out_of_range(fmt::format("unknown legacy pipeline index {}", index));
    }
}

const char* legacy_pipeline_name(LegacyPipeline pipeline) {
    switch (pipeline) {
        case LegacyPipeline::PosColUint:
            return "pos_col_uint";
        case LegacyPipeline::PosTex:
            return "pos_tex";
        case LegacyPipeline::PosColFloat3:
            return "pos_col_float3";
        default:
            return "unknown";
    }
}

}  // namespace blockbridge::gl
