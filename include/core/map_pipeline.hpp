#ifndef VACMAP_MAP_PIPELINE_HPP
#define VACMAP_MAP_PIPELINE_HPP

#include <cstdint>
#include <string>
#include <vector>
#include <opencv2/core.hpp>

#include "core/config.hpp"
#include "core/pipeline_error.hpp"
#include "mapping/map_types.hpp"

namespace vacmap {

/* ───── Already-loaded inputs for one conversion ──────────────────── */
struct MapInputs
{
    std::vector<uint8_t> mapBlob;
    std::vector<uint8_t> segmentBlob;   // empty when absent
    MapInfo     info;
    ChargerPose charger;
    AreaInfo    area;
};

struct ConvertResult
{
    cv::Mat              image;    // final BGRA raster, upscaled
    std::vector<uint8_t> png;
    std::string          base64;
};

/** Decode → segment → overlay → orient → finish → encode.
 *  Pure in its inputs; writes nothing except debug dumps when enabled. */
bool convertMap(const MapInputs &inputs, const RenderConfig &cfg,
                ConvertResult &result, PipelineError &err);

} // namespace vacmap

#endif // VACMAP_MAP_PIPELINE_HPP
