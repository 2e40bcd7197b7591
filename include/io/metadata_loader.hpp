#ifndef VACMAP_METADATA_LOADER_HPP
#define VACMAP_METADATA_LOADER_HPP

#include <string>

#include "core/pipeline_error.hpp"
#include "mapping/map_types.hpp"

namespace vacmap {

/*** JSON metadata documents → typed structs.
 *   JSON is a subset of YAML flow syntax, so yaml-cpp parses them directly.
 *   Every parser returns false and fills `err` (MalformedMetadata, with the
 *   document and field named) on a missing or mistyped field.           */

/** map_record.json: width, height, resolution, x_min, y_min. */
bool parseMapInfo(const std::string &text, MapInfo &out, PipelineError &err);

/** charger_pose.json: charger_pose [x, y] metres, optional charger_phi radians. */
bool parseChargerPose(const std::string &text, ChargerPose &out, PipelineError &err);

/** area_info.json: forbidAreaValue / areaValue polygons in centimetres.
 *  Both arrays are optional; an empty document yields no zones.       */
bool parseAreaInfo(const std::string &text, AreaInfo &out, PipelineError &err);

} // namespace vacmap

#endif // VACMAP_METADATA_LOADER_HPP
