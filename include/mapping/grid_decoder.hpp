#ifndef VACMAP_GRID_DECODER_HPP
#define VACMAP_GRID_DECODER_HPP

#include <cstdint>
#include <vector>

#include "core/config.hpp"
#include "core/pipeline_error.hpp"
#include "mapping/map_types.hpp"

namespace vacmap {

/** 127 → Unknown, 0 → Free, anything else → Obstacle. */
CellState classifyCell(uint8_t raw);

/** Decodes width*height bytes starting at offset into out.
    Fails with INSUFFICIENT_DATA before touching any cell when the
    slice is too short.                                              */
bool decodeGrid(const std::vector<uint8_t> &bytes,
                size_t offset,
                const MapInfo &info,
                OccupancyGrid &out,
                PipelineError &err);

/** Chooses the header offset for the map blob (fixed, probed, or the
    zero-offset fallback) according to cfg.                          */
bool resolveGridOffset(const std::vector<uint8_t> &bytes,
                       const MapInfo &info,
                       const RenderConfig &cfg,
                       size_t &offset,
                       PipelineError &err);

} // namespace vacmap

#endif // VACMAP_GRID_DECODER_HPP
