#include "mapping/grid_decoder.hpp"
#include "mapping/format_prober.hpp"
#include <iostream>
#include <sstream>

namespace vacmap {

CellState classifyCell(uint8_t raw)
{
    if (raw == RAW_UNKNOWN) return CellState::UNKNOWN;
    if (raw == RAW_FREE)    return CellState::FREE;
    return CellState::OBSTACLE;
}

bool decodeGrid(const std::vector<uint8_t> &bytes,
                size_t offset,
                const MapInfo &info,
                OccupancyGrid &out,
                PipelineError &err)
{
    if (info.width <= 0 || info.height <= 0) {
        err.set(ErrorKind::MALFORMED_METADATA, "GridDecoder", "width/height",
                "grid dimensions must be positive");
        return false;
    }

    const size_t cells = static_cast<size_t>(info.width)
                       * static_cast<size_t>(info.height);

    if (offset > bytes.size() || bytes.size() - offset < cells) {
        std::ostringstream ss;
        ss << "map data too small (" << bytes.size() << " bytes, offset "
           << offset << ") for " << info.width << "x" << info.height << " map";
        err.set(ErrorKind::INSUFFICIENT_DATA, "GridDecoder", "map blob", ss.str());
        return false;
    }

    out.width      = info.width;
    out.height     = info.height;
    out.resolution = info.resolution;
    out.originX    = info.xMin;
    out.originY    = info.yMin;
    out.cells.resize(cells);

    const uint8_t *src = bytes.data() + offset;
    for (size_t i = 0; i < cells; ++i)
        out.cells[i] = classifyCell(src[i]);

    return true;
}

bool resolveGridOffset(const std::vector<uint8_t> &bytes,
                       const MapInfo &info,
                       const RenderConfig &cfg,
                       size_t &offset,
                       PipelineError &err)
{
    if (cfg.fixedHeaderOffset) {
        offset = cfg.headerOffset;
        return true;
    }

    ProbeOptions opts;
    opts.types = {ElementType::U8};
    auto found = probeFormat(bytes, info.width, info.height, opts);
    if (found) {
        offset = found->candidate.offset;
        if (cfg.verbose)
            std::cout << "[GridDecoder] probed layout: "
                      << describe(found->candidate) << "\n";
        return true;
    }

    if (cfg.fallbackToZeroOffset) {
        std::cerr << "[GridDecoder] no plausible layout found, assuming offset 0\n";
        offset = 0;
        return true;
    }

    err.set(ErrorKind::FORMAT_NOT_FOUND, "FormatProber", "map blob",
            "no (offset, element type) candidate matched the declared dimensions");
    return false;
}

} // namespace vacmap
