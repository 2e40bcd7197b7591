#ifndef VACMAP_ROOM_SEGMENTER_HPP
#define VACMAP_ROOM_SEGMENTER_HPP

#include <cstdint>
#include <optional>
#include <vector>
#include <opencv2/core.hpp>

#include "core/config.hpp"
#include "mapping/format_prober.hpp"
#include "mapping/map_types.hpp"

namespace vacmap {

/** BFS over 4-neighbours of matching Free cells starting at seed.
    visited is a row-major arena of width*height flags shared across
    the whole pass; cells already flagged are never revisited.      */
std::vector<cv::Point> floodFill(const OccupancyGrid &grid,
                                 cv::Point seed,
                                 std::vector<uint8_t> &visited);

/** Connected Free components with area >= minRoomSize, largest first
    (ties keep discovery order). Polygons are filled in.            */
std::vector<Region> detectRooms(const OccupancyGrid &grid,
                                int minRoomSize,
                                double simplifyFactor = HULL_SIMPLIFY_FACTOR,
                                bool verbose = true);

/** Outcome of reading an auxiliary segmentation channel. */
struct SegmentChannel
{
    cv::Mat labels;            // CV_32S, 0 = background
    ProbeCandidate layout;
    int roomCount{0};
};

/** Probes the segment blob over header size, element type and reshape
    order, then falls back to an exhaustive AUTO scan. Labels with
    minPixels or fewer cells are dropped.                           */
std::optional<SegmentChannel> parseSegmentChannel(const std::vector<uint8_t> &blob,
                                                  int width, int height,
                                                  int minPixels);

/** One Region per label, largest first. */
std::vector<Region> regionsFromLabels(const cv::Mat &labels,
                                      double simplifyFactor = HULL_SIMPLIFY_FACTOR);

/** Convex hull (every k-th vertex kept) for dense sets, bounding box
    for sparse ones.                                                */
std::vector<cv::Point> boundaryPolygon(const std::vector<cv::Point> &points,
                                       double simplifyFactor = HULL_SIMPLIFY_FACTOR);

/** Segment channel when usable, flood fill otherwise. Either way only
    regions of at least cfg.minRoomSize cells are returned, and labelsOut
    holds just those regions.                                       */
std::vector<Region> segmentRooms(const OccupancyGrid &grid,
                                 const std::vector<uint8_t> *segmentBlob,
                                 const RenderConfig &cfg,
                                 cv::Mat *labelsOut = nullptr);

} // namespace vacmap

#endif // VACMAP_ROOM_SEGMENTER_HPP
