#pragma once
/********************************************************************
 * Plain data carried through one conversion call.
 *  - OccupancyGrid : decoded, classified cells (row-major)
 *  - MapInfo / ChargerPose / AreaInfo : parsed metadata documents
 *  - Region : transient room produced by the segmenter
 * Nothing here outlives a single convertMap() call.
 *******************************************************************/
#include <cstdint>
#include <string>
#include <vector>
#include <Eigen/Core>
#include <opencv2/core.hpp>

namespace vacmap {

using WorldPoint = Eigen::Vector2d;   // metres (or cm for polygon sources)
using PixelPoint = Eigen::Vector2i;   // grid cell (x, y)

enum class CellState : uint8_t
{
    UNKNOWN  = 0,
    FREE     = 1,
    OBSTACLE = 2
};

/* ───── Metadata documents ──────────────────────────────────────── */
struct MapInfo
{
    int    width{0};
    int    height{0};
    double resolution{0.0};   // metres / cell
    double xMin{0.0};         // world origin
    double yMin{0.0};
};

struct ChargerPose
{
    WorldPoint position{0.0, 0.0};   // metres
    double     phi{0.0};             // heading, radians
};

enum class ZoneType : uint8_t
{
    NO_GO  = 0,
    NO_MOP = 1
};

struct ForbiddenZone
{
    std::vector<WorldPoint> verticesCm;
    ZoneType type{ZoneType::NO_GO};
};

struct RoomArea
{
    std::vector<WorldPoint> verticesCm;
    int         id{-1};
    std::string name;
};

struct AreaInfo
{
    std::vector<ForbiddenZone> forbiddenZones;
    std::vector<RoomArea>      rooms;
};

/* ───── Decoded grid ────────────────────────────────────────────── */
struct OccupancyGrid
{
    int    width{0};
    int    height{0};
    double resolution{0.0};
    double originX{0.0};
    double originY{0.0};
    std::vector<CellState> cells;   // size == width*height

    inline size_t index(int x, int y) const
    {
        return static_cast<size_t>(y) * static_cast<size_t>(width)
             + static_cast<size_t>(x);
    }
    inline bool contains(int x, int y) const
    {
        return x >= 0 && x < width && y >= 0 && y < height;
    }
    inline CellState at(int x, int y) const { return cells[index(x, y)]; }

    size_t count(CellState state) const;
};

/* ───── Segmentation output ─────────────────────────────────────── */
struct Region
{
    int id{0};
    std::vector<cv::Point> pixels;    // grid cells owned by the region
    std::vector<cv::Point> polygon;   // simplified boundary, grid cells
    int area{0};                      // == pixels.size()
    std::string name;

    cv::Point2d anchor() const;       // centroid of polygon, label position
};

} // namespace vacmap
