#include "mapping/map_types.hpp"
#include <algorithm>

namespace vacmap {

size_t OccupancyGrid::count(CellState state) const
{
    return static_cast<size_t>(std::count(cells.begin(), cells.end(), state));
}

cv::Point2d Region::anchor() const
{
    const std::vector<cv::Point> &pts = polygon.empty() ? pixels : polygon;
    if (pts.empty()) return {0.0, 0.0};

    double sx = 0.0, sy = 0.0;
    for (const auto &p : pts) { sx += p.x; sy += p.y; }
    return {sx / pts.size(), sy / pts.size()};
}

} // namespace vacmap
