#include "mapping/coordinate_transform.hpp"
#include <cmath>

namespace vacmap {

CoordinateTransform::CoordinateTransform(double resolution,
                                         double originX, double originY,
                                         int width, int height)
    : resolution_(resolution),
      origin_(originX, originY),
      width_(width),
      height_(height)
{
}

CoordinateTransform::CoordinateTransform(const OccupancyGrid &grid)
    : CoordinateTransform(grid.resolution, grid.originX, grid.originY,
                          grid.width, grid.height)
{
}

PixelPoint CoordinateTransform::worldToPixel(const WorldPoint &world_m) const
{
    const Eigen::Vector2d cell = (world_m - origin_) / resolution_;
    return PixelPoint(static_cast<int>(std::floor(cell.x())),
                      static_cast<int>(std::floor(cell.y())));
}

PixelPoint CoordinateTransform::worldCmToPixel(const WorldPoint &world_cm) const
{
    return worldToPixel(world_cm / 100.0);
}

WorldPoint CoordinateTransform::pixelToWorld(const PixelPoint &pixel) const
{
    return origin_ + (pixel.cast<double>() + Eigen::Vector2d::Constant(0.5))
                     * resolution_;
}

bool CoordinateTransform::inBounds(const PixelPoint &p) const
{
    return p.x() >= 0 && p.x() < width_ && p.y() >= 0 && p.y() < height_;
}

cv::Point CoordinateTransform::toCanvas(const PixelPoint &pixel, int scale)
{
    return cv::Point(pixel.x() * scale, pixel.y() * scale);
}

} // namespace vacmap
