#ifndef VACMAP_COORDINATE_TRANSFORM_HPP
#define VACMAP_COORDINATE_TRANSFORM_HPP

#include <Eigen/Core>
#include <opencv2/core.hpp>

#include "mapping/map_types.hpp"

namespace vacmap {

/** World ↔ grid mapping for one map.
 *  pixel = floor((world - origin) / resolution), per axis.
 *  Polygon vertices arrive in centimetres and go through worldCmToPixel;
 *  the charger pose is already in metres.                              */
class CoordinateTransform
{
public:
    CoordinateTransform(double resolution, double originX, double originY,
                        int width, int height);
    explicit CoordinateTransform(const OccupancyGrid &grid);

    PixelPoint worldToPixel(const WorldPoint &world_m) const;
    PixelPoint worldCmToPixel(const WorldPoint &world_cm) const;

    /** Cell centre in world metres (diagnostics). */
    WorldPoint pixelToWorld(const PixelPoint &pixel) const;

    bool inBounds(const PixelPoint &pixel) const;

    /** Grid cell → canvas pixel for an integer canvas scale. */
    static cv::Point toCanvas(const PixelPoint &pixel, int scale);

    inline double resolution() const { return resolution_; }
    inline int    width()      const { return width_;  }
    inline int    height()     const { return height_; }

private:
    double resolution_;
    Eigen::Vector2d origin_;
    int width_, height_;
};

} // namespace vacmap

#endif // VACMAP_COORDINATE_TRANSFORM_HPP
