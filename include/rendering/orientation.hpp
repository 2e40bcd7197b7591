#ifndef VACMAP_ORIENTATION_HPP
#define VACMAP_ORIENTATION_HPP

#include <opencv2/core.hpp>

namespace vacmap {

/** Rotate 180° then mirror left-right; net effect is a vertical flip,
 *  so canvas (x, y) lands at (x, H-1-y). Applied in place.           */
void correctOrientation(cv::Mat &image);

/** Where a pre-orientation pixel ends up in an image of `size`. */
inline cv::Point orientedPoint(cv::Point p, cv::Size size)
{
    return { p.x, size.height - 1 - p.y };
}

} // namespace vacmap

#endif // VACMAP_ORIENTATION_HPP
