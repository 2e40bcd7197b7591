#include "rendering/orientation.hpp"
#include <opencv2/core.hpp>

namespace vacmap {

void correctOrientation(cv::Mat &image)
{
    if (image.empty()) return;

    cv::Mat rotated;
    cv::rotate(image, rotated, cv::ROTATE_180);
    cv::flip(rotated, image, 1);
}

} // namespace vacmap
