#ifndef VACMAP_LAYER_HPP
#define VACMAP_LAYER_HPP

#include <opencv2/core.hpp>

namespace vacmap {

// One overlay category per layer: CV_8UC4 (BGRA), fully transparent at start.
using RenderLayer = cv::Mat;

RenderLayer makeLayer(int width, int height);

/** BGRA colour from an RGB triple + alpha. */
inline cv::Scalar rgba(int r, int g, int b, int a = 255)
{
    return cv::Scalar(b, g, r, a);
}

/** Source-over blend of colour·coverage onto one BGRA pixel. */
void blendPixel(cv::Vec4b &dst, const cv::Scalar &color, double coverage = 1.0);

/** dst = src over dst, both CV_8UC4 and the same size. */
void compositeOver(cv::Mat &dst, const cv::Mat &src);

/** Writes colour into every in-bounds pixel of a (2r+1)² square. */
void stampSquare(RenderLayer &layer, cv::Point centre, int radius,
                 const cv::Scalar &color);

} // namespace vacmap

#endif // VACMAP_LAYER_HPP
