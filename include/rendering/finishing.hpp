#ifndef VACMAP_FINISHING_HPP
#define VACMAP_FINISHING_HPP

#include <string>
#include <vector>
#include <opencv2/core.hpp>

#include "core/config.hpp"
#include "rendering/overlay_renderer.hpp"
#include "rendering/text_renderer.hpp"

namespace vacmap {

/*** Post-orientation passes on the BGRA canvas.
 *   • room labels, drawn upright at their oriented anchors
 *   • contrast / saturation boost (alpha untouched)
 *   • the "Generated: <timestamp>" footer                            */

void drawLabels(cv::Mat &image, const std::vector<LabelPlacement> &labels,
                TextRenderer &text);

void drawFooter(cv::Mat &image, const std::string &timestamp, TextRenderer &text);

/** Scales each channel away from the mean grey level by `factor`. */
void adjustContrast(cv::Mat &image, double factor);

/** Scales each pixel's colour away from its own grey level by `factor`. */
void adjustSaturation(cv::Mat &image, double factor);

void applyFinishing(cv::Mat &image, const std::vector<LabelPlacement> &labels,
                    const RenderConfig &cfg, TextRenderer &text);

} // namespace vacmap

#endif // VACMAP_FINISHING_HPP
