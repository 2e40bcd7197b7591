#ifndef VACMAP_IMAGE_ENCODER_HPP
#define VACMAP_IMAGE_ENCODER_HPP

#include <cstdint>
#include <string>
#include <vector>
#include <opencv2/core.hpp>

#include "core/pipeline_error.hpp"

namespace vacmap {

/** Lanczos resize by an integer factor; factor <= 1 returns a copy. */
cv::Mat upscale(const cv::Mat &image, int factor);

/** PNG bytes of a BGRA image (alpha kept). */
bool encodePng(const cv::Mat &image, std::vector<uint8_t> &png, PipelineError &err);

/** "<dir>/foo.png" → "<dir>/foo.base64.txt"; other suffixes gain ".base64.txt". */
std::string sidecarPath(const std::string &pngPath);

/** Writes the PNG and its base64 sidecar. Each file goes to a temporary
    name in the same directory first and is renamed into place. If the
    sidecar cannot be placed, the previous PNG (if any) is put back.    */
bool writeOutputs(const std::string &pngPath,
                  const std::vector<uint8_t> &png,
                  const std::string &base64,
                  PipelineError &err,
                  bool verbose = true);

} // namespace vacmap

#endif // VACMAP_IMAGE_ENCODER_HPP
