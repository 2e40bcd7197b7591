#ifndef VACMAP_TEXT_RENDERER_HPP
#define VACMAP_TEXT_RENDERER_HPP

#include <cstdint>
#include <string>
#include <vector>
#include <opencv2/core.hpp>

#include <ft2build.h>
#include FT_FREETYPE_H

namespace vacmap {

/** UTF-8 → code points; malformed or overlong sequences are skipped. */
std::vector<uint32_t> decodeUtf8(const std::string &text);

/*** Draws label strings onto BGRA layers.
 *   • tries each candidate font file in order (FreeType)
 *   • falls back to OpenCV's built-in Hershey glyphs if none loads
 *   • owns the FreeType handles for its lifetime                      */
class TextRenderer {
public:
    explicit TextRenderer(const std::vector<std::string> &fontCandidates);
    ~TextRenderer();

    TextRenderer(const TextRenderer &) = delete;
    TextRenderer &operator=(const TextRenderer &) = delete;

    bool hasTrueType() const { return face_ != nullptr; }
    const std::string &fontPath() const { return fontPath_; }

    /** Box of the rendered string at the given pixel height. */
    cv::Size measure(const std::string &text, int pixelSize);

    /** topLeft is the upper-left corner of the measured box. */
    void draw(cv::Mat &layer, const std::string &text, cv::Point topLeft,
              int pixelSize, const cv::Scalar &color);

    /** Contrast label: four light copies offset by `offset` in each
        cardinal direction, then one dark copy on top, centred.       */
    void drawOutlined(cv::Mat &layer, const std::string &text, cv::Point centre,
                      int pixelSize, const cv::Scalar &light,
                      const cv::Scalar &dark, int offset);

private:
    void drawFreeType(cv::Mat &layer, const std::string &text, cv::Point topLeft,
                      int pixelSize, const cv::Scalar &color);
    void drawHershey(cv::Mat &layer, const std::string &text, cv::Point topLeft,
                     int pixelSize, const cv::Scalar &color);

    FT_Library  library_{nullptr};
    FT_Face     face_{nullptr};
    std::string fontPath_;
};

} // namespace vacmap

#endif // VACMAP_TEXT_RENDERER_HPP
