#include "rendering/text_renderer.hpp"
#include "rendering/layer.hpp"
#include <iostream>
#include <opencv2/imgproc.hpp>

namespace vacmap {

static constexpr int    HERSHEY_FACE        = cv::FONT_HERSHEY_SIMPLEX;
static constexpr double HERSHEY_BASE_HEIGHT = 22.0;   // px at fontScale 1

static double hersheyScale(int pixelSize)
{
    return pixelSize / HERSHEY_BASE_HEIGHT;
}

/* ───────────────────────── UTF-8 ────────────────────────────────── */
std::vector<uint32_t> decodeUtf8(const std::string &text)
{
    std::vector<uint32_t> out;
    const size_t n = text.size();
    size_t i = 0;

    while (i < n) {
        const uint8_t lead = static_cast<uint8_t>(text[i]);
        size_t len;
        uint32_t cp;
        if (lead < 0x80) { out.push_back(lead); ++i; continue; }

        if      ((lead & 0xE0) == 0xC0) { len = 2; cp = lead & 0x1F; }
        else if ((lead & 0xF0) == 0xE0) { len = 3; cp = lead & 0x0F; }
        else if ((lead & 0xF8) == 0xF0) { len = 4; cp = lead & 0x07; }
        else { ++i; continue; }                 // stray continuation or 0xF8+

        bool valid = i + len <= n;              // truncated tail
        for (size_t k = 1; valid && k < len; ++k) {
            const uint8_t b = static_cast<uint8_t>(text[i + k]);
            if ((b & 0xC0) != 0x80) { valid = false; break; }
            cp = (cp << 6) | (b & 0x3F);
        }
        if (!valid) { ++i; continue; }

        static const uint32_t MIN_CP[5] = { 0, 0, 0x80, 0x800, 0x10000 };
        if (cp >= MIN_CP[len] && cp <= 0x10FFFF && (cp < 0xD800 || cp > 0xDFFF))
            out.push_back(cp);
        i += len;
    }
    return out;
}

/* ───────────────────────── ctor / dtor ──────────────────────────── */
TextRenderer::TextRenderer(const std::vector<std::string> &fontCandidates)
{
    if (FT_Init_FreeType(&library_)) {
        library_ = nullptr;
        std::cerr << "[TextRenderer] FreeType unavailable, using built-in glyphs\n";
        return;
    }

    for (const auto &path : fontCandidates) {
        if (FT_New_Face(library_, path.c_str(), 0, &face_) == 0) {
            fontPath_ = path;
            return;
        }
        face_ = nullptr;
    }

    FT_Done_FreeType(library_);
    library_ = nullptr;
}

TextRenderer::~TextRenderer()
{
    if (face_)    FT_Done_Face(face_);
    if (library_) FT_Done_FreeType(library_);
}

/* ───────────────────────── measurement ──────────────────────────── */
cv::Size TextRenderer::measure(const std::string &text, int pixelSize)
{
    if (!face_) {
        int baseline = 0;
        cv::Size sz = cv::getTextSize(text, HERSHEY_FACE, hersheyScale(pixelSize),
                                      1, &baseline);
        return {sz.width, sz.height + baseline};
    }

    FT_Set_Pixel_Sizes(face_, 0, static_cast<FT_UInt>(pixelSize));
    int width = 0;
    for (uint32_t cp : decodeUtf8(text)) {
        if (FT_Load_Char(face_, cp, FT_LOAD_DEFAULT)) continue;
        width += static_cast<int>(face_->glyph->advance.x >> 6);
    }
    int asc  = static_cast<int>(face_->size->metrics.ascender  >> 6);
    int desc = static_cast<int>(face_->size->metrics.descender >> 6);
    return {width, asc - desc};
}

/* ─────────────────────────── drawing ────────────────────────────── */
void TextRenderer::draw(cv::Mat &layer, const std::string &text, cv::Point topLeft,
                        int pixelSize, const cv::Scalar &color)
{
    if (text.empty()) return;
    if (face_) drawFreeType(layer, text, topLeft, pixelSize, color);
    else       drawHershey(layer, text, topLeft, pixelSize, color);
}

void TextRenderer::drawFreeType(cv::Mat &layer, const std::string &text,
                                cv::Point topLeft, int pixelSize,
                                const cv::Scalar &color)
{
    FT_Set_Pixel_Sizes(face_, 0, static_cast<FT_UInt>(pixelSize));
    const int baseline = topLeft.y
                       + static_cast<int>(face_->size->metrics.ascender >> 6);
    int penX = topLeft.x;

    for (uint32_t cp : decodeUtf8(text)) {
        if (FT_Load_Char(face_, cp, FT_LOAD_RENDER)) continue;

        const FT_GlyphSlot g  = face_->glyph;
        const FT_Bitmap  &bmp = g->bitmap;
        const int ox = penX + g->bitmap_left;
        const int oy = baseline - g->bitmap_top;

        for (unsigned r = 0; r < bmp.rows; ++r)
            for (unsigned c = 0; c < bmp.width; ++c)
            {
                int px = ox + static_cast<int>(c);
                int py = oy + static_cast<int>(r);
                if (px < 0 || py < 0 || px >= layer.cols || py >= layer.rows) continue;

                uint8_t cov = bmp.buffer[static_cast<int>(r) * bmp.pitch + static_cast<int>(c)];
                if (cov == 0) continue;
                blendPixel(layer.at<cv::Vec4b>(py, px), color, cov / 255.0);
            }
        penX += static_cast<int>(g->advance.x >> 6);
    }
}

void TextRenderer::drawHershey(cv::Mat &layer, const std::string &text,
                               cv::Point topLeft, int pixelSize,
                               const cv::Scalar &color)
{
    int baseline = 0;
    const double scale = hersheyScale(pixelSize);
    cv::Size sz = cv::getTextSize(text, HERSHEY_FACE, scale, 1, &baseline);
    cv::putText(layer, text, {topLeft.x, topLeft.y + sz.height},
                HERSHEY_FACE, scale, color, 1, cv::LINE_AA);
}

void TextRenderer::drawOutlined(cv::Mat &layer, const std::string &text,
                                cv::Point centre, int pixelSize,
                                const cv::Scalar &light, const cv::Scalar &dark,
                                int offset)
{
    const cv::Size sz = measure(text, pixelSize);
    const cv::Point tl(centre.x - sz.width / 2, centre.y - sz.height / 2);

    static const int DIRS[4][2] = { {0, 1}, {1, 0}, {0, -1}, {-1, 0} };
    for (const auto &d : DIRS)
        draw(layer, text, {tl.x + d[0] * offset, tl.y + d[1] * offset},
             pixelSize, light);
    draw(layer, text, tl, pixelSize, dark);
}

} // namespace vacmap
