#include "rendering/finishing.hpp"
#include "rendering/layer.hpp"
#include "rendering/orientation.hpp"
#include "utils.hpp"
#include <opencv2/imgproc.hpp>

namespace vacmap {

static const cv::Scalar LABEL_LIGHT = rgba(255, 255, 255, 230);
static const cv::Scalar LABEL_DARK  = rgba(0, 0, 0);

/* ───────────────────────── Text passes ──────────────────────────── */
void drawLabels(cv::Mat &image, const std::vector<LabelPlacement> &labels,
                TextRenderer &text)
{
    for (const auto &label : labels) {
        const cv::Point at = orientedPoint(label.anchor, image.size());
        text.drawOutlined(image, label.text, at, label.pixelSize,
                          LABEL_LIGHT, LABEL_DARK, LABEL_OUTLINE_OFFSET);
    }
}

void drawFooter(cv::Mat &image, const std::string &timestamp, TextRenderer &text)
{
    const std::string line = "Generated: " + timestamp;
    const cv::Size sz = text.measure(line, FOOTER_FONT_PX);
    const cv::Point centre(10 + sz.width / 2, image.rows - 20 + sz.height / 2);
    text.drawOutlined(image, line, centre, FOOTER_FONT_PX,
                      LABEL_LIGHT, LABEL_DARK, 1);
}

/* ───────────────────────── Colour passes ────────────────────────── */
void adjustContrast(cv::Mat &image, double factor)
{
    if (image.empty() || factor == 1.0) return;
    CV_Assert(image.type() == CV_8UC4);

    cv::Mat grey;
    cv::cvtColor(image, grey, cv::COLOR_BGRA2GRAY);
    const double mean = cv::mean(grey)[0];

    std::vector<cv::Mat> ch;
    cv::split(image, ch);
    for (int c = 0; c < 3; ++c)
        ch[c].convertTo(ch[c], -1, factor, mean * (1.0 - factor));
    cv::merge(ch, image);
}

void adjustSaturation(cv::Mat &image, double factor)
{
    if (image.empty() || factor == 1.0) return;
    CV_Assert(image.type() == CV_8UC4);

    cv::Mat grey;
    cv::cvtColor(image, grey, cv::COLOR_BGRA2GRAY);

    std::vector<cv::Mat> ch;
    cv::split(image, ch);
    for (int c = 0; c < 3; ++c)
        cv::addWeighted(ch[c], factor, grey, 1.0 - factor, 0.0, ch[c]);
    cv::merge(ch, image);
}

void applyFinishing(cv::Mat &image, const std::vector<LabelPlacement> &labels,
                    const RenderConfig &cfg, TextRenderer &text)
{
    if (cfg.drawRoomLabels) drawLabels(image, labels, text);

    adjustContrast(image, cfg.contrastBoost);
    adjustSaturation(image, cfg.saturationBoost);

    if (cfg.drawFooter)
        drawFooter(image, cfg.timestamp.empty() ? utils::timestamp() : cfg.timestamp, text);
}

} // namespace vacmap
