#include "rendering/layer.hpp"
#include <algorithm>
#include <cmath>

namespace vacmap {

RenderLayer makeLayer(int width, int height)
{
    return cv::Mat(height, width, CV_8UC4, cv::Scalar(0, 0, 0, 0));
}

static inline uchar toByte(double v)
{
    return static_cast<uchar>(std::lround(std::clamp(v, 0.0, 255.0)));
}

void blendPixel(cv::Vec4b &dst, const cv::Scalar &color, double coverage)
{
    const double sa = (color[3] / 255.0) * std::clamp(coverage, 0.0, 1.0);
    if (sa <= 0.0) return;

    const double da = dst[3] / 255.0;
    const double oa = sa + da * (1.0 - sa);

    for (int c = 0; c < 3; ++c) {
        double v = (color[c] * sa + dst[c] * da * (1.0 - sa)) / oa;
        dst[c] = toByte(v);
    }
    dst[3] = toByte(oa * 255.0);
}

void compositeOver(cv::Mat &dst, const cv::Mat &src)
{
    CV_Assert(dst.type() == CV_8UC4 && src.type() == CV_8UC4);
    CV_Assert(dst.size() == src.size());

    for (int y = 0; y < dst.rows; ++y) {
        cv::Vec4b       *d = dst.ptr<cv::Vec4b>(y);
        const cv::Vec4b *s = src.ptr<cv::Vec4b>(y);
        for (int x = 0; x < dst.cols; ++x) {
            if (s[x][3] == 0) continue;   // transparent source leaves dst untouched
            blendPixel(d[x], cv::Scalar(s[x][0], s[x][1], s[x][2], s[x][3]));
        }
    }
}

void stampSquare(RenderLayer &layer, cv::Point centre, int radius,
                 const cv::Scalar &color)
{
    const cv::Vec4b px(static_cast<uchar>(color[0]), static_cast<uchar>(color[1]),
                       static_cast<uchar>(color[2]), static_cast<uchar>(color[3]));
    for (int dy = -radius; dy <= radius; ++dy)
        for (int dx = -radius; dx <= radius; ++dx)
        {
            int x = centre.x + dx, y = centre.y + dy;
            if (x < 0 || y < 0 || x >= layer.cols || y >= layer.rows) continue;
            layer.at<cv::Vec4b>(y, x) = px;
        }
}

} // namespace vacmap
