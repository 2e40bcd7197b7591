#include "rendering/overlay_renderer.hpp"
#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <opencv2/imgproc.hpp>

namespace vacmap {

/* ───── Colours (RGB + alpha) ────────────────────────────────────── */
static const cv::Scalar FREE_COLOR      = rgba(255, 255, 255);
static const cv::Scalar UNKNOWN_COLOR   = rgba(230, 230, 230);
static const cv::Scalar OBSTACLE_COLOR  = rgba( 40,  40,  40);

static const cv::Scalar NOGO_FILL       = rgba(255, 0, 0, ZONE_FILL_ALPHA);
static const cv::Scalar NOGO_HATCH      = rgba(255, 0, 0, 180);
static const cv::Scalar NOGO_BORDER     = rgba(255, 0, 0, 200);
static const cv::Scalar NOMOP_FILL      = rgba(0, 0, 255, ZONE_FILL_ALPHA);
static const cv::Scalar NOMOP_HATCH     = rgba(0, 0, 255, 180);
static const cv::Scalar NOMOP_BORDER    = rgba(0, 0, 255, 200);

static const cv::Scalar CHARGER_FILL    = rgba(255, 0, 0);
static const cv::Scalar CHARGER_GLYPH   = rgba(255, 255, 255);
static const cv::Scalar CHARGER_RING    = rgba(255, 255, 0, 200);

/* ───────────────────────── Palette ──────────────────────────────── */
static cv::Vec3b hsvToRgb(double h, double s, double v)
{
    // float HSV takes hue in degrees, S and V in [0, 1]
    cv::Mat hsv(1, 1, CV_32FC3,
                cv::Scalar(static_cast<float>(h * 360.0), static_cast<float>(s),
                           static_cast<float>(v)));
    cv::Mat rgb;
    cv::cvtColor(hsv, rgb, cv::COLOR_HSV2RGB);
    rgb.convertTo(rgb, CV_8UC3, 255.0);
    return rgb.at<cv::Vec3b>(0, 0);
}

std::vector<cv::Vec3b> roomColors(size_t n)
{
    static const cv::Vec3b PREDEFINED[] = {
        {255, 195,   0},   // yellow
        {200,  80,  80},   // red
        { 30, 144, 255},   // blue
        {  0, 230, 170},   // turquoise
        {100, 210, 255},   // light blue
    };
    const size_t fixed = sizeof(PREDEFINED) / sizeof(PREDEFINED[0]);

    std::vector<cv::Vec3b> colors;
    for (size_t i = 0; i < n && i < fixed; ++i)
        colors.push_back(PREDEFINED[i]);
    for (size_t i = fixed; i < n; ++i) {
        double h = static_cast<double>(i - fixed) / static_cast<double>(n - fixed);
        colors.push_back(hsvToRgb(h, 0.8, 0.9));
    }
    return colors;
}

/* ───────────────────────── Base layer ───────────────────────────── */
RenderLayer renderBaseLayer(const OccupancyGrid &grid, int scale)
{
    RenderLayer base = makeLayer(grid.width * scale, grid.height * scale);

    for (int y = 0; y < grid.height; ++y)
        for (int x = 0; x < grid.width; ++x)
        {
            const cv::Scalar *col = &OBSTACLE_COLOR;
            switch (grid.at(x, y)) {
                case CellState::FREE:     col = &FREE_COLOR;     break;
                case CellState::UNKNOWN:  col = &UNKNOWN_COLOR;  break;
                case CellState::OBSTACLE: col = &OBSTACLE_COLOR; break;
            }
            cv::rectangle(base, cv::Rect(x * scale, y * scale, scale, scale),
                          *col, cv::FILLED);
        }
    return base;
}

/* ───────────────────────── Primitives ───────────────────────────── */
void drawPolygonEdges(RenderLayer &layer, const std::vector<cv::Point> &polygon,
                      const cv::Scalar &color, int stampRadius)
{
    if (polygon.size() < 3) return;

    const size_t n = polygon.size();
    for (size_t i = 0; i < n; ++i) {
        const cv::Point a = polygon[i];
        const cv::Point b = polygon[(i + 1) % n];

        const int steps = 3 * std::max(std::abs(b.x - a.x), std::abs(b.y - a.y));
        if (steps <= 1) {
            stampSquare(layer, a, stampRadius, color);
            continue;
        }
        for (int s = 0; s < steps; ++s) {
            const double t = static_cast<double>(s) / (steps - 1);
            const int x = static_cast<int>(a.x + t * (b.x - a.x));
            const int y = static_cast<int>(a.y + t * (b.y - a.y));
            stampSquare(layer, {x, y}, stampRadius, color);
        }
    }
}

void fillPolygon(RenderLayer &layer, const std::vector<cv::Point> &polygon,
                 const cv::Scalar &color)
{
    if (polygon.size() < 3) return;
    std::vector<std::vector<cv::Point>> contours{polygon};
    cv::fillPoly(layer, contours, color, cv::LINE_8);
}

void drawHatch(RenderLayer &layer, const std::vector<cv::Point> &polygon,
               int spacing, bool crossed, const cv::Scalar &color, int thickness)
{
    if (polygon.size() < 3 || spacing <= 0) return;

    const cv::Rect box = cv::boundingRect(polygon);
    const int minX = box.x, maxX = box.x + box.width - 1;
    const int minY = box.y, maxY = box.y + box.height - 1;
    const int h = maxY - minY;

    for (int i = minX; i < maxX + h; i += spacing) {
        cv::Point p1(i, minY), p2(i - h, maxY);
        if (cv::clipLine(box, p1, p2))
            cv::line(layer, p1, p2, color, thickness, cv::LINE_8);

        if (!crossed) continue;
        cv::Point q1(i, maxY), q2(i - h, minY);
        if (cv::clipLine(box, q1, q2))
            cv::line(layer, q1, q2, color, thickness, cv::LINE_8);
    }
}

void drawChargerIcon(RenderLayer &layer, cv::Point c, int radius)
{
    cv::circle(layer, c, radius, CHARGER_FILL, cv::FILLED, cv::LINE_8);

    // zig-zag bolt, laid out for radius 15 and scaled
    const double k = radius / 15.0;
    auto at = [&](double dx, double dy) {
        return cv::Point(c.x + static_cast<int>(std::lround(dx * k)),
                         c.y + static_cast<int>(std::lround(dy * k)));
    };
    std::vector<cv::Point> bolt{ at(0, -10), at(-6, -2), at(0, 3),
                                 at(6, -2), at(0, 10) };
    cv::polylines(layer, bolt, false, CHARGER_GLYPH,
                  std::max(1, static_cast<int>(std::lround(3 * k))), cv::LINE_8);

    cv::circle(layer, c, radius + CHARGER_RING_GAP, CHARGER_RING, 2, cv::LINE_8);
}

/* ───────────────────────── Renderer ─────────────────────────────── */
OverlayRenderer::OverlayRenderer(const CoordinateTransform &transform,
                                 const RenderConfig &cfg)
    : transform_(transform),
      cfg_(cfg),
      scale_(std::max(1, cfg.canvasScale))
{
}

cv::Point OverlayRenderer::cellCentre(const PixelPoint &cell) const
{
    cv::Point p = CoordinateTransform::toCanvas(cell, scale_);
    return { p.x + scale_ / 2, p.y + scale_ / 2 };
}

std::vector<cv::Point>
OverlayRenderer::toCanvasPolygon(const std::vector<WorldPoint> &verticesCm) const
{
    if (verticesCm.size() < 3) return {};   // degenerate: skipped silently

    std::vector<cv::Point> out;
    out.reserve(verticesCm.size());
    for (const auto &v : verticesCm)
        out.push_back(CoordinateTransform::toCanvas(transform_.worldCmToPixel(v), scale_));
    return out;
}

int OverlayRenderer::labelSize(const std::vector<cv::Point> &polygon) const
{
    const cv::Rect box = cv::boundingRect(polygon);
    return std::clamp(std::min(box.width, box.height) / 6, 10, 22);
}

RenderLayer OverlayRenderer::roomLayer(const std::vector<RoomArea> &rooms,
                                       std::vector<LabelPlacement> &labels) const
{
    RenderLayer layer = makeLayer(canvasSize().width, canvasSize().height);
    const auto colors = roomColors(rooms.size());

    for (size_t i = 0; i < rooms.size(); ++i) {
        std::vector<cv::Point> poly = toCanvasPolygon(rooms[i].verticesCm);
        if (poly.empty()) continue;

        const cv::Vec3b c = colors[i];
        fillPolygon(layer, poly, rgba(c[0], c[1], c[2], ROOM_FILL_ALPHA));
        drawPolygonEdges(layer, poly, rgba(c[0], c[1], c[2], 220), cfg_.edgeStampRadius);

        if (!cfg_.drawRoomLabels) continue;
        cv::Point2d sum(0, 0);
        for (const auto &p : poly) sum += cv::Point2d(p);
        std::string name = rooms[i].name;
        if (name.empty())
            name = "room" + std::to_string(rooms[i].id >= 0 ? rooms[i].id
                                                            : static_cast<int>(i) + 1);
        labels.push_back({name,
                          cv::Point(static_cast<int>(sum.x / poly.size()),
                                    static_cast<int>(sum.y / poly.size())),
                          labelSize(poly)});
    }
    return layer;
}

RenderLayer OverlayRenderer::regionLayer(const std::vector<Region> &regions,
                                         std::vector<LabelPlacement> &labels) const
{
    RenderLayer layer = makeLayer(canvasSize().width, canvasSize().height);
    const auto colors = roomColors(regions.size());

    for (size_t i = 0; i < regions.size(); ++i) {
        const Region &r = regions[i];
        const cv::Vec3b c = colors[i];
        const cv::Scalar fill = rgba(c[0], c[1], c[2], ROOM_FILL_ALPHA);

        for (const auto &p : r.pixels)
            cv::rectangle(layer, cv::Rect(p.x * scale_, p.y * scale_, scale_, scale_),
                          fill, cv::FILLED);

        if (!cfg_.drawRoomLabels || r.polygon.size() < 3) continue;
        std::vector<cv::Point> poly;
        for (const auto &p : r.polygon)
            poly.push_back(cellCentre(PixelPoint(p.x, p.y)));

        const cv::Point2d a = r.anchor();
        labels.push_back({r.name,
                          cellCentre(PixelPoint(static_cast<int>(a.x),
                                                static_cast<int>(a.y))),
                          labelSize(poly)});
    }
    return layer;
}

RenderLayer OverlayRenderer::forbiddenLayer(const std::vector<ForbiddenZone> &zones) const
{
    RenderLayer layer = makeLayer(canvasSize().width, canvasSize().height);

    for (const auto &zone : zones) {
        std::vector<cv::Point> poly = toCanvasPolygon(zone.verticesCm);
        if (poly.empty()) continue;

        const bool noGo = zone.type == ZoneType::NO_GO;
        fillPolygon(layer, poly, noGo ? NOGO_FILL : NOMOP_FILL);
        drawHatch(layer, poly, cfg_.hatchSpacing, noGo,
                  noGo ? NOGO_HATCH : NOMOP_HATCH, HATCH_THICKNESS);
        drawPolygonEdges(layer, poly, noGo ? NOGO_BORDER : NOMOP_BORDER,
                         cfg_.edgeStampRadius);
    }
    return layer;
}

RenderLayer OverlayRenderer::chargerLayer(const ChargerPose &charger) const
{
    RenderLayer layer = makeLayer(canvasSize().width, canvasSize().height);

    const PixelPoint cell = transform_.worldToPixel(charger.position);
    if (!transform_.inBounds(cell)) return layer;   // off-canvas: not drawn

    drawChargerIcon(layer, cellCentre(cell), cfg_.chargerRadius);
    return layer;
}

/* ───────────────────────── Compositing ──────────────────────────── */
cv::Mat composeLayers(const RenderLayer &base, const std::vector<RenderLayer> &overlays)
{
    cv::Mat out = base.clone();
    for (const auto &layer : overlays)
        compositeOver(out, layer);
    return out;
}

OverlayFrame renderOverlays(const OccupancyGrid &grid,
                            const std::vector<Region> &regions,
                            const AreaInfo &area,
                            const ChargerPose &charger,
                            const RenderConfig &cfg)
{
    const CoordinateTransform transform(grid);
    const OverlayRenderer renderer(transform, cfg);

    OverlayFrame frame;
    RenderLayer base = renderBaseLayer(grid, std::max(1, cfg.canvasScale));

    const bool useExplicit =
        cfg.roomSource == RoomSource::EXPLICIT
     || (cfg.roomSource == RoomSource::AUTO && !area.rooms.empty());

    RenderLayer rooms = useExplicit ? renderer.roomLayer(area.rooms, frame.labels)
                                    : renderer.regionLayer(regions, frame.labels);

    frame.composite = composeLayers(base, { rooms,
                                            renderer.forbiddenLayer(area.forbiddenZones),
                                            renderer.chargerLayer(charger) });
    return frame;
}

} // namespace vacmap
