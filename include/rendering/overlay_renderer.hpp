#ifndef VACMAP_OVERLAY_RENDERER_HPP
#define VACMAP_OVERLAY_RENDERER_HPP

#include <string>
#include <vector>
#include <opencv2/core.hpp>

#include "core/config.hpp"
#include "mapping/coordinate_transform.hpp"
#include "mapping/map_types.hpp"
#include "rendering/layer.hpp"

namespace vacmap {

/** A label whose text is placed after orientation correction, so it
    reads upright; position is in pre-orientation canvas pixels.     */
struct LabelPlacement
{
    std::string text;
    cv::Point   anchor;
    int         pixelSize{LABEL_FONT_PX};
};

/** Result of compositing, before orientation. */
struct OverlayFrame
{
    cv::Mat composite;               // CV_8UC4, canvas size
    std::vector<LabelPlacement> labels;
};

/* ───── Palette ──────────────────────────────────────────────────── */
/** n visually distinct RGB colours: a fixed set first, then HSV steps. */
std::vector<cv::Vec3b> roomColors(size_t n);

/* ───── Primitive rasterizers (all clip silently) ─────────────────── */
RenderLayer renderBaseLayer(const OccupancyGrid &grid, int scale);

/** Parametric edge sampling (3·max(|dx|,|dy|) steps per edge), each
    sample stamped as a (2r+1)² square.                            */
void drawPolygonEdges(RenderLayer &layer, const std::vector<cv::Point> &polygon,
                      const cv::Scalar &color, int stampRadius);

void fillPolygon(RenderLayer &layer, const std::vector<cv::Point> &polygon,
                 const cv::Scalar &color);

/** Diagonal stripes every `spacing` px across the polygon's bounding
    box; both diagonals when `crossed`.                            */
void drawHatch(RenderLayer &layer, const std::vector<cv::Point> &polygon,
               int spacing, bool crossed, const cv::Scalar &color, int thickness);

void drawChargerIcon(RenderLayer &layer, cv::Point centre, int radius);

/* ───── Layer builders ───────────────────────────────────────────── */
class OverlayRenderer
{
public:
    OverlayRenderer(const CoordinateTransform &transform, const RenderConfig &cfg);

    RenderLayer roomLayer(const std::vector<RoomArea> &rooms,
                          std::vector<LabelPlacement> &labels) const;
    RenderLayer regionLayer(const std::vector<Region> &regions,
                            std::vector<LabelPlacement> &labels) const;
    RenderLayer forbiddenLayer(const std::vector<ForbiddenZone> &zones) const;
    RenderLayer chargerLayer(const ChargerPose &charger) const;

    /** Grid cell → centre of its canvas block. */
    cv::Point cellCentre(const PixelPoint &cell) const;
    /** Polygon in cm → canvas polygon; empty if fewer than 3 vertices. */
    std::vector<cv::Point> toCanvasPolygon(const std::vector<WorldPoint> &verticesCm) const;

    inline cv::Size canvasSize() const
    {
        return { transform_.width() * scale_, transform_.height() * scale_ };
    }

private:
    int labelSize(const std::vector<cv::Point> &polygon) const;

    const CoordinateTransform &transform_;
    const RenderConfig &cfg_;
    int scale_;
};

/** base → room fills → forbidden zones → charger. */
cv::Mat composeLayers(const RenderLayer &base, const std::vector<RenderLayer> &overlays);

/** Builds every layer for one map and composites them. */
OverlayFrame renderOverlays(const OccupancyGrid &grid,
                            const std::vector<Region> &regions,
                            const AreaInfo &area,
                            const ChargerPose &charger,
                            const RenderConfig &cfg);

} // namespace vacmap

#endif // VACMAP_OVERLAY_RENDERER_HPP
