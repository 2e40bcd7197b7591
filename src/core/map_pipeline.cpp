#include "core/map_pipeline.hpp"
#include <iostream>
#include <utility>
#include <boost/filesystem.hpp>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

#include "io/image_encoder.hpp"
#include "mapping/grid_decoder.hpp"
#include "mapping/room_segmenter.hpp"
#include "rendering/finishing.hpp"
#include "rendering/orientation.hpp"
#include "rendering/overlay_renderer.hpp"
#include "rendering/text_renderer.hpp"
#include "utils.hpp"

namespace fs = boost::filesystem;

namespace vacmap {

/* ───────────────────────── debug dumps ──────────────────────────── */
static void dumpImage(const RenderConfig &cfg, const std::string &name, const cv::Mat &img)
{
    if (cfg.debugMode != DebugMode::DEBUG_DUMP || img.empty()) return;

    const std::string path = (fs::path(cfg.debugDir) / name).string();
    try {
        if (!cv::imwrite(path, img))
            std::cerr << "[MapPipeline] debug dump failed: " << path << '\n';
        else if (cfg.verbose)
            std::cout << "[MapPipeline] debug dump: " << path << '\n';
    } catch (const cv::Exception &e) {
        std::cerr << "[MapPipeline] debug dump failed: " << path
                  << " (" << e.what() << ")\n";
    }
}

static cv::Mat gridImage(const OccupancyGrid &grid)
{
    cv::Mat img(grid.height, grid.width, CV_8UC1);
    for (int y = 0; y < grid.height; ++y)
        for (int x = 0; x < grid.width; ++x)
        {
            uint8_t v = 0;
            switch (grid.at(x, y)) {
                case CellState::FREE:     v = 255; break;
                case CellState::UNKNOWN:  v = 127; break;
                case CellState::OBSTACLE: v = 0;   break;
            }
            img.at<uint8_t>(y, x) = v;
        }
    return img;
}

static cv::Mat labelImage(const cv::Mat &labels)
{
    if (labels.empty()) return {};

    double maxLabel = 0.0;
    cv::minMaxLoc(labels, nullptr, &maxLabel);
    const auto colors = roomColors(static_cast<size_t>(maxLabel));

    cv::Mat img(labels.size(), CV_8UC3, cv::Scalar(0, 0, 0));
    for (int y = 0; y < labels.rows; ++y)
        for (int x = 0; x < labels.cols; ++x)
        {
            int l = labels.at<int>(y, x);
            if (l <= 0 || l > static_cast<int>(colors.size())) continue;
            const cv::Vec3b &c = colors[l - 1];
            img.at<cv::Vec3b>(y, x) = cv::Vec3b(c[2], c[1], c[0]);
        }
    return img;
}

static void logGridStats(const OccupancyGrid &grid)
{
    std::cout << "[MapPipeline] grid " << grid.width << "x" << grid.height
              << " @ " << grid.resolution << " m/cell"
              << "  free=" << grid.count(CellState::FREE)
              << " obstacle=" << grid.count(CellState::OBSTACLE)
              << " unknown=" << grid.count(CellState::UNKNOWN) << '\n';
}

/* ───────────────────────── entry point ──────────────────────────── */
bool convertMap(const MapInputs &inputs, const RenderConfig &cfg,
                ConvertResult &result, PipelineError &err)
{
    // 1. decode
    size_t offset = 0;
    if (!resolveGridOffset(inputs.mapBlob, inputs.info, cfg, offset, err))
        return false;

    OccupancyGrid grid;
    if (!decodeGrid(inputs.mapBlob, offset, inputs.info, grid, err))
        return false;

    if (cfg.verbose) logGridStats(grid);
    dumpImage(cfg, "debug_grid.png", gridImage(grid));

    // 2. rooms (skipped when explicit polygons drive the room layer)
    const bool explicitRooms =
        cfg.roomSource == RoomSource::EXPLICIT
     || (cfg.roomSource == RoomSource::AUTO && !inputs.area.rooms.empty());

    std::vector<Region> regions;
    if (!explicitRooms) {
        cv::Mat labels;
        regions = segmentRooms(grid,
                               inputs.segmentBlob.empty() ? nullptr : &inputs.segmentBlob,
                               cfg, &labels);
        dumpImage(cfg, "debug_segments.png", labelImage(labels));
    }

    // 3. overlays
    OverlayFrame frame = renderOverlays(grid, regions, inputs.area, inputs.charger, cfg);

    if (cfg.debugMode == DebugMode::DEBUG_DUMP) {
        cv::Mat original = upscale(frame.composite, cfg.upscaleFactor);
        dumpImage(cfg, "vacuum_map_original.png", original);
    }

    // 4. orientation + finishing
    cv::Mat image = frame.composite;
    correctOrientation(image);

    TextRenderer text(cfg.fontCandidates);
    if (cfg.verbose && !text.hasTrueType())
        std::cout << "[MapPipeline] no TrueType font found, using built-in glyphs\n";
    applyFinishing(image, frame.labels, cfg, text);

    // 5. encode
    ConvertResult out;
    out.image = upscale(image, cfg.upscaleFactor);
    if (!encodePng(out.image, out.png, err))
        return false;
    out.base64 = utils::base64Encode(out.png);

    result = std::move(out);
    return true;
}

} // namespace vacmap
