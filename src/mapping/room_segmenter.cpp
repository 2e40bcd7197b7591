#include "mapping/room_segmenter.hpp"
#include <algorithm>
#include <iostream>
#include <map>
#include <queue>
#include <opencv2/imgproc.hpp>

namespace vacmap {

/* ───────────────────────── Flood fill ───────────────────────────── */
std::vector<cv::Point> floodFill(const OccupancyGrid &grid,
                                 cv::Point seed,
                                 std::vector<uint8_t> &visited)
{
    std::vector<cv::Point> pixels;
    if (!grid.contains(seed.x, seed.y)) return pixels;

    const size_t seedIdx = grid.index(seed.x, seed.y);
    if (visited[seedIdx] || grid.cells[seedIdx] != CellState::FREE)
        return pixels;

    static const int DX[4] = { 0, 1,  0, -1 };
    static const int DY[4] = { 1, 0, -1,  0 };

    std::queue<cv::Point> frontier;
    visited[seedIdx] = 1;
    frontier.push(seed);
    pixels.push_back(seed);

    while (!frontier.empty()) {
        cv::Point c = frontier.front();
        frontier.pop();

        for (int k = 0; k < 4; ++k) {
            int nx = c.x + DX[k], ny = c.y + DY[k];
            if (!grid.contains(nx, ny)) continue;

            size_t idx = grid.index(nx, ny);
            if (visited[idx] || grid.cells[idx] != CellState::FREE) continue;

            visited[idx] = 1;
            frontier.emplace(nx, ny);
            pixels.emplace_back(nx, ny);
        }
    }
    return pixels;
}

static void sortAndName(std::vector<Region> &regions)
{
    // descending area, discovery order on ties
    std::stable_sort(regions.begin(), regions.end(),
                     [](const Region &a, const Region &b) { return a.area > b.area; });
    for (auto &r : regions)
        if (r.name.empty()) r.name = "room" + std::to_string(r.id);
}

std::vector<Region> detectRooms(const OccupancyGrid &grid,
                                int minRoomSize,
                                double simplifyFactor,
                                bool verbose)
{
    std::vector<Region> rooms;
    std::vector<uint8_t> visited(grid.cells.size(), 0);
    int discovered = 0;

    for (int y = 0; y < grid.height; ++y)
        for (int x = 0; x < grid.width; ++x)
        {
            const size_t idx = grid.index(x, y);
            if (visited[idx] || grid.cells[idx] != CellState::FREE) continue;

            std::vector<cv::Point> area = floodFill(grid, {x, y}, visited);
            ++discovered;
            if (static_cast<int>(area.size()) < minRoomSize) continue;

            Region r;
            r.id     = static_cast<int>(rooms.size()) + 1;
            r.area   = static_cast<int>(area.size());
            r.pixels = std::move(area);
            r.polygon = boundaryPolygon(r.pixels, simplifyFactor);
            rooms.push_back(std::move(r));
        }

    sortAndName(rooms);
    if (verbose)
        std::cout << "[RoomSegmenter] flood fill: " << discovered << " components, "
                  << rooms.size() << " >= " << minRoomSize << " cells\n";
    return rooms;
}

/* ─────────────────────── Boundary polygon ───────────────────────── */
static std::vector<cv::Point> boundingBox(const std::vector<cv::Point> &points)
{
    cv::Rect box = cv::boundingRect(points);
    const int x0 = box.x, y0 = box.y;
    const int x1 = box.x + box.width - 1, y1 = box.y + box.height - 1;
    return { {x0, y0}, {x1, y0}, {x1, y1}, {x0, y1} };
}

std::vector<cv::Point> boundaryPolygon(const std::vector<cv::Point> &points,
                                       double simplifyFactor)
{
    if (points.empty()) return {};
    if (points.size() < HULL_MIN_POINTS) return boundingBox(points);

    std::vector<cv::Point> hull;
    cv::convexHull(points, hull);
    if (hull.size() < 3) return boundingBox(points);

    if (simplifyFactor < 1.0 && hull.size() > 10) {
        const size_t step = std::max<size_t>(
            1, static_cast<size_t>(hull.size() * (1.0 - simplifyFactor)));
        std::vector<cv::Point> simplified;
        for (size_t i = 0; i < hull.size(); i += step)
            simplified.push_back(hull[i]);
        if (simplified.size() >= 3) return simplified;
    }
    return hull;
}

/* ─────────────────────── Segment channel ────────────────────────── */
static std::map<int, int> labelCounts(const cv::Mat &values)
{
    std::map<int, int> counts;
    for (int y = 0; y < values.rows; ++y)
        for (int x = 0; x < values.cols; ++x)
            ++counts[static_cast<int>(values.at<double>(y, x))];
    return counts;
}

static SegmentChannel keepLabels(const cv::Mat &values,
                                 const std::map<int, int> &counts,
                                 const ProbeCandidate &layout,
                                 int minPixels)
{
    SegmentChannel ch;
    ch.layout = layout;
    ch.labels = cv::Mat::zeros(values.rows, values.cols, CV_32S);

    for (int y = 0; y < values.rows; ++y)
        for (int x = 0; x < values.cols; ++x)
        {
            int id = static_cast<int>(values.at<double>(y, x));
            if (id > 0 && counts.at(id) > minPixels)
                ch.labels.at<int>(y, x) = id;
        }

    for (const auto &kv : counts)
        if (kv.first > 0 && kv.second > minPixels) ++ch.roomCount;
    return ch;
}

std::optional<SegmentChannel> parseSegmentChannel(const std::vector<uint8_t> &blob,
                                                  int width, int height,
                                                  int minPixels)
{
    using ET = ElementType;
    using RO = ReshapeOrder;
    static const ProbeCandidate FIXED[] = {
        {16, ET::U8,  RO::ROW_MAJOR},
        {20, ET::U8,  RO::ROW_MAJOR},
        {32, ET::U8,  RO::ROW_MAJOR},
        {16, ET::U8,  RO::COLUMN_MAJOR},
        {20, ET::U8,  RO::COLUMN_MAJOR},
        { 0, ET::U8,  RO::ROW_MAJOR},
        { 0, ET::U8,  RO::COLUMN_MAJOR},
        { 0, ET::U16, RO::ROW_MAJOR},
        {16, ET::U16, RO::ROW_MAJOR},
    };

    for (const auto &c : FIXED) {
        cv::Mat values = extractSlice(blob, width, height, c);
        if (values.empty()) continue;

        auto counts = labelCounts(values);
        if (counts.size() < 2) continue;

        SegmentChannel ch = keepLabels(values, counts, c, minPixels);
        if (ch.roomCount > 0) return ch;
    }

    // Exhaustive u8 scan: few distinct values, every room reasonably large
    const size_t cells = static_cast<size_t>(width) * static_cast<size_t>(height);
    if (blob.size() <= cells) return std::nullopt;
    const size_t limit = std::min(PROBE_SCAN_LIMIT, blob.size() - cells);

    for (size_t off = 0; off < limit; off += PROBE_SCAN_STEP) {
        ProbeCandidate c{off, ET::U8, RO::ROW_MAJOR};
        if (!evaluateCandidate(blob, width, height, c,
                               ProbeMode::AUTO, PROBE_MAX_DISTINCT))
            continue;

        cv::Mat values = extractSlice(blob, width, height, c);
        auto counts = labelCounts(values);

        bool plausible = false;
        bool allLarge  = true;
        for (const auto &kv : counts) {
            if (kv.first <= 0) continue;
            plausible = true;
            if (kv.second <= minPixels) { allLarge = false; break; }
        }
        if (plausible && allLarge)
            return keepLabels(values, counts, c, minPixels);
    }
    return std::nullopt;
}

std::vector<Region> regionsFromLabels(const cv::Mat &labels, double simplifyFactor)
{
    std::map<int, std::vector<cv::Point>> byLabel;
    for (int y = 0; y < labels.rows; ++y)
        for (int x = 0; x < labels.cols; ++x)
        {
            int id = labels.at<int>(y, x);
            if (id > 0) byLabel[id].emplace_back(x, y);
        }

    std::vector<Region> regions;
    for (auto &kv : byLabel) {
        Region r;
        r.id      = kv.first;
        r.area    = static_cast<int>(kv.second.size());
        r.pixels  = std::move(kv.second);
        r.polygon = boundaryPolygon(r.pixels, simplifyFactor);
        regions.push_back(std::move(r));
    }
    sortAndName(regions);
    return regions;
}

/* ─────────────────────────── Entry ──────────────────────────────── */
std::vector<Region> segmentRooms(const OccupancyGrid &grid,
                                 const std::vector<uint8_t> *segmentBlob,
                                 const RenderConfig &cfg,
                                 cv::Mat *labelsOut)
{
    std::vector<Region> rooms;
    bool fromChannel = false;

    if (segmentBlob && !segmentBlob->empty()) {
        auto channel = parseSegmentChannel(*segmentBlob, grid.width, grid.height,
                                           cfg.minSegmentPixels);
        if (channel) {
            rooms = regionsFromLabels(channel->labels, cfg.simplifyFactor);
            fromChannel = true;

            const size_t before = rooms.size();
            rooms.erase(std::remove_if(rooms.begin(), rooms.end(),
                                       [&](const Region &r) { return r.area < cfg.minRoomSize; }),
                        rooms.end());
            if (cfg.verbose)
                std::cout << "[RoomSegmenter] segment map: " << channel->roomCount
                          << " labels (" << describe(channel->layout) << "), "
                          << rooms.size() << " >= " << cfg.minRoomSize << " cells"
                          << (before != rooms.size() ? ", small labels dropped" : "")
                          << '\n';
        } else {
            std::cerr << "[RoomSegmenter] segment map unreadable, using flood fill\n";
        }
    }

    if (!fromChannel)
        rooms = detectRooms(grid, cfg.minRoomSize, cfg.simplifyFactor, cfg.verbose);

    if (labelsOut) {
        *labelsOut = cv::Mat::zeros(grid.height, grid.width, CV_32S);
        for (const auto &r : rooms)
            for (const auto &p : r.pixels)
                labelsOut->at<int>(p.y, p.x) = r.id;
    }
    return rooms;
}

} // namespace vacmap
