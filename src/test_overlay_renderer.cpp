#include "core/config.hpp"
#include "mapping/coordinate_transform.hpp"
#include "rendering/finishing.hpp"
#include "rendering/layer.hpp"
#include "rendering/orientation.hpp"
#include "rendering/overlay_renderer.hpp"
#include <iostream>
#include <set>
#include <string>
#include <vector>

using namespace vacmap;

static int g_failures = 0;

void printTestHeader(const std::string& testName) {
    std::cout << "\n" << std::string(50, '=') << "\n";
    std::cout << testName << "\n";
    std::cout << std::string(50, '=') << "\n";
}

void report(bool success, const std::string& detail = "") {
    std::cout << "RESULT: " << (success ? "✓ PASS" : "✗ FAIL");
    if (!detail.empty()) std::cout << " (" << detail << ")";
    std::cout << "\n";
    if (!success) ++g_failures;
}

OccupancyGrid freeGrid(int w, int h) {
    OccupancyGrid g;
    g.width = w;
    g.height = h;
    g.resolution = 0.05;
    g.cells.assign(static_cast<size_t>(w * h), CellState::FREE);
    return g;
}

std::vector<WorldPoint> squareCm(double x0, double y0, double x1, double y1) {
    return { WorldPoint(x0, y0), WorldPoint(x1, y0), WorldPoint(x1, y1), WorldPoint(x0, y1) };
}

bool identical(const cv::Mat& a, const cv::Mat& b) {
    return a.size() == b.size() && a.type() == b.type() && cv::norm(a, b, cv::NORM_INF) == 0.0;
}

void test1_OffCanvasZoneLeavesBaseUntouched() {
    printTestHeader("TEST 1: FORBIDDEN ZONE ENTIRELY OFF CANVAS");
    std::cout << "Expected: composite == base layer, no error\n\n";

    OccupancyGrid grid = freeGrid(4, 4);
    grid.cells[grid.index(1, 1)] = CellState::UNKNOWN;
    grid.cells[grid.index(2, 2)] = CellState::OBSTACLE;

    AreaInfo area;
    ForbiddenZone far;
    far.verticesCm = { WorldPoint(10000, 10000), WorldPoint(10100, 10000), WorldPoint(10000, 10100) };
    ForbiddenZone behind;
    behind.type = ZoneType::NO_MOP;
    behind.verticesCm = { WorldPoint(-900, -900), WorldPoint(-800, -900), WorldPoint(-900, -800) };
    ForbiddenZone degenerate;
    degenerate.verticesCm = { WorldPoint(5, 5), WorldPoint(10, 10) };
    area.forbiddenZones = { far, behind, degenerate };

    ChargerPose charger;
    charger.position = WorldPoint(50.0, 50.0);

    RenderConfig cfg;
    OverlayFrame frame = renderOverlays(grid, {}, area, charger, cfg);
    cv::Mat base = renderBaseLayer(grid, cfg.canvasScale);

    report(identical(frame.composite, base) && frame.labels.empty());
}

void test2_BaseLayerColours() {
    printTestHeader("TEST 2: BASE LAYER CELL BLOCKS");

    OccupancyGrid grid = freeGrid(3, 3);
    grid.cells[grid.index(2, 0)] = CellState::OBSTACLE;
    grid.cells[grid.index(0, 2)] = CellState::UNKNOWN;

    cv::Mat base = renderBaseLayer(grid, 2);
    const cv::Vec4b freePx = base.at<cv::Vec4b>(0, 0);
    const cv::Vec4b obsPx  = base.at<cv::Vec4b>(1, 5);     // inside block (2,0)
    const cv::Vec4b unkPx  = base.at<cv::Vec4b>(5, 1);     // inside block (0,2)

    bool success = base.cols == 6 && base.rows == 6
                && freePx == cv::Vec4b(255, 255, 255, 255)
                && obsPx[0] < 100 && obsPx[3] == 255
                && unkPx[0] > obsPx[0] && unkPx[0] < 255;
    report(success);
}

void test3_ZoneColours() {
    printTestHeader("TEST 3: NO-GO RED, NO-MOP BLUE");

    OccupancyGrid grid = freeGrid(50, 50);     // 2.5 m square, canvas 100 px
    RenderConfig cfg;
    ChargerPose noCharger;
    noCharger.position = WorldPoint(-10.0, -10.0);

    AreaInfo nogo;
    nogo.forbiddenZones.push_back({ squareCm(50, 50, 200, 200), ZoneType::NO_GO });
    cv::Vec4b red = renderOverlays(grid, {}, nogo, noCharger, cfg).composite.at<cv::Vec4b>(50, 50);

    AreaInfo nomop;
    nomop.forbiddenZones.push_back({ squareCm(50, 50, 200, 200), ZoneType::NO_MOP });
    cv::Vec4b blue = renderOverlays(grid, {}, nomop, noCharger, cfg).composite.at<cv::Vec4b>(50, 50);

    // BGRA
    bool success = red[2] == 255 && red[0] < 255
                && blue[0] == 255 && blue[2] < 255;
    report(success);
}

void test4_ChargerMarker() {
    printTestHeader("TEST 4: CHARGER MARKER");

    OccupancyGrid grid = freeGrid(50, 50);
    RenderConfig cfg;
    ChargerPose charger;
    charger.position = WorldPoint(1.275, 1.275);   // cell (25,25)

    CoordinateTransform tf(grid);
    OverlayRenderer renderer(tf, cfg);
    const cv::Point c = renderer.cellCentre(tf.worldToPixel(charger.position));

    cv::Mat img = renderOverlays(grid, {}, AreaInfo{}, charger, cfg).composite;

    const cv::Vec4b body = img.at<cv::Vec4b>(c.y, c.x + 7);
    bool ringFound = false;
    for (int dx = cfg.chargerRadius + 1; dx <= cfg.chargerRadius + 5; ++dx) {
        const cv::Vec4b px = img.at<cv::Vec4b>(c.y, c.x + dx);
        if (px[0] < 120 && px[1] > 200 && px[2] > 200) ringFound = true;
    }
    std::cout << "Centre: (" << c.x << "," << c.y << ")\n";
    report(c == cv::Point(51, 51) && body == cv::Vec4b(0, 0, 255, 255) && ringFound);
}

void test5_ExplicitRoomLabels() {
    printTestHeader("TEST 5: EXPLICIT ROOMS PRODUCE LABELS");

    OccupancyGrid grid = freeGrid(80, 80);
    RenderConfig cfg;
    ChargerPose charger;

    AreaInfo area;
    RoomArea kitchen;
    kitchen.verticesCm = squareCm(20, 20, 150, 150);
    kitchen.name = "kitchen";
    RoomArea unnamed;
    unnamed.verticesCm = squareCm(200, 200, 380, 380);
    unnamed.id = 7;
    RoomArea sliver;
    sliver.verticesCm = { WorldPoint(0, 0), WorldPoint(10, 10) };
    area.rooms = { kitchen, unnamed, sliver };

    OverlayFrame frame = renderOverlays(grid, {}, area, charger, cfg);
    bool success = frame.labels.size() == 2
                && frame.labels[0].text == "kitchen"
                && frame.labels[1].text == "room7"
                && frame.labels[0].pixelSize >= 10 && frame.labels[0].pixelSize <= 22;
    report(success);
}

void test6_OrientationMapping() {
    printTestHeader("TEST 6: ORIENTATION (x, y) -> (x, H-1-y)");

    cv::Mat img(4, 3, CV_8UC4, cv::Scalar(0, 0, 0, 255));
    img.at<cv::Vec4b>(0, 1) = cv::Vec4b(9, 9, 9, 255);     // (x=1, y=0)
    img.at<cv::Vec4b>(2, 0) = cv::Vec4b(7, 7, 7, 255);     // (x=0, y=2)

    correctOrientation(img);
    cv::Point p = orientedPoint({1, 0}, img.size());

    bool success = img.at<cv::Vec4b>(3, 1) == cv::Vec4b(9, 9, 9, 255)
                && img.at<cv::Vec4b>(1, 0) == cv::Vec4b(7, 7, 7, 255)
                && p == cv::Point(1, 3);
    report(success);
}

void test7_Palette() {
    printTestHeader("TEST 7: ROOM PALETTE");

    auto colors = roomColors(9);
    std::set<std::vector<int>> unique;
    for (const auto& c : colors) unique.insert({c[0], c[1], c[2]});

    bool success = colors.size() == 9 && unique.size() == 9
                && colors[0] == cv::Vec3b(255, 195, 0);
    report(success);
}

void test8_EdgeStampClipped() {
    printTestHeader("TEST 8: EDGE STAMPS CLIP AT CANVAS BORDER");

    RenderLayer layer = makeLayer(10, 10);
    std::vector<cv::Point> poly = { {-5, -5}, {5, -5}, {5, 5}, {-5, 5} };
    drawPolygonEdges(layer, poly, rgba(0, 255, 0), 1);

    bool success = layer.at<cv::Vec4b>(5, 5)[3] == 255      // corner stamped
                && layer.at<cv::Vec4b>(0, 5)[3] == 255      // right edge
                && layer.at<cv::Vec4b>(8, 8)[3] == 0;       // outside polygon
    report(success);
}

std::vector<int> setColumns(const RenderLayer& layer, int row) {
    std::vector<int> xs;
    for (int x = 0; x < layer.cols; ++x)
        if (layer.at<cv::Vec4b>(row, x)[3] != 0) xs.push_back(x);
    return xs;
}

void test9_HatchStripes() {
    printTestHeader("TEST 9: HATCH STRIPES AND CROSS DIAGONAL");
    std::cout << "100x100 box, spacing 20, row 50\n\n";

    const std::vector<cv::Point> box = { {0, 0}, {99, 0}, {99, 99}, {0, 99} };
    const cv::Scalar red = rgba(255, 0, 0);

    RenderLayer single = makeLayer(100, 100);
    drawHatch(single, box, 20, false, red, 1);
    RenderLayer crossed = makeLayer(100, 100);
    drawHatch(crossed, box, 20, true, red, 1);

    // "/" stripes cross row 50 at x = i - 50, the "\\" stripes at x = i - 49
    const std::vector<int> rowSingle  = setColumns(single, 50);
    const std::vector<int> rowCrossed = setColumns(crossed, 50);

    bool periodic = rowSingle == std::vector<int>({10, 30, 50, 70, 90});
    bool secondOnlyWhenCrossed =
           single.at<cv::Vec4b>(50, 11)[3] == 0
        && crossed.at<cv::Vec4b>(50, 11) == cv::Vec4b(0, 0, 255, 255)
        && rowCrossed == std::vector<int>({10, 11, 30, 31, 50, 51, 70, 71, 90, 91});
    bool gapsEmpty = single.at<cv::Vec4b>(50, 20)[3] == 0
                  && crossed.at<cv::Vec4b>(50, 20)[3] == 0;

    std::cout << "uncrossed row hits: " << rowSingle.size()
              << ", crossed row hits: " << rowCrossed.size() << "\n";
    report(periodic && secondOnlyWhenCrossed && gapsEmpty);
}

void test10_ZoneBorderDrawnLast() {
    printTestHeader("TEST 10: ZONE BORDER OVER HATCH AND FILL");

    OccupancyGrid grid = freeGrid(50, 50);
    RenderConfig cfg;
    CoordinateTransform tf(grid);
    OverlayRenderer renderer(tf, cfg);

    std::vector<ForbiddenZone> zones = { { squareCm(50, 50, 200, 200), ZoneType::NO_GO } };
    RenderLayer layer = renderer.forbiddenLayer(zones);

    // canvas vertex (20,20) lies on the first hatch stripe and on the border
    const cv::Vec4b corner = layer.at<cv::Vec4b>(20, 20);
    bool success = corner == cv::Vec4b(0, 0, 255, 200);
    std::cout << "corner BGRA: " << corner << "\n";
    report(success);
}

void test11_ColourPasses() {
    printTestHeader("TEST 11: CONTRAST AND SATURATION PASSES");

    cv::Mat empty;
    bool emptyOk = true;
    try {
        adjustContrast(empty, 1.1);
        adjustSaturation(empty, 1.2);
    } catch (const cv::Exception& e) {
        std::cout << "Unexpected: " << e.what() << "\n";
        emptyOk = false;
    }

    cv::Mat img(2, 2, CV_8UC4, cv::Scalar(128, 128, 128, 77));
    img.at<cv::Vec4b>(0, 0) = cv::Vec4b(40, 90, 200, 10);
    adjustSaturation(img, 1.5);
    bool greyStaysGrey = img.at<cv::Vec4b>(1, 1) == cv::Vec4b(128, 128, 128, 77);
    const cv::Vec4b boosted = img.at<cv::Vec4b>(0, 0);
    bool spreadGrew = (boosted[2] - boosted[0]) > (200 - 40);

    adjustContrast(img, 1.1);
    bool alphaKept = img.at<cv::Vec4b>(0, 0)[3] == 10 && img.at<cv::Vec4b>(1, 1)[3] == 77;

    report(emptyOk && greyStaysGrey && spreadGrew && alphaKept);
}

int main() {
    std::cout << "╔══════════════════════════════════════════════╗\n";
    std::cout << "║          OVERLAY RENDERER TESTS              ║\n";
    std::cout << "╚══════════════════════════════════════════════╝\n";

    test1_OffCanvasZoneLeavesBaseUntouched();
    test2_BaseLayerColours();
    test3_ZoneColours();
    test4_ChargerMarker();
    test5_ExplicitRoomLabels();
    test6_OrientationMapping();
    test7_Palette();
    test8_EdgeStampClipped();
    test9_HatchStripes();
    test10_ZoneBorderDrawnLast();
    test11_ColourPasses();

    std::cout << "\n" << std::string(60, '=') << "\n";
    std::cout << (g_failures == 0 ? "ALL TESTS PASSED" : "SOME TESTS FAILED")
              << " (" << g_failures << " failures)\n";
    std::cout << std::string(60, '=') << "\n";
    return g_failures == 0 ? 0 : 1;
}
