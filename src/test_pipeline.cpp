#include "core/map_pipeline.hpp"
#include "io/image_encoder.hpp"
#include "io/metadata_loader.hpp"
#include "utils.hpp"
#include <fstream>
#include <iostream>
#include <iterator>
#include <string>
#include <vector>
#include <boost/filesystem.hpp>

namespace fs = boost::filesystem;
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

std::vector<uint8_t> bytesOf(const std::string& s) {
    return std::vector<uint8_t>(s.begin(), s.end());
}

MapInputs sampleInputs() {
    MapInputs in;
    in.info.width = 20;
    in.info.height = 20;
    in.info.resolution = 0.05;
    in.mapBlob.assign(400, RAW_FREE);
    for (int x = 0; x < 20; ++x) {
        in.mapBlob[x] = 200;                 // top wall
        in.mapBlob[19 * 20 + x] = RAW_UNKNOWN;
    }
    in.charger.position = WorldPoint(0.525, 0.525);

    ForbiddenZone zone;
    zone.verticesCm = { WorldPoint(30, 30), WorldPoint(70, 30), WorldPoint(70, 70), WorldPoint(30, 70) };
    in.area.forbiddenZones.push_back(zone);
    return in;
}

RenderConfig quietConfig() {
    RenderConfig cfg;
    cfg.verbose = false;
    cfg.timestamp = "2024-01-01 00:00:00";
    cfg.minRoomSize = 10;
    return cfg;
}

void test1_Base64() {
    printTestHeader("TEST 1: BASE64 ENCODING");

    bool success = utils::base64Encode(bytesOf("Man")) == "TWFu"
                && utils::base64Encode(bytesOf("Ma"))  == "TWE="
                && utils::base64Encode(bytesOf("M"))   == "TQ=="
                && utils::base64Encode({}).empty()
                && utils::base64Encode({0xFF, 0xEF}) == "/+8=";
    report(success);
}

void test2_SidecarPath() {
    printTestHeader("TEST 2: SIDECAR PATH");

    bool success = sidecarPath("foo.png") == "foo.base64.txt"
                && sidecarPath("out/maps/vacuum_map.png") == "out/maps/vacuum_map.base64.txt"
                && sidecarPath("render") == "render.base64.txt";
    report(success, sidecarPath("foo.png"));
}

void test3_MapInfoParsing() {
    printTestHeader("TEST 3: MAP RECORD METADATA");

    MapInfo info;
    PipelineError err;
    bool good = parseMapInfo(
        R"({"width": 200, "height": 150, "resolution": 0.05, "x_min": -4.5, "y_min": 2.0})",
        info, err);
    bool goodOk = good && info.width == 200 && info.height == 150
               && info.resolution == 0.05 && info.xMin == -4.5 && info.yMin == 2.0;

    MapInfo missing;
    PipelineError errMissing;
    bool noWidth = parseMapInfo(
        R"({"height": 150, "resolution": 0.05, "x_min": 0, "y_min": 0})",
        missing, errMissing);

    MapInfo typed;
    PipelineError errTyped;
    bool badRes = parseMapInfo(
        R"({"width": 10, "height": 10, "resolution": "fine", "x_min": 0, "y_min": 0})",
        typed, errTyped);

    MapInfo broken;
    PipelineError errBroken;
    bool unparsable = parseMapInfo(R"({"width": 10,)", broken, errBroken);

    std::cout << "missing:  " << errMissing << "\n";
    std::cout << "typed:    " << errTyped << "\n";
    std::cout << "broken:   " << errBroken << "\n";

    bool success = goodOk
        && !noWidth && errMissing.kind == ErrorKind::MALFORMED_METADATA
        && errMissing.field.find("width") != std::string::npos
        && !badRes && errTyped.kind == ErrorKind::MALFORMED_METADATA
        && errTyped.field.find("resolution") != std::string::npos
        && !unparsable && errBroken.kind == ErrorKind::MALFORMED_METADATA;
    report(success);
}

void test4_ChargerAndAreaParsing() {
    printTestHeader("TEST 4: CHARGER POSE AND AREA INFO");

    ChargerPose pose;
    PipelineError err;
    bool chargerOk = parseChargerPose(R"({"charger_pose": [1.5, -0.25], "charger_phi": 3.14})",
                                      pose, err)
                  && pose.position == WorldPoint(1.5, -0.25) && pose.phi == 3.14;

    AreaInfo area;
    bool areaOk = parseAreaInfo(R"({
        "forbidAreaValue": [
            {"vertexs": [[0, 0], [100, 0], [100, 100]], "forbidType": "mop"},
            {"vertexs": [[0, 0], [50, 0], [50, 50], [0, 50]], "forbidType": "all"},
            {"vertexs": [[10, 10], [20, 20]]}
        ],
        "areaValue": [
            {"vertexs": [[0, 0], [300, 0], [300, 300]], "name": "hall", "id": 3}
        ]
    })", area, err);
    areaOk = areaOk && area.forbiddenZones.size() == 3
          && area.forbiddenZones[0].type == ZoneType::NO_MOP
          && area.forbiddenZones[1].type == ZoneType::NO_GO
          && area.forbiddenZones[2].type == ZoneType::NO_GO
          && area.forbiddenZones[1].verticesCm.size() == 4
          && area.rooms.size() == 1 && area.rooms[0].name == "hall" && area.rooms[0].id == 3;

    AreaInfo empty;
    PipelineError errEmpty;
    bool emptyOk = parseAreaInfo("", empty, errEmpty) && empty.forbiddenZones.empty()
                && parseAreaInfo("{}", empty, errEmpty) && empty.rooms.empty();

    AreaInfo bad;
    PipelineError errBad;
    bool badVertex = parseAreaInfo(R"({"forbidAreaValue": [{"vertexs": [[0, "x"]]}]})",
                                   bad, errBad);
    bool badOk = !badVertex && errBad.kind == ErrorKind::MALFORMED_METADATA
              && errBad.field.find("forbidAreaValue[0]") != std::string::npos;

    std::cout << "charger=" << chargerOk << " area=" << areaOk
              << " empty=" << emptyOk << " bad=" << badOk << "\n";
    report(chargerOk && areaOk && emptyOk && badOk);
}

void test5_ConvertMapEndToEnd() {
    printTestHeader("TEST 5: END-TO-END CONVERSION");

    MapInputs in = sampleInputs();
    RenderConfig cfg = quietConfig();

    ConvertResult result;
    PipelineError err;
    bool ok = convertMap(in, cfg, result, err);
    if (!ok) std::cout << "Error: " << err << "\n";

    const int expected = in.info.width * cfg.canvasScale * cfg.upscaleFactor;
    bool success = ok
        && result.image.cols == expected && result.image.rows == expected
        && result.image.type() == CV_8UC4
        && result.png.size() > 8
        && result.png[0] == 0x89 && result.png[1] == 'P'
        && result.png[2] == 'N'  && result.png[3] == 'G'
        && result.base64 == utils::base64Encode(result.png);
    report(success, std::to_string(result.png.size()) + " PNG bytes");
}

void test6_Deterministic() {
    printTestHeader("TEST 6: IDENTICAL INPUTS GIVE IDENTICAL BYTES");

    MapInputs in = sampleInputs();
    RenderConfig cfg = quietConfig();

    ConvertResult a, b;
    PipelineError errA, errB;
    bool ok = convertMap(in, cfg, a, errA) && convertMap(in, cfg, b, errB);
    report(ok && a.png == b.png && a.base64 == b.base64);
}

void test7_FailuresPropagate() {
    printTestHeader("TEST 7: STRUCTURAL FAILURES PROPAGATE");

    MapInputs shortBlob = sampleInputs();
    shortBlob.mapBlob.resize(100);
    RenderConfig cfg = quietConfig();

    ConvertResult result;
    PipelineError err;
    bool ok = convertMap(shortBlob, cfg, result, err);
    std::cout << "Error: " << err << "\n";

    report(!ok && err.kind == ErrorKind::INSUFFICIENT_DATA
               && result.png.empty() && result.base64.empty());
}

void test8_WriteOutputs() {
    printTestHeader("TEST 8: OUTPUT FILES WRITTEN TOGETHER");

    const fs::path dir = fs::temp_directory_path() / fs::unique_path("vacmap-%%%%-%%%%");
    const std::string png = (dir / "nested" / "vacuum_map.png").string();

    const std::vector<uint8_t> bytes = {0x89, 'P', 'N', 'G', 1, 2, 3};
    const std::string text = utils::base64Encode(bytes);

    PipelineError err;
    bool ok = writeOutputs(png, bytes, text, err);

    std::string sidecar;
    {
        std::ifstream in(sidecarPath(png));
        std::getline(in, sidecar);
    }
    bool success = ok
        && fs::exists(png) && fs::file_size(png) == bytes.size()
        && sidecar == text
        && !fs::exists(png + ".tmp")
        && !fs::exists(sidecarPath(png) + ".tmp");

    boost::system::error_code ec;
    fs::remove_all(dir, ec);
    report(success);
}

std::string readAll(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

void test9_PreviousPngKeptOnSidecarFailure() {
    printTestHeader("TEST 9: PREVIOUS PNG RESTORED WHEN SIDECAR FAILS");

    const fs::path dir = fs::temp_directory_path() / fs::unique_path("vacmap-%%%%-%%%%");
    fs::create_directories(dir);
    const std::string png = (dir / "vacuum_map.png").string();
    {
        std::ofstream out(png, std::ios::binary);
        out << "OLD";
    }

    // a non-empty directory where the sidecar should go blocks its rename
    const fs::path blocker(sidecarPath(png));
    fs::create_directories(blocker);
    {
        std::ofstream out((blocker / "keep").string());
        out << "x";
    }

    const std::vector<uint8_t> bytes = {0x89, 'P', 'N', 'G', 4, 5, 6};
    PipelineError err;
    bool ok = writeOutputs(png, bytes, utils::base64Encode(bytes), err, false);
    std::cout << "Error: " << err << "\n";

    bool success = !ok && err.kind == ErrorKind::ENCODE_FAILED
        && readAll(png) == "OLD"
        && !fs::exists(png + ".tmp")
        && !fs::exists(png + ".prev")
        && !fs::exists(sidecarPath(png) + ".tmp");

    boost::system::error_code ec;
    fs::remove_all(dir, ec);
    report(success);
}

int main() {
    std::cout << "╔══════════════════════════════════════════════╗\n";
    std::cout << "║          MAP PIPELINE TESTS                  ║\n";
    std::cout << "╚══════════════════════════════════════════════╝\n";

    test1_Base64();
    test2_SidecarPath();
    test3_MapInfoParsing();
    test4_ChargerAndAreaParsing();
    test5_ConvertMapEndToEnd();
    test6_Deterministic();
    test7_FailuresPropagate();
    test8_WriteOutputs();
    test9_PreviousPngKeptOnSidecarFailure();

    std::cout << "\n" << std::string(60, '=') << "\n";
    std::cout << (g_failures == 0 ? "ALL TESTS PASSED" : "SOME TESTS FAILED")
              << " (" << g_failures << " failures)\n";
    std::cout << std::string(60, '=') << "\n";
    return g_failures == 0 ? 0 : 1;
}
