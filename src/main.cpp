// main.cpp - vacmap_convert driver: map directory in, PNG + base64 sidecar out
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <iterator>
#include <stdexcept>
#include <string>
#include <vector>
#include <boost/filesystem.hpp>

#include "core/config.hpp"
#include "core/map_pipeline.hpp"
#include "io/image_encoder.hpp"
#include "io/metadata_loader.hpp"

namespace fs = boost::filesystem;
using namespace vacmap;

/* ---------- File helpers ------------------------------------------------ */
static bool readBinary(const fs::path &path, std::vector<uint8_t> &out)
{
    std::ifstream in(path.string(), std::ios::binary);
    if (!in) return false;
    out.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    return true;
}

static bool readText(const fs::path &path, std::string &out)
{
    std::ifstream in(path.string());
    if (!in) return false;
    out.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    return true;
}

static void usage(const char *argv0)
{
    std::cerr << "usage: " << argv0
              << " <map_dir> [output.png] [--scale N] [--debug]\n";
}

/* ---------- Main Function ------------------------------------------------ */
int main(int argc, char **argv)
{
    std::string mapDir, outPath;
    RenderConfig cfg;

    const char *env = std::getenv("DEBUG_MODE");
    if (env && std::string(env) != "0" && std::string(env) != "false")
        cfg.debugMode = DebugMode::DEBUG_DUMP;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--debug") {
            cfg.debugMode = DebugMode::DEBUG_DUMP;
        } else if (arg == "--scale") {
            if (i + 1 >= argc) { usage(argv[0]); return 1; }
            try {
                cfg.upscaleFactor = std::stoi(argv[++i]);
            } catch (const std::exception &e) {
                std::cerr << "[Main] bad --scale value: " << argv[i]
                          << " (" << e.what() << ")\n";
                return 1;
            }
            if (cfg.upscaleFactor < 1) {
                std::cerr << "[Main] --scale must be >= 1\n";
                return 1;
            }
        } else if (arg == "-h" || arg == "--help") {
            usage(argv[0]);
            return 0;
        } else if (mapDir.empty()) {
            mapDir = arg;
        } else if (outPath.empty()) {
            outPath = arg;
        } else {
            usage(argv[0]);
            return 1;
        }
    }
    if (mapDir.empty()) { usage(argv[0]); return 1; }

    const fs::path dir(mapDir);
    if (outPath.empty()) outPath = (dir / DEFAULT_OUTPUT).string();
    if (cfg.debugMode == DebugMode::DEBUG_DUMP)
        cfg.debugDir = fs::path(outPath).has_parent_path()
                     ? fs::path(outPath).parent_path().string() : ".";

    // ── load everything up front; the pipeline never touches the disk
    MapInputs inputs;
    std::string mapInfoText, chargerText, areaText;

    if (!readBinary(dir / MAP_BLOB_FILE, inputs.mapBlob)) {
        std::cerr << "[Main] cannot read " << (dir / MAP_BLOB_FILE).string() << '\n';
        return 1;
    }
    if (!readText(dir / MAP_INFO_FILE, mapInfoText)
     || !readText(dir / CHARGER_FILE,  chargerText)
     || !readText(dir / AREA_INFO_FILE, areaText)) {
        std::cerr << "[Main] missing metadata in " << mapDir << '\n';
        return 1;
    }

    boost::system::error_code ec;
    if (fs::exists(dir / SEGMENT_BLOB_FILE, ec)
     && !readBinary(dir / SEGMENT_BLOB_FILE, inputs.segmentBlob))
        std::cerr << "[Main] segment map present but unreadable, ignoring\n";

    PipelineError err;
    if (!parseMapInfo(mapInfoText, inputs.info, err)
     || !parseChargerPose(chargerText, inputs.charger, err)
     || !parseAreaInfo(areaText, inputs.area, err)) {
        std::cerr << "[Main] " << err << '\n';
        return 1;
    }

    std::cout << "[Main] " << mapDir << ": " << inputs.info.width << "x"
              << inputs.info.height << ", " << inputs.area.forbiddenZones.size()
              << " forbidden zones, " << inputs.area.rooms.size() << " room polygons\n";

    ConvertResult result;
    if (!convertMap(inputs, cfg, result, err)
     || !writeOutputs(outPath, result.png, result.base64, err, cfg.verbose)) {
        std::cerr << "[Main] conversion failed: " << err << '\n';
        return 1;
    }

    std::cout << "[Main] done: " << result.image.cols << "x" << result.image.rows
              << " -> " << outPath << std::endl;
    return 0;
}
