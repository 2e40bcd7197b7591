#ifndef VACMAP_CONFIG_HPP
#define VACMAP_CONFIG_HPP

#include <cstdint>
#include <cstddef>
#include <string>
#include <vector>

namespace vacmap {

// Raw grid byte conventions
constexpr uint8_t RAW_FREE    = 0;
constexpr uint8_t RAW_UNKNOWN = 127;   // 0x7F

// Probing
constexpr size_t PROBE_SCAN_LIMIT      = 1000;  // bytes scanned in exhaustive mode
constexpr size_t PROBE_SCAN_STEP       = 4;
constexpr size_t PROBE_MAX_DISTINCT    = 20;    // auto mode: distinct values must stay below this

// Segmentation
constexpr int    MIN_ROOM_SIZE         = 100;   // cells, flood-fill path
constexpr int    MIN_SEGMENT_PIXELS    = 50;    // cells, segment-channel path
constexpr size_t HULL_MIN_POINTS       = 20;    // below this a region is boxed
constexpr double HULL_SIMPLIFY_FACTOR  = 0.8;

// Rendering (canvas pixels)
constexpr int    CANVAS_SCALE          = 2;
constexpr int    UPSCALE_FACTOR        = 2;
constexpr int    HATCH_SPACING         = 20;
constexpr int    HATCH_THICKNESS       = 2;
constexpr int    EDGE_STAMP_RADIUS     = 1;     // 3x3 stamp
constexpr int    CHARGER_RADIUS        = 10;
constexpr int    CHARGER_RING_GAP      = 3;
constexpr int    LABEL_OUTLINE_OFFSET  = 2;
constexpr int    LABEL_FONT_PX         = 14;
constexpr int    FOOTER_FONT_PX        = 11;
constexpr uint8_t ROOM_FILL_ALPHA      = 180;
constexpr uint8_t ZONE_FILL_ALPHA      = 80;

// Finishing
constexpr double CONTRAST_BOOST        = 1.1;
constexpr double SATURATION_BOOST      = 1.2;

// Conventional file names inside a map directory
const std::string MAP_BLOB_FILE     = "map_record.map";
const std::string MAP_INFO_FILE     = "map_record.json";
const std::string CHARGER_FILE      = "charger_pose.json";
const std::string AREA_INFO_FILE    = "area_info.json";
const std::string SEGMENT_BLOB_FILE = "map.segmentmap";
const std::string DEFAULT_OUTPUT    = "vacuum_map.png";

inline std::vector<std::string> defaultFontCandidates()
{
    return {
        "/usr/share/fonts/truetype/dejavu/DejaVuSans.ttf",
        "/usr/share/fonts/truetype/liberation/LiberationSans-Regular.ttf",
        "/usr/share/fonts/TTF/Vera.ttf",
        "/usr/share/fonts/noto/NotoSans-Regular.ttf",
        "/System/Library/Fonts/Helvetica.ttc"
    };
}

enum class DebugMode : uint8_t
{
    DEBUG_OFF  = 0,
    DEBUG_DUMP = 1     // write intermediate rasters to debugDir
};

// Where room overlays come from
enum class RoomSource : uint8_t
{
    AUTO      = 0,     // areaValue polygons if present, else segmentation
    EXPLICIT  = 1,
    SEGMENTED = 2
};

// Per-call settings, passed by const reference through the pipeline
struct RenderConfig
{
    // Decoding
    bool   fixedHeaderOffset{false};
    size_t headerOffset{0};
    bool   fallbackToZeroOffset{true};   // on FormatNotFound

    // Segmentation
    RoomSource roomSource{RoomSource::AUTO};
    int    minRoomSize{MIN_ROOM_SIZE};
    int    minSegmentPixels{MIN_SEGMENT_PIXELS};
    double simplifyFactor{HULL_SIMPLIFY_FACTOR};

    // Overlays
    int    canvasScale{CANVAS_SCALE};
    int    hatchSpacing{HATCH_SPACING};
    int    edgeStampRadius{EDGE_STAMP_RADIUS};
    int    chargerRadius{CHARGER_RADIUS};
    bool   drawRoomLabels{true};
    std::vector<std::string> fontCandidates{defaultFontCandidates()};

    // Finishing / encoding
    int    upscaleFactor{UPSCALE_FACTOR};
    double contrastBoost{CONTRAST_BOOST};
    double saturationBoost{SATURATION_BOOST};
    bool   drawFooter{true};
    std::string timestamp;               // empty -> current local time

    // Diagnostics
    DebugMode debugMode{DebugMode::DEBUG_OFF};
    std::string debugDir{"."};
    bool   verbose{true};
};

} // namespace vacmap

#endif // VACMAP_CONFIG_HPP
