#include "io/metadata_loader.hpp"
#include <iostream>
#include <yaml-cpp/yaml.h>

namespace vacmap {

static const char *STAGE = "MetadataLoader";

/* ───────────────────────── helpers ──────────────────────────────── */
static bool loadDocument(const std::string &text, const std::string &doc,
                         YAML::Node &root, PipelineError &err)
{
    try {
        root = YAML::Load(text);
    } catch (const YAML::Exception &e) {
        err.set(ErrorKind::MALFORMED_METADATA, STAGE, doc,
                std::string("parse error: ") + e.what());
        return false;
    }
    return true;
}

template <typename T>
static bool readField(const YAML::Node &root, const char *key,
                      const std::string &doc, T &value, PipelineError &err)
{
    const YAML::Node node = root[key];
    if (!node) {
        err.set(ErrorKind::MALFORMED_METADATA, STAGE, doc + "." + key,
                "missing field");
        return false;
    }
    try {
        value = node.as<T>();
    } catch (const YAML::Exception &e) {
        err.set(ErrorKind::MALFORMED_METADATA, STAGE, doc + "." + key,
                std::string("wrong type: ") + e.what());
        return false;
    }
    return true;
}

static bool readVertices(const YAML::Node &list, const std::string &field,
                         std::vector<WorldPoint> &out, PipelineError &err)
{
    if (!list || !list.IsSequence()) {
        err.set(ErrorKind::MALFORMED_METADATA, STAGE, field, "expected a vertex list");
        return false;
    }
    try {
        for (const auto &v : list) {
            if (!v.IsSequence() || v.size() < 2) {
                err.set(ErrorKind::MALFORMED_METADATA, STAGE, field,
                        "vertex is not an [x, y] pair");
                return false;
            }
            out.emplace_back(v[0].as<double>(), v[1].as<double>());
        }
    } catch (const YAML::Exception &e) {
        err.set(ErrorKind::MALFORMED_METADATA, STAGE, field,
                std::string("non-numeric vertex: ") + e.what());
        return false;
    }
    return true;
}

/* ───────────────────────── documents ────────────────────────────── */
bool parseMapInfo(const std::string &text, MapInfo &out, PipelineError &err)
{
    const std::string doc = "map_record";
    YAML::Node root;
    if (!loadDocument(text, doc, root, err)) return false;
    if (!root.IsMap()) {
        err.set(ErrorKind::MALFORMED_METADATA, STAGE, doc, "expected an object");
        return false;
    }

    MapInfo info;
    if (!readField(root, "width",      doc, info.width,      err)) return false;
    if (!readField(root, "height",     doc, info.height,     err)) return false;
    if (!readField(root, "resolution", doc, info.resolution, err)) return false;
    if (!readField(root, "x_min",      doc, info.xMin,       err)) return false;
    if (!readField(root, "y_min",      doc, info.yMin,       err)) return false;

    if (info.width <= 0 || info.height <= 0) {
        err.set(ErrorKind::MALFORMED_METADATA, STAGE, doc + ".width/height",
                "dimensions must be positive");
        return false;
    }
    if (info.resolution <= 0.0) {
        err.set(ErrorKind::MALFORMED_METADATA, STAGE, doc + ".resolution",
                "resolution must be positive");
        return false;
    }

    out = info;
    return true;
}

bool parseChargerPose(const std::string &text, ChargerPose &out, PipelineError &err)
{
    const std::string doc = "charger_pose";
    YAML::Node root;
    if (!loadDocument(text, doc, root, err)) return false;
    if (!root.IsMap()) {
        err.set(ErrorKind::MALFORMED_METADATA, STAGE, doc, "expected an object");
        return false;
    }

    std::vector<double> xy;
    if (!readField(root, "charger_pose", doc, xy, err)) return false;
    if (xy.size() < 2) {
        err.set(ErrorKind::MALFORMED_METADATA, STAGE, doc + ".charger_pose",
                "expected [x, y]");
        return false;
    }

    ChargerPose pose;
    pose.position = WorldPoint(xy[0], xy[1]);
    if (root["charger_phi"] && !readField(root, "charger_phi", doc, pose.phi, err))
        return false;

    out = pose;
    return true;
}

bool parseAreaInfo(const std::string &text, AreaInfo &out, PipelineError &err)
{
    const std::string doc = "area_info";
    YAML::Node root;
    if (!loadDocument(text, doc, root, err)) return false;

    AreaInfo area;
    if (root.IsNull()) {            // empty file: nothing to overlay
        out = area;
        return true;
    }
    if (!root.IsMap()) {
        err.set(ErrorKind::MALFORMED_METADATA, STAGE, doc, "expected an object");
        return false;
    }

    const YAML::Node forbid = root["forbidAreaValue"];
    if (forbid && !forbid.IsNull()) {
        if (!forbid.IsSequence()) {
            err.set(ErrorKind::MALFORMED_METADATA, STAGE, doc + ".forbidAreaValue",
                    "expected an array");
            return false;
        }
        for (size_t i = 0; i < forbid.size(); ++i) {
            const std::string field = doc + ".forbidAreaValue[" + std::to_string(i) + "]";
            if (!forbid[i].IsMap()) {
                err.set(ErrorKind::MALFORMED_METADATA, STAGE, field, "expected an object");
                return false;
            }
            ForbiddenZone zone;
            if (!readVertices(forbid[i]["vertexs"], field + ".vertexs",
                              zone.verticesCm, err))
                return false;

            // "mop" marks a no-mop zone; any other value (or none) is no-go
            const YAML::Node type = forbid[i]["forbidType"];
            if (type && type.IsScalar() && type.Scalar() == "mop")
                zone.type = ZoneType::NO_MOP;
            area.forbiddenZones.push_back(std::move(zone));
        }
    }

    const YAML::Node rooms = root["areaValue"];
    if (rooms && !rooms.IsNull()) {
        if (!rooms.IsSequence()) {
            err.set(ErrorKind::MALFORMED_METADATA, STAGE, doc + ".areaValue",
                    "expected an array");
            return false;
        }
        for (size_t i = 0; i < rooms.size(); ++i) {
            const std::string field = doc + ".areaValue[" + std::to_string(i) + "]";
            if (!rooms[i].IsMap()) {
                err.set(ErrorKind::MALFORMED_METADATA, STAGE, field, "expected an object");
                return false;
            }
            RoomArea room;
            if (!readVertices(rooms[i]["vertexs"], field + ".vertexs",
                              room.verticesCm, err))
                return false;

            const YAML::Node id   = rooms[i]["id"];
            const YAML::Node name = rooms[i]["name"];
            try {
                if (id && id.IsScalar())     room.id   = id.as<int>();
                if (name && name.IsScalar()) room.name = name.as<std::string>();
            } catch (const YAML::Exception &e) {
                std::cerr << "[MetadataLoader] ignoring bad id/name in "
                          << field << ": " << e.what() << '\n';
            }
            area.rooms.push_back(std::move(room));
        }
    }

    out = std::move(area);
    return true;
}

} // namespace vacmap
