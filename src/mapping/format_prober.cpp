#include "mapping/format_prober.hpp"
#include <cmath>
#include <cstring>
#include <set>
#include <sstream>

namespace vacmap {

/* ───────────────────── element decoding (LE) ────────────────────── */
static inline uint32_t loadLE(const uint8_t *p, size_t n)
{
    uint32_t v = 0;
    for (size_t i = 0; i < n; ++i)
        v |= static_cast<uint32_t>(p[i]) << (8 * i);
    return v;
}

static double readElement(const uint8_t *p, ElementType type)
{
    switch (type) {
        case ElementType::U8:  return p[0];
        case ElementType::I8:  return static_cast<int8_t>(p[0]);
        case ElementType::U16: return static_cast<uint16_t>(loadLE(p, 2));
        case ElementType::I16: return static_cast<int16_t>(loadLE(p, 2));
        case ElementType::U32: return loadLE(p, 4);
        case ElementType::I32: return static_cast<int32_t>(loadLE(p, 4));
        case ElementType::F32: {
            uint32_t bits = loadLE(p, 4);
            float f;
            std::memcpy(&f, &bits, sizeof(f));
            return f;
        }
    }
    return 0.0;
}

size_t elementSize(ElementType type)
{
    switch (type) {
        case ElementType::U8:
        case ElementType::I8:  return 1;
        case ElementType::U16:
        case ElementType::I16: return 2;
        case ElementType::U32:
        case ElementType::I32:
        case ElementType::F32: return 4;
    }
    return 1;
}

const char *toString(ElementType type)
{
    switch (type) {
        case ElementType::U8:  return "uint8";
        case ElementType::I8:  return "int8";
        case ElementType::U16: return "uint16";
        case ElementType::I16: return "int16";
        case ElementType::U32: return "uint32";
        case ElementType::I32: return "int32";
        case ElementType::F32: return "float32";
    }
    return "?";
}

std::string describe(const ProbeCandidate &c)
{
    std::ostringstream ss;
    ss << "offset " << c.offset << ", " << toString(c.type) << ", "
       << (c.order == ReshapeOrder::ROW_MAJOR ? "row-major" : "column-major");
    return ss.str();
}

size_t requiredBytes(int width, int height, ElementType type)
{
    if (width <= 0 || height <= 0) return 0;
    return static_cast<size_t>(width) * static_cast<size_t>(height)
         * elementSize(type);
}

/* ───────────────────── single candidate ─────────────────────────── */
std::optional<ProbeResult> evaluateCandidate(const std::vector<uint8_t> &buffer,
                                             int width, int height,
                                             const ProbeCandidate &candidate,
                                             ProbeMode mode,
                                             size_t maxDistinct)
{
    const size_t need = requiredBytes(width, height, candidate.type);
    if (need == 0) return std::nullopt;

    // (1) enough bytes remaining past the header
    if (candidate.offset > buffer.size()
     || buffer.size() - candidate.offset < need)
        return std::nullopt;

    // (2) reshape: need is an exact multiple of the element size, so the
    //     slice always yields width*height elements once (1) holds
    const size_t esz   = elementSize(candidate.type);
    const size_t count = need / esz;
    if (count != static_cast<size_t>(width) * static_cast<size_t>(height))
        return std::nullopt;

    // (3) not a solid fill; AUTO also bounds the number of distinct values
    const size_t cap = (mode == ProbeMode::AUTO) ? maxDistinct : 2;
    std::set<double> seen;
    bool sawNaN = false;
    const uint8_t *base = buffer.data() + candidate.offset;
    for (size_t i = 0; i < count; ++i) {
        double v = readElement(base + i * esz, candidate.type);
        if (std::isnan(v)) sawNaN = true;
        else               seen.insert(v);
        if (seen.size() + (sawNaN ? 1 : 0) >= cap) break;
    }
    const size_t distinct = seen.size() + (sawNaN ? 1 : 0);

    if (distinct <= 1) return std::nullopt;
    if (mode == ProbeMode::AUTO && distinct >= maxDistinct) return std::nullopt;

    return ProbeResult{candidate, distinct};
}

/* ───────────────────── ordered search ───────────────────────────── */
std::optional<ProbeResult> probeFormat(const std::vector<uint8_t> &buffer,
                                       int width, int height,
                                       const ProbeOptions &options)
{
    std::vector<size_t> offsets = options.offsets;
    if (options.exhaustive) {
        offsets.clear();
        const size_t step = options.scanStep > 0 ? options.scanStep : 1;
        for (size_t off = 0; off <= options.scanLimit; off += step)
            offsets.push_back(off);
    }

    for (ElementType type : options.types) {
        for (size_t off : offsets) {
            ProbeCandidate c{off, type, ReshapeOrder::ROW_MAJOR};
            auto result = evaluateCandidate(buffer, width, height, c,
                                            options.mode, options.maxDistinct);
            if (result) return result;
        }
    }
    return std::nullopt;
}

cv::Mat extractSlice(const std::vector<uint8_t> &buffer,
                     int width, int height,
                     const ProbeCandidate &candidate)
{
    const size_t need = requiredBytes(width, height, candidate.type);
    if (need == 0 || candidate.offset > buffer.size()
     || buffer.size() - candidate.offset < need)
        return cv::Mat();

    cv::Mat out(height, width, CV_64F);
    const size_t esz = elementSize(candidate.type);
    const uint8_t *base = buffer.data() + candidate.offset;
    const size_t count = need / esz;

    for (size_t k = 0; k < count; ++k) {
        int row, col;
        if (candidate.order == ReshapeOrder::ROW_MAJOR) {
            row = static_cast<int>(k / width);
            col = static_cast<int>(k % width);
        } else {
            row = static_cast<int>(k % height);
            col = static_cast<int>(k / height);
        }
        out.at<double>(row, col) = readElement(base + k * esz, candidate.type);
    }
    return out;
}

} // namespace vacmap
