#ifndef VACMAP_FORMAT_PROBER_HPP
#define VACMAP_FORMAT_PROBER_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <opencv2/core.hpp>

namespace vacmap {

enum class ElementType : uint8_t
{
    U8  = 0,
    I8  = 1,
    U16 = 2,
    I16 = 3,
    U32 = 4,
    I32 = 5,
    F32 = 6
};

enum class ReshapeOrder : uint8_t
{
    ROW_MAJOR    = 0,
    COLUMN_MAJOR = 1
};

enum class ProbeMode : uint8_t
{
    STRICT = 0,   // enough bytes + not all identical
    AUTO   = 1    // STRICT + plausible number of distinct values
};

struct ProbeCandidate
{
    size_t       offset{0};
    ElementType  type{ElementType::U8};
    ReshapeOrder order{ReshapeOrder::ROW_MAJOR};
};

struct ProbeResult
{
    ProbeCandidate candidate;
    size_t distinctValues{0};   // saturates at maxDistinct in AUTO mode
};

struct ProbeOptions
{
    std::vector<ElementType> types{ElementType::U8, ElementType::I16,
                                   ElementType::U16, ElementType::I32,
                                   ElementType::F32};
    std::vector<size_t> offsets{0, 4, 8, 16, 32, 48, 64, 128};
    bool   exhaustive{false};      // replace offsets with 0..scanLimit/step
    size_t scanLimit{1000};
    size_t scanStep{4};
    ProbeMode mode{ProbeMode::STRICT};
    size_t maxDistinct{20};        // AUTO: accept 1 < distinct < maxDistinct
};

size_t elementSize(ElementType type);
const char *toString(ElementType type);
std::string describe(const ProbeCandidate &candidate);

/** Bytes needed past the offset for a width×height grid of this type. */
size_t requiredBytes(int width, int height, ElementType type);

/** Walks the candidate list in its fixed order and returns the first one
    whose slice passes the acceptance predicates, or std::nullopt.
    Undersized buffers are simply unsuitable, never an error.           */
std::optional<ProbeResult> probeFormat(const std::vector<uint8_t> &buffer,
                                       int width, int height,
                                       const ProbeOptions &options = {});

/** Evaluates a single candidate against the acceptance predicates. */
std::optional<ProbeResult> evaluateCandidate(const std::vector<uint8_t> &buffer,
                                             int width, int height,
                                             const ProbeCandidate &candidate,
                                             ProbeMode mode,
                                             size_t maxDistinct);

/** Decodes an accepted candidate into a height×width CV_64F matrix.
    Returns an empty Mat if the buffer is too short.                   */
cv::Mat extractSlice(const std::vector<uint8_t> &buffer,
                     int width, int height,
                     const ProbeCandidate &candidate);

} // namespace vacmap

#endif // VACMAP_FORMAT_PROBER_HPP
