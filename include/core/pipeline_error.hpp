#ifndef VACMAP_PIPELINE_ERROR_HPP
#define VACMAP_PIPELINE_ERROR_HPP

#include <cstdint>
#include <ostream>
#include <string>
#include <utility>

namespace vacmap {

enum class ErrorKind : uint8_t
{
    NONE              = 0,
    INSUFFICIENT_DATA = 1,
    FORMAT_NOT_FOUND  = 2,
    MALFORMED_METADATA = 3,
    ENCODE_FAILED     = 4
};

/** Structural failure reported by a pipeline stage.
 *  Recoverable conditions (degenerate polygons, off-canvas pixels) never
 *  produce one of these.                                                 */
struct PipelineError
{
    ErrorKind   kind{ErrorKind::NONE};
    std::string stage;     // e.g. "GridDecoder"
    std::string field;     // offending field / document, may be empty
    std::string message;

    bool ok() const { return kind == ErrorKind::NONE; }

    void set(ErrorKind k, std::string stg, std::string fld, std::string msg)
    {
        kind    = k;
        stage   = std::move(stg);
        field   = std::move(fld);
        message = std::move(msg);
    }
};

inline const char *toString(ErrorKind kind)
{
    switch (kind) {
        case ErrorKind::NONE:               return "None";
        case ErrorKind::INSUFFICIENT_DATA:  return "InsufficientData";
        case ErrorKind::FORMAT_NOT_FOUND:   return "FormatNotFound";
        case ErrorKind::MALFORMED_METADATA: return "MalformedMetadata";
        case ErrorKind::ENCODE_FAILED:      return "EncodeFailed";
    }
    return "Unknown";
}

inline std::ostream &operator<<(std::ostream &os, const PipelineError &err)
{
    os << toString(err.kind) << " in " << err.stage;
    if (!err.field.empty()) os << " (" << err.field << ")";
    return os << ": " << err.message;
}

} // namespace vacmap

#endif // VACMAP_PIPELINE_ERROR_HPP
