#pragma once
#include "io/FitDecoder.hpp"
#include "io/XmlDecoders.hpp"
#include "models/CoreTypes.hpp"
#include <optional>
#include <string>
#include <variant>

enum class FileFormat : uint8_t { Fit, Tcx, Gpx, Json };

inline const char *FileFormatToString(FileFormat f) {
  switch (f) {
  case FileFormat::Fit:
    return "fit";
  case FileFormat::Tcx:
    return "tcx";
  case FileFormat::Gpx:
    return "gpx";
  case FileFormat::Json:
    return "json";
  }
  return "unknown";
}

// Case-insensitive "fit" / "tcx" / "gpx" / "json".
std::optional<FileFormat> FileFormatFromString(const std::string &name);

// Format from a file name's extension. Throws NotSupportedError.
FileFormat format_from_path(const std::string &path);

// The JSON interchange encoding (see models/ActivityJson.hpp).
class JsonDecoder {
public:
  DecodedActivity decode(const std::string &bytes) const;
};

// Closed set of decoders; all of them yield the same DecodedActivity shape.
using ActivityDecoder =
    std::variant<FitDecoder, TcxDecoder, GpxDecoder, JsonDecoder>;

ActivityDecoder make_decoder(FileFormat format);

DecodedActivity decode(const std::string &bytes, FileFormat format);

// Read a whole file and decode it by extension.
DecodedActivity decode_file(const std::string &path);
