#include "io/ActivityDecoder.hpp"
#include "models/ActivityJson.hpp"
#include "models/Errors.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <iterator>
#include <sstream>

static std::string lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return s;
}

std::optional<FileFormat> FileFormatFromString(const std::string &name) {
  const std::string n = lower(name);
  if (n == "fit")
    return FileFormat::Fit;
  if (n == "tcx")
    return FileFormat::Tcx;
  if (n == "gpx")
    return FileFormat::Gpx;
  if (n == "json")
    return FileFormat::Json;
  return std::nullopt;
}

FileFormat format_from_path(const std::string &path) {
  const auto dot = path.find_last_of('.');
  if (dot != std::string::npos) {
    if (auto f = FileFormatFromString(path.substr(dot + 1)))
      return *f;
  }
  throw NotSupportedError("cannot tell the file format of '" + path + "'");
}

DecodedActivity JsonDecoder::decode(const std::string &bytes) const {
  try {
    return Json::parse(bytes).get<DecodedActivity>();
  } catch (const Json::exception &e) {
    throw DecodeError(std::string("JSON activity: ") + e.what());
  }
}

ActivityDecoder make_decoder(FileFormat format) {
  switch (format) {
  case FileFormat::Fit:
    return FitDecoder{};
  case FileFormat::Tcx:
    return TcxDecoder{};
  case FileFormat::Gpx:
    return GpxDecoder{};
  case FileFormat::Json:
    return JsonDecoder{};
  }
  throw NotSupportedError("unknown file format");
}

DecodedActivity decode(const std::string &bytes, FileFormat format) {
  ActivityDecoder decoder = make_decoder(format);
  return std::visit([&bytes](const auto &d) { return d.decode(bytes); },
                    decoder);
}

DecodedActivity decode_file(const std::string &path) {
  const FileFormat format = format_from_path(path);
  std::ifstream in(path, std::ios::binary);
  if (!in)
    throw std::runtime_error("cannot open " + path);
  std::string bytes((std::istreambuf_iterator<char>(in)),
                    std::istreambuf_iterator<char>());
  return decode(bytes, format);
}
