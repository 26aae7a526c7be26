#pragma once
// HardwareDetection.hpp - Finds a usable hardware H.264 encoder
// An encoder counts as usable when libavcodec knows it and its device opens

#include <optional>
#include <string>
#include <vector>
#include "EncoderSettings.hpp"
#include "FFmpegUtils.hpp"

namespace lf {

class HardwareDetection {
public:
    // In preference order
    static const std::vector<std::string>& candidates();

    // "auto" walks the candidates, "none" disables, anything else is
    // checked on its own
    static std::optional<std::string> detect(const EncoderSettings& settings);

    static bool available(const std::string& encoder);

    static AVHWDeviceType deviceTypeFor(const std::string& encoder);
};

} // namespace lf
