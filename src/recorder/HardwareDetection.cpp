#include "HardwareDetection.hpp"
#include "core/Logger.hpp"

namespace lf {

const std::vector<std::string>& HardwareDetection::candidates() {
    static const std::vector<std::string> list{
            "h264_nvenc", "h264_qsv", "h264_amf", "h264_videotoolbox"};
    return list;
}

AVHWDeviceType HardwareDetection::deviceTypeFor(const std::string& encoder) {
    if (encoder.find("nvenc") != std::string::npos)
        return AV_HWDEVICE_TYPE_CUDA;
    if (encoder.find("qsv") != std::string::npos)
        return AV_HWDEVICE_TYPE_QSV;
    if (encoder.find("videotoolbox") != std::string::npos)
        return AV_HWDEVICE_TYPE_VIDEOTOOLBOX;
    return AV_HWDEVICE_TYPE_NONE;
}

bool HardwareDetection::available(const std::string& encoder) {
    if (!avcodec_find_encoder_by_name(encoder.c_str())) {
        LOG_DEBUG("Hardware encoder {} not built into libavcodec", encoder);
        return false;
    }

    const AVHWDeviceType type = deviceTypeFor(encoder);
    if (type == AV_HWDEVICE_TYPE_NONE)
        return true;

    AVBufferRef* device = nullptr;
    int ret = av_hwdevice_ctx_create(&device, type, nullptr, nullptr, 0);
    AVBufferRefPtr guard(device);
    if (ret < 0) {
        LOG_DEBUG("Hardware encoder {}: no {} device ({})",
                  encoder,
                  av_hwdevice_get_type_name(type),
                  ffmpegError(ret));
        return false;
    }
    return true;
}

std::optional<std::string> HardwareDetection::detect(const EncoderSettings& settings) {
    if (!settings.preferHardware || settings.hardwareEncoder == "none")
        return std::nullopt;

    if (settings.hardwareEncoder != "auto" && !settings.hardwareEncoder.empty()) {
        if (available(settings.hardwareEncoder))
            return settings.hardwareEncoder;
        LOG_WARN("Requested hardware encoder {} is unavailable",
                 settings.hardwareEncoder);
        return std::nullopt;
    }

    for (const auto& name : candidates()) {
        if (available(name)) {
            LOG_INFO("Hardware encoder detected: {}", name);
            return name;
        }
    }
    LOG_INFO("No hardware encoder available, using {}", settings.softwareCodec);
    return std::nullopt;
}

} // namespace lf
