// src/sdr/rtlsdr_source.cpp
#include "rtlsdr_source.h"
#include "common/log.h"

#include <rtl-sdr.h>

#include <cmath>

namespace kermit {

using api::Error;
using api::ErrorCode;
using api::Result;

RtlSdrSettings RtlSdrSettings::from_config(const api::SurveyConfig& config) {
    RtlSdrSettings s;
    s.device_index = config.rtlsdr_device_index;
    s.sample_rate_hz = static_cast<uint32_t>(std::lround(config.sample_rate_hz));
    s.center_frequency_hz = static_cast<uint32_t>(std::lround(config.listening_frequency_hz));
    s.freq_correction_ppm = config.freq_correction_ppm;
    s.auto_gain = config.auto_gain;
    s.gain_db = config.gain_db;
    return s;
}

Result<std::unique_ptr<RtlSdrSource>> RtlSdrSource::open(const RtlSdrSettings& settings) {
    uint32_t count = rtlsdr_get_device_count();
    if (count == 0) {
        return Error(ErrorCode::DEVICE_OPEN_FAILED, "No RTL-SDR devices found");
    }
    if (settings.device_index < 0 || static_cast<uint32_t>(settings.device_index) >= count) {
        return Error(ErrorCode::DEVICE_OPEN_FAILED,
                     "RTL-SDR device index " + std::to_string(settings.device_index) +
                     " out of range (" + std::to_string(count) + " found)");
    }

    uint32_t index = static_cast<uint32_t>(settings.device_index);
    const char* name = rtlsdr_get_device_name(index);

    rtlsdr_dev_t* dev = nullptr;
    if (rtlsdr_open(&dev, index) < 0 || dev == nullptr) {
        return Error(ErrorCode::DEVICE_OPEN_FAILED,
                     "Failed to open RTL-SDR device #" + std::to_string(index));
    }
    // From here on the destructor closes the device
    std::unique_ptr<RtlSdrSource> source(new RtlSdrSource(dev, settings, name ? name : ""));

    if (rtlsdr_set_sample_rate(dev, settings.sample_rate_hz) < 0) {
        return Error(ErrorCode::DEVICE_OPEN_FAILED,
                     "Sample rate " + std::to_string(settings.sample_rate_hz) + " Hz rejected");
    }
    if (rtlsdr_set_center_freq(dev, settings.center_frequency_hz) < 0) {
        return Error(ErrorCode::DEVICE_OPEN_FAILED,
                     "Center frequency " + std::to_string(settings.center_frequency_hz) +
                     " Hz rejected");
    }
    // -2 means the correction is already in effect
    if (settings.freq_correction_ppm != 0) {
        int rc = rtlsdr_set_freq_correction(dev, settings.freq_correction_ppm);
        if (rc < 0 && rc != -2) {
            log::warn("SDR", "Frequency correction " +
                      std::to_string(settings.freq_correction_ppm) + " ppm rejected");
        }
    }

    if (settings.auto_gain) {
        if (rtlsdr_set_tuner_gain_mode(dev, 0) < 0) {
            log::warn("SDR", "Could not enable automatic gain");
        }
    } else {
        int tenth_db = static_cast<int>(std::lround(settings.gain_db * 10.0));
        if (rtlsdr_set_tuner_gain_mode(dev, 1) < 0 || rtlsdr_set_tuner_gain(dev, tenth_db) < 0) {
            log::warn("SDR", "Could not set manual gain " + std::to_string(settings.gain_db) + " dB");
        }
    }

    if (rtlsdr_reset_buffer(dev) < 0) {
        return Error(ErrorCode::DEVICE_OPEN_FAILED, "Failed to reset RTL-SDR buffer");
    }

    log::info("SDR", "Opened #" + std::to_string(index) + " " + source->device_name_ +
              " at " + std::to_string(settings.center_frequency_hz) + " Hz, " +
              std::to_string(settings.sample_rate_hz) + " S/s");
    return source;
}

RtlSdrSource::~RtlSdrSource() {
    if (dev_) {
        rtlsdr_close(dev_);
        log::debug("SDR", "Device closed");
    }
}

Result<void> RtlSdrSource::read_block(std::vector<std::complex<float>>& out, size_t length) {
    // Interleaved I/Q bytes; librtlsdr wants multiples of 512
    size_t bytes = length * 2;
    size_t request = (bytes + 511) / 512 * 512;
    raw_.resize(request);

    int n_read = 0;
    int rc = rtlsdr_read_sync(dev_, raw_.data(), static_cast<int>(request), &n_read);
    if (rc < 0) {
        return Error(ErrorCode::DEVICE_READ_FAILED,
                     "rtlsdr_read_sync failed (" + std::to_string(rc) + ")");
    }
    if (static_cast<size_t>(n_read) < bytes) {
        return Error(ErrorCode::DEVICE_READ_FAILED,
                     "Short read: " + std::to_string(n_read) + " of " +
                     std::to_string(bytes) + " bytes");
    }

    out.resize(length);
    for (size_t i = 0; i < length; i++) {
        out[i] = complex_t(raw_to_float(raw_[2 * i]), raw_to_float(raw_[2 * i + 1]));
    }
    return Result<void>();
}

Result<std::unique_ptr<SampleSource>> create_sample_source(const api::SurveyConfig& config) {
    switch (config.signal_source) {
        case api::SignalSource::RTLSDR: {
            auto sdr = RtlSdrSource::open(RtlSdrSettings::from_config(config));
            if (!sdr.ok()) return sdr.error();
            return std::unique_ptr<SampleSource>(std::move(sdr.value()));
        }
        case api::SignalSource::LINE_IN:
            return Error(ErrorCode::SOURCE_NOT_IMPLEMENTED,
                         "Line-in signal source is not implemented; use rtlsdr");
    }
    return Error(ErrorCode::INVALID_CONFIG, "Unknown signal source");
}

} // namespace kermit
