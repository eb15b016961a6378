/**
 * @file rtlsdr_source.h
 * @brief RTL-SDR dongle as a SampleSource
 *
 * The device is opened and tuned in open() and closed in the destructor,
 * so whichever way the acquisition loop ends the handle is released.
 */

#ifndef KERMIT_RTLSDR_SOURCE_H
#define KERMIT_RTLSDR_SOURCE_H

#include "api/sample_source.h"
#include "api/survey_config.h"
#include "common/types.h"

#include <memory>
#include <string>
#include <vector>

struct rtlsdr_dev;

namespace kermit {

struct RtlSdrSettings {
    int device_index = 0;
    uint32_t sample_rate_hz = 2048000;
    uint32_t center_frequency_hz = 146520000;
    int freq_correction_ppm = 0;
    bool auto_gain = false;
    double gain_db = 0.0;

    static RtlSdrSettings from_config(const api::SurveyConfig& config);
};

class RtlSdrSource : public SampleSource {
public:
    /**
     * Open and configure the dongle. DEVICE_OPEN_FAILED if there is no
     * device at the index or it rejects the sample rate or frequency.
     */
    static api::Result<std::unique_ptr<RtlSdrSource>> open(const RtlSdrSettings& settings);

    ~RtlSdrSource() override;

    RtlSdrSource(const RtlSdrSource&) = delete;
    RtlSdrSource& operator=(const RtlSdrSource&) = delete;

    api::Result<void> read_block(std::vector<std::complex<float>>& out, size_t length) override;

    double sample_rate() const override { return settings_.sample_rate_hz; }
    const char* source_type() const override { return "rtlsdr"; }

    const std::string& device_name() const { return device_name_; }

private:
    RtlSdrSource(rtlsdr_dev* dev, const RtlSdrSettings& settings, const std::string& name)
        : dev_(dev), settings_(settings), device_name_(name) {}

    rtlsdr_dev* dev_;
    RtlSdrSettings settings_;
    std::string device_name_;
    std::vector<raw_iq_t> raw_;
};

/**
 * Source for the configured signal source kind.
 * LINE_IN is rejected with SOURCE_NOT_IMPLEMENTED.
 */
api::Result<std::unique_ptr<SampleSource>> create_sample_source(const api::SurveyConfig& config);

} // namespace kermit

#endif
