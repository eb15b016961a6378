/**
 * @file s_unit_scales.h
 * @brief Extended S-unit scales for HF and VHF listening
 *
 * The scale is extended above S9: instead of "S9 plus 6 dB" the next
 * bucket is S10, and so on up to S12. Everything below -48 dB is S0 and
 * everything above +24 dB is "S too much". The outer bands use infinite
 * sentinels so every finite level has a label.
 *
 * HF and VHF share the same thirteen S-steps (plus the overflow bucket)
 * today but are separate tables so either can be recalibrated on its own.
 */

#ifndef KERMIT_S_UNIT_SCALES_H
#define KERMIT_S_UNIT_SCALES_H

#include "interval_scale.h"
#include "api/survey_config.h"

#include <vector>

namespace kermit {

std::vector<ScaleBand> hf_s_unit_bands();
std::vector<ScaleBand> vhf_s_unit_bands();

/// Build the scale for the configured listening frequency / override
api::Result<IntervalScale> make_s_unit_scale(const api::SurveyConfig& config);

} // namespace kermit

#endif
