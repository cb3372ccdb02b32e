#pragma once

#include "classify.hpp"
#include "profile.hpp"
#include "signals.hpp"

#include <string>
#include <vector>

namespace hwprov {

// Simple public API: probe this machine and classify it.
HardwareProfile detect_profile(const std::string& fallback_region = kDefaultRegion);

// "cpu=intel gpu=hybrid-nvidia platform=laptop oem=thinkpad region=US"
std::string profile_summary(const HardwareProfile& profile);

// Profile as a JSON object keyed by the persisted names; features is an array.
std::string format_profile_json(const HardwareProfile& profile, const std::vector<std::string>& reasons = {});

} // namespace hwprov
