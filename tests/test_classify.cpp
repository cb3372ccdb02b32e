#include "classify.hpp"
#include "hwprov.hpp"
#include "package_groups.hpp"

#include <string>
#include <vector>

#include <catch2/catch_test_macros.hpp>
#include <nlohmann/json.hpp>

using namespace hwprov;

namespace {

RawSignals thinkpad_t420s() {
    RawSignals s;
    s.cpu_vendor_string = "GenuineIntel";
    s.display_controllers = {"VGA compatible controller: Intel", "3D controller: NVIDIA"};
    s.chassis_type = "Notebook";
    s.system_manufacturer = "LENOVO";
    s.system_product_name = "ThinkPad T420s";
    return s;
}

} // namespace

TEST_CASE("ThinkPad with Optimus graphics classifies and resolves end to end") {
    HardwareProfile p = classify(thinkpad_t420s());

    REQUIRE(p.cpu_vendor == CpuVendor::Intel);
    REQUIRE(p.gpu_config == GpuConfig::HybridIntelNvidia);
    REQUIRE(p.platform == Platform::Laptop);
    REQUIRE(p.oem_family == OemFamily::ThinkPad);

    std::vector<std::string> expected = {
        "base", "kernel:performance", "cpu:intel", "gpu:nvidia", "platform:laptop", "oem:thinkpad",
    };
    REQUIRE(resolve(p, KernelChoice::Performance) == expected);
}

TEST_CASE("Empty signals classify to the defined fallbacks") {
    HardwareProfile p = classify(RawSignals{});

    REQUIRE(p.cpu_vendor == CpuVendor::Unknown);
    REQUIRE(p.gpu_config == GpuConfig::Unknown);
    REQUIRE(p.platform == Platform::Desktop);
    REQUIRE(p.oem_family == OemFamily::Generic);
    REQUIRE(p.mirror_region == "US");
    REQUIRE(p.features.empty());

    std::vector<std::string> expected = {"base", "kernel:stable"};
    REQUIRE(resolve(p, KernelChoice::Stable) == expected);
}

TEST_CASE("CPU vendor needs an exact identifier") {
    REQUIRE(classify_cpu("GenuineIntel") == CpuVendor::Intel);
    REQUIRE(classify_cpu("AuthenticAMD") == CpuVendor::Amd);
    REQUIRE(classify_cpu("genuineintel") == CpuVendor::Unknown);
    REQUIRE(classify_cpu("GenuineIntel ") == CpuVendor::Unknown);
    REQUIRE(classify_cpu("HygonGenuine") == CpuVendor::Unknown);
    REQUIRE(classify_cpu("") == CpuVendor::Unknown);
}

TEST_CASE("Hybrid detection does not depend on controller order") {
    std::vector<std::string> intel_first = {
        "00:02.0 VGA compatible controller: Intel Corporation UHD Graphics 620",
        "01:00.0 3D controller: NVIDIA Corporation GP108M [GeForce MX150]",
    };
    std::vector<std::string> nvidia_first = {intel_first[1], intel_first[0]};

    REQUIRE(classify_gpu(intel_first) == GpuConfig::HybridIntelNvidia);
    REQUIRE(classify_gpu(nvidia_first) == GpuConfig::HybridIntelNvidia);

    std::vector<std::string> intel_amd = {
        "03:00.0 Display controller: Advanced Micro Devices, Inc. [AMD/ATI] Lexa PRO",
        "00:02.0 VGA compatible controller: Intel Corporation HD Graphics 630",
    };
    REQUIRE(classify_gpu(intel_amd) == GpuConfig::HybridIntelAmd);
}

TEST_CASE("Single-vendor GPUs") {
    REQUIRE(classify_gpu({"01:00.0 VGA compatible controller: NVIDIA Corporation TU106 [GeForce RTX 2060]"}) ==
            GpuConfig::Nvidia);
    REQUIRE(classify_gpu({"0c:00.0 VGA compatible controller: Advanced Micro Devices, Inc. [AMD/ATI] Navi 21"}) ==
            GpuConfig::Amd);
    REQUIRE(classify_gpu({"00:02.0 VGA compatible controller: Intel Corporation Alder Lake-P GT2"}) ==
            GpuConfig::Intel);
    REQUIRE(classify_gpu({}) == GpuConfig::Unknown);
}

TEST_CASE("GPU vendor keywords match whole words only") {
    // "Radeon" alone still identifies AMD.
    REQUIRE(classify_gpu({"VGA compatible controller: Radeon RX 580"}) == GpuConfig::Amd);
    REQUIRE(classify_gpu({"3D controller: Quadro P1000"}) == GpuConfig::Nvidia);

    // "ati" inside "Corporation", "amd" inside "amdgpu", "intel" inside "intelligent".
    REQUIRE(classify_gpu({"VGA compatible controller: Matrox Electronics Systems Corporation G200eR2"}) ==
            GpuConfig::Unknown);
    REQUIRE(classify_gpu({"Display controller: amdgpu virtual display"}) == GpuConfig::Unknown);
    REQUIRE(classify_gpu({"VGA compatible controller: Intelligent Graphics Device"}) == GpuConfig::Unknown);
}

TEST_CASE("NVIDIA and AMD together without Intel resolve to NVIDIA") {
    std::vector<std::string> both = {
        "VGA compatible controller: NVIDIA Corporation GA104",
        "VGA compatible controller: Advanced Micro Devices, Inc. [AMD/ATI] Raphael",
    };
    REQUIRE(classify_gpu(both) == GpuConfig::Nvidia);

    both.push_back("VGA compatible controller: Intel Corporation Raptor Lake-S GT1");
    REQUIRE(classify_gpu(both) == GpuConfig::HybridIntelNvidia);
}

TEST_CASE("Chassis lookup table decides the platform") {
    for (const char* c : {"Notebook", "Laptop", "Portable", "Hand Held", "Sub Notebook",
                          "Convertible", "Detachable", "Tablet"}) {
        INFO(c);
        REQUIRE(classify_platform(c, false) == Platform::Laptop);
    }
    for (const char* c : {"Desktop", "Low Profile Desktop", "Pizza Box", "Mini Tower", "Tower",
                          "Space-saving", "Lunch Box", "All in One", "Mini PC", "Stick PC"}) {
        INFO(c);
        // A desktop chassis wins even with a UPS battery reported.
        REQUIRE(classify_platform(c, true) == Platform::Desktop);
    }
    REQUIRE(classify_platform("  notebook\n", false) == Platform::Laptop);
}

TEST_CASE("Battery decides when the chassis is inconclusive") {
    REQUIRE(classify_platform("Rack Mount Chassis", false) == Platform::Desktop);
    REQUIRE(classify_platform("Rack Mount Chassis", true) == Platform::Laptop);
    REQUIRE(classify_platform("Other", true) == Platform::Laptop);
    REQUIRE(classify_platform("", true) == Platform::Laptop);
    REQUIRE(classify_platform("", false) == Platform::Desktop);
}

TEST_CASE("OEM family is a vendor then sub-brand decision") {
    REQUIRE(classify_oem("LENOVO", "ThinkPad T420s", "") == OemFamily::ThinkPad);
    // Lenovo puts the marketing name in product_version.
    REQUIRE(classify_oem("LENOVO", "20BXCTO1WW", "ThinkPad T450s") == OemFamily::ThinkPad);
    REQUIRE(classify_oem("LENOVO", "82FG", "IdeaPad 5 14ITL05") == OemFamily::Generic);

    REQUIRE(classify_oem("Dell Inc.", "XPS 13 9310", "") == OemFamily::Dell);
    REQUIRE(classify_oem("ASUSTeK COMPUTER INC.", "ROG Zephyrus G14", "") == OemFamily::Asus);
    REQUIRE(classify_oem("Micro-Star International Co., Ltd.", "GF63", "") == OemFamily::Msi);
    REQUIRE(classify_oem("Acer", "Swift 3", "") == OemFamily::Acer);
    REQUIRE(classify_oem("HP", "EliteBook 840 G8", "") == OemFamily::Hp);
    REQUIRE(classify_oem("Hewlett-Packard", "ProBook 450", "") == OemFamily::Hp);
    REQUIRE(classify_oem("Framework", "Laptop 13", "") == OemFamily::Generic);
    REQUIRE(classify_oem("", "", "") == OemFamily::Generic);
}

TEST_CASE("Mirror region comes from the locale territory") {
    REQUIRE(classify_region("de_DE.UTF-8") == "DE");
    REQUIRE(classify_region("en_gb") == "GB");
    REQUIRE(classify_region("sr_RS@latin") == "RS");
    REQUIRE(classify_region("C") == "US");
    REQUIRE(classify_region("POSIX") == "US");
    REQUIRE(classify_region("") == "US");
    REQUIRE(classify_region("", "SE") == "SE");
}

TEST_CASE("Feature flags are independent of each other") {
    RawSignals s;
    REQUIRE(classify_features(s).empty());

    s.fan_control_interface = true;
    REQUIRE(classify_features(s).fan_control);
    REQUIRE_FALSE(classify_features(s).thunderbolt);

    s.pci_devices = {"05:00.0 PCI bridge: Intel Corporation JHL6540 Thunderbolt 3 Bridge (C step)"};
    s.input_devices = {"ELAN Touchscreen", "AT Translated Set 2 keyboard"};
    s.usb_devices = {"Bus 001 Device 004: ID 06cb:00bd Synaptics, Inc. Prometheus MIS Touch Fingerprint Reader"};
    s.display_controllers = thinkpad_t420s().display_controllers;

    FeatureFlags f = classify_features(s);
    REQUIRE(f.fan_control);
    REQUIRE(f.thunderbolt);
    REQUIRE(f.touchscreen);
    REQUIRE(f.fingerprint);
    REQUIRE(f.gpu_switching);
    REQUIRE(format_features(f) == "fan_control,gpu_switching,thunderbolt,touchscreen,fingerprint");
}

TEST_CASE("Classification is deterministic") {
    RawSignals s = thinkpad_t420s();
    s.locale = "fr_FR.UTF-8";
    s.usb_devices = {"Validity Sensors VFS495 Fingerprint Reader"};

    HardwareProfile a = classify(s);
    HardwareProfile b = classify(s);
    REQUIRE(a == b);
    REQUIRE(a.mirror_region == "FR");
}

TEST_CASE("Reasons cover every axis") {
    ClassifyResult r = classify_with_reasons(thinkpad_t420s());
    REQUIRE(r.reasons.size() == 4);
    REQUIRE(r.reasons[0] == "cpu: vendor string 'GenuineIntel'");
    REQUIRE(r.reasons[2] == "platform: chassis type 'Notebook'");

    ClassifyResult empty = classify_with_reasons(RawSignals{});
    REQUIRE(empty.reasons[0] == "cpu: vendor string unavailable");
    REQUIRE(empty.reasons[2] == "platform: chassis type inconclusive, battery absent");
}

TEST_CASE("Profile JSON uses the persisted names") {
    RawSignals s = thinkpad_t420s();
    s.fan_control_interface = true;
    s.locale = "de_DE.UTF-8";
    ClassifyResult c = classify_with_reasons(s);

    nlohmann::json j = nlohmann::json::parse(format_profile_json(c.profile));
    REQUIRE(j["cpu_vendor"].get<std::string>() == "intel");
    REQUIRE(j["gpu_type"].get<std::string>() == std::string(gpu_config_name(GpuConfig::HybridIntelNvidia)));
    REQUIRE(j["platform"].get<std::string>() == "laptop");
    REQUIRE(j["oem_family"].get<std::string>() == "thinkpad");
    REQUIRE(j["country"].get<std::string>() == "DE");
    REQUIRE(j["features"].get<std::vector<std::string>>() == std::vector<std::string>{"fan_control", "gpu_switching"});
    REQUIRE_FALSE(j.contains("reasons"));

    nlohmann::json explained = nlohmann::json::parse(format_profile_json(c.profile, c.reasons));
    REQUIRE(explained["reasons"].size() == c.reasons.size());

    nlohmann::json bare = nlohmann::json::parse(format_profile_json(HardwareProfile{}));
    REQUIRE(bare["features"].is_array());
    REQUIRE(bare["features"].empty());
}
