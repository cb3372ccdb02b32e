#include "classify.hpp"
#include "signals.hpp"

#include "fakes.hpp"

#include <string>

#include <catch2/catch_test_macros.hpp>

using namespace hwprov;
using hwprov::testing::TempDir;

namespace {

// A ThinkPad T450s as seen through /proc and /sys.
void write_thinkpad_tree(const TempDir& root) {
    root.write("proc/cpuinfo",
               "processor\t: 0\n"
               "vendor_id\t: GenuineIntel\n"
               "cpu family\t: 6\n"
               "\n"
               "processor\t: 1\n"
               "vendor_id\t: GenuineIntel\n");
    root.write("proc/acpi/ibm/fan", "status:\t\tenabled\nspeed:\t\t2400\n");
    root.write("proc/bus/input/devices",
               "I: Bus=0011 Vendor=0001 Product=0001 Version=ab41\n"
               "N: Name=\"AT Translated Set 2 keyboard\"\n"
               "\n"
               "I: Bus=0018 Vendor=04f3 Product=2387 Version=0100\n"
               "N: Name=\"ELAN Touchscreen\"\n");

    root.write("sys/class/dmi/id/chassis_type", "10\n");
    root.write("sys/class/dmi/id/sys_vendor", "LENOVO\n");
    root.write("sys/class/dmi/id/product_name", "20BXCTO1WW\n");
    root.write("sys/class/dmi/id/product_version", "ThinkPad T450s\n");

    root.write("sys/class/power_supply/AC/type", "Mains\n");
    root.write("sys/class/power_supply/BAT0/type", "Battery\n");

    root.write("sys/bus/pci/devices/0000:00:02.0/class", "0x030000\n");
    root.write("sys/bus/pci/devices/0000:00:02.0/vendor", "0x8086\n");
    root.write("sys/bus/pci/devices/0000:00:02.0/device", "0x1616\n");
    root.write("sys/bus/pci/devices/0000:00:1f.3/class", "0x040300\n");
    root.write("sys/bus/pci/devices/0000:00:1f.3/vendor", "0x8086\n");
    root.write("sys/bus/pci/devices/0000:03:00.0/class", "0x030200\n");
    root.write("sys/bus/pci/devices/0000:03:00.0/vendor", "0x10de\n");
    root.write("sys/bus/pci/devices/0000:03:00.0/device", "0x1347\n");

    root.write("sys/bus/usb/devices/1-9/product", "Fingerprint Sensor\n");
}

ProbeRoots roots_for(const TempDir& root) {
    ProbeRoots r;
    r.proc = root / "proc";
    r.sys = root / "sys";
    r.run_commands = false;
    return r;
}

} // namespace

TEST_CASE("Probes read a fixture tree") {
    TempDir root;
    write_thinkpad_tree(root);
    ProbeRoots roots = roots_for(root);

    REQUIRE(read_cpu_vendor_string(roots) == "GenuineIntel");
    REQUIRE(read_chassis_type(roots) == "Notebook");
    REQUIRE(read_system_manufacturer(roots) == "LENOVO");
    REQUIRE(read_system_product_version(roots) == "ThinkPad T450s");
    REQUIRE(has_battery(roots));
    REQUIRE(has_fan_control_interface(roots));
    REQUIRE(list_input_devices(roots) == std::vector<std::string>{"AT Translated Set 2 keyboard", "ELAN Touchscreen"});
    REQUIRE(list_usb_devices(roots) == std::vector<std::string>{"Fingerprint Sensor"});

    std::vector<std::string> gpus = list_display_controllers(roots);
    REQUIRE(gpus.size() == 2);
    REQUIRE(gpus[0] == "0000:00:02.0 VGA compatible controller: Intel Corporation [8086:1616]");
    REQUIRE(gpus[1] == "0000:03:00.0 3D controller: NVIDIA Corporation [10de:1347]");
}

TEST_CASE("Fixture machine classifies as a ThinkPad with Optimus") {
    TempDir root;
    write_thinkpad_tree(root);

    RawSignals s = collect_signals(roots_for(root));
    s.locale = "en_US.UTF-8";
    HardwareProfile p = classify(s);

    REQUIRE(p.cpu_vendor == CpuVendor::Intel);
    REQUIRE(p.gpu_config == GpuConfig::HybridIntelNvidia);
    REQUIRE(p.platform == Platform::Laptop);
    REQUIRE(p.oem_family == OemFamily::ThinkPad);
    REQUIRE(p.features.fan_control);
    REQUIRE(p.features.gpu_switching);
    REQUIRE(p.features.touchscreen);
    REQUIRE(p.features.fingerprint);
    REQUIRE_FALSE(p.features.thunderbolt);
}

TEST_CASE("Missing interfaces yield empty signals, not errors") {
    TempDir root;
    RawSignals s = collect_signals(roots_for(root));
    s.locale.clear();
    REQUIRE(s == RawSignals{});
}

TEST_CASE("Peripheral batteries do not make a desktop a laptop") {
    TempDir root;
    root.write("sys/class/dmi/id/chassis_type", "1\n");
    root.write("sys/class/power_supply/AC/type", "Mains\n");
    root.write("sys/class/power_supply/hidpp_battery_0/type", "Battery\n");
    root.write("sys/class/power_supply/hidpp_battery_0/scope", "Device\n");
    ProbeRoots roots = roots_for(root);

    REQUIRE(read_chassis_type(roots) == "Other");
    REQUIRE_FALSE(has_battery(roots));
    REQUIRE(classify(collect_signals(roots)).platform == Platform::Desktop);

    root.write("sys/class/power_supply/CMB0/type", "Battery\n");
    root.write("sys/class/power_supply/CMB0/scope", "System\n");
    REQUIRE(has_battery(roots));
    REQUIRE(classify(collect_signals(roots)).platform == Platform::Laptop);
}

TEST_CASE("Chassis codes follow SMBIOS") {
    REQUIRE(chassis_code_name(3) == "Desktop");
    REQUIRE(chassis_code_name(10) == "Notebook");
    REQUIRE(chassis_code_name(10 | 0x80) == "Notebook");
    REQUIRE(chassis_code_name(31) == "Convertible");
    REQUIRE(chassis_code_name(36) == "Stick PC");
    REQUIRE(chassis_code_name(0).empty());
    REQUIRE(chassis_code_name(99).empty());
}

TEST_CASE("lspci lines are filtered to display controllers") {
    REQUIRE(is_display_controller_line("00:02.0 VGA compatible controller: Intel Corporation HD Graphics 620"));
    REQUIRE(is_display_controller_line("01:00.0 3D controller: NVIDIA Corporation GM108M"));
    REQUIRE(is_display_controller_line("c1:00.0 Display controller: Advanced Micro Devices, Inc. [AMD/ATI]"));
    REQUIRE_FALSE(is_display_controller_line("00:1f.3 Audio device: Intel Corporation Sunrise Point-LP HD Audio"));
}

TEST_CASE("cpuinfo parsing takes the first vendor_id") {
    REQUIRE(parse_cpuinfo_vendor("processor : 0\nvendor_id : AuthenticAMD\nvendor_id : GenuineIntel\n") ==
            "AuthenticAMD");
    REQUIRE(parse_cpuinfo_vendor("processor : 0\n").empty());
}
