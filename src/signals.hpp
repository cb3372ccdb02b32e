#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace hwprov {

// Raw, unclassified observations. Every field has a defined "nothing seen"
// value; a probe that cannot read its source leaves the field at that value.
struct RawSignals {
    std::string cpu_vendor_string;                  // "GenuineIntel", "AuthenticAMD", ...
    std::vector<std::string> display_controllers;   // lspci VGA/3D/Display lines
    std::string chassis_type;                       // SMBIOS description, e.g. "Notebook"
    std::string system_manufacturer;
    std::string system_product_name;
    std::string system_product_version;             // Lenovo puts "ThinkPad X1" here
    bool has_battery = false;
    std::string locale;

    // Feature sources
    bool fan_control_interface = false;             // /proc/acpi/ibm/fan
    std::vector<std::string> pci_devices;           // every lspci line
    std::vector<std::string> input_devices;         // input device names
    std::vector<std::string> usb_devices;           // lsusb lines / product strings

    bool operator==(const RawSignals&) const = default;
};

// Filesystem roots the probes read from. Tests point these at fixture trees.
struct ProbeRoots {
    std::filesystem::path proc = "/proc";
    std::filesystem::path sys = "/sys";
    bool run_commands = true;   // lspci, lsusb, dmidecode
};

std::string read_cpu_vendor_string(const ProbeRoots& roots = {});
std::vector<std::string> list_display_controllers(const ProbeRoots& roots = {});
std::string read_chassis_type(const ProbeRoots& roots = {});
std::string read_system_manufacturer(const ProbeRoots& roots = {});
std::string read_system_product_name(const ProbeRoots& roots = {});
std::string read_system_product_version(const ProbeRoots& roots = {});
bool has_battery(const ProbeRoots& roots = {});
std::string read_locale();

bool has_fan_control_interface(const ProbeRoots& roots = {});
std::vector<std::string> list_pci_devices(const ProbeRoots& roots = {});
std::vector<std::string> list_input_devices(const ProbeRoots& roots = {});
std::vector<std::string> list_usb_devices(const ProbeRoots& roots = {});

RawSignals collect_signals(const ProbeRoots& roots = {});

// Pure helpers, exposed for tests.
std::string parse_cpuinfo_vendor(const std::string& cpuinfo);
std::string chassis_code_name(int smbios_code);
bool is_display_controller_line(const std::string& lspci_line);
std::vector<std::string> parse_input_device_names(const std::string& proc_bus_input_devices);

} // namespace hwprov
