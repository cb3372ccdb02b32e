// linux.cpp
//
// Raw hardware signals on Linux. Uses /proc, /sys and, where present, lspci,
// lsusb and dmidecode. Every probe degrades to an empty value; nothing here
// throws or aborts collection of the other signals.
//
// Notes:
// - DMI strings come from /sys/class/dmi/id (world-readable for the fields we
//   need); dmidecode needs root and is only a fallback.
// - Display controllers fall back to raw PCI class codes under
//   /sys/bus/pci/devices when lspci is not installed.

#include "signals.hpp"

#if defined(__linux__)

#include "text_util.hpp"

#include <algorithm>
#include <array>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <optional>
#include <sstream>
#include <string>
#include <system_error>
#include <vector>

#include <spdlog/spdlog.h>

namespace hwprov {

namespace {

namespace fs = std::filesystem;

std::optional<std::string> read_text_file(const fs::path& p) {
    std::ifstream f(p);
    if (!f) return std::nullopt;
    std::ostringstream ss;
    ss << f.rdbuf();
    return ss.str();
}

std::string read_first_line(const fs::path& p) {
    auto txt = read_text_file(p);
    if (!txt) return {};
    auto nl = txt->find('\n');
    return trim(nl == std::string::npos ? *txt : txt->substr(0, nl));
}

// Sorted directory entries; empty when the directory is missing or unreadable.
std::vector<fs::path> list_dir(const fs::path& dir) {
    std::vector<fs::path> out;
    std::error_code ec;
    fs::directory_iterator it(dir, ec);
    for (; !ec && it != fs::directory_iterator(); it.increment(ec)) {
        out.push_back(it->path());
    }
    std::sort(out.begin(), out.end());
    return out;
}

std::optional<uint64_t> read_hex_u64_file(const fs::path& p) {
    std::string s = read_first_line(p);
    if (s.empty()) return std::nullopt;
    // e.g. "0x10de"
    char* end = nullptr;
    unsigned long long v = std::strtoull(s.c_str(), &end, 16);
    if (!end || end == s.c_str()) return std::nullopt;
    return static_cast<uint64_t>(v);
}

// Runs a probe command and returns its stdout, or nullopt if it could not be
// started or exited non-zero.
std::optional<std::string> run_probe_command(const ProbeRoots& roots, const std::string& cmd) {
    if (!roots.run_commands) return std::nullopt;

    std::string full = cmd + " 2>/dev/null";
    FILE* pipe = popen(full.c_str(), "r");
    if (!pipe) return std::nullopt;

    std::array<char, 4096> buf{};
    std::string out;
    while (fgets(buf.data(), static_cast<int>(buf.size()), pipe) != nullptr) {
        out += buf.data();
        if (out.size() > 256 * 1024) break;
    }

    int rc = pclose(pipe);
    if (rc != 0) {
        spdlog::debug("probe '{}' exited with status {}", cmd, rc);
        return std::nullopt;
    }
    return out;
}

std::string dmidecode_string(const ProbeRoots& roots, const char* keyword) {
    auto out = run_probe_command(roots, std::string("dmidecode -s ") + keyword);
    if (!out) return {};
    for (const std::string& line : split_lines(*out)) {
        std::string t = trim(line);
        // dmidecode prints comment lines when it cannot read the table.
        if (!t.empty() && t[0] != '#') return t;
    }
    return {};
}

std::string dmi_field(const ProbeRoots& roots, const char* sysfs_name, const char* dmidecode_keyword) {
    std::string v = read_first_line(roots.sys / "class" / "dmi" / "id" / sysfs_name);
    if (!v.empty()) return v;
    return dmidecode_string(roots, dmidecode_keyword);
}

const char* pci_vendor_label(uint64_t vendor) {
    switch (vendor) {
        case 0x8086: return "Intel Corporation";
        case 0x1002: return "Advanced Micro Devices, Inc. [AMD/ATI]";
        case 0x10de: return "NVIDIA Corporation";
        default: return nullptr;
    }
}

const char* display_subclass_label(uint64_t pci_class) {
    switch ((pci_class >> 8) & 0xFFull) {
        case 0x00: return "VGA compatible controller";
        case 0x02: return "3D controller";
        default: return "Display controller";
    }
}

// lspci-shaped lines built from /sys/bus/pci/devices/*/{class,vendor,device}.
std::vector<std::string> display_controllers_from_sysfs(const ProbeRoots& roots) {
    std::vector<std::string> out;

    for (const auto& dev : list_dir(roots.sys / "bus" / "pci" / "devices")) {
        auto cls = read_hex_u64_file(dev / "class");
        if (!cls || ((*cls >> 16) & 0xFFull) != 0x03ull) continue;

        uint64_t vendor = read_hex_u64_file(dev / "vendor").value_or(0);
        uint64_t device = read_hex_u64_file(dev / "device").value_or(0);

        char ids[32];
        std::snprintf(ids, sizeof(ids), "[%04llx:%04llx]",
                      (unsigned long long)vendor, (unsigned long long)device);

        std::string line = dev.filename().string();
        line += ' ';
        line += display_subclass_label(*cls);
        line += ": ";
        const char* label = pci_vendor_label(vendor);
        line += label ? label : "Unknown vendor";
        line += ' ';
        line += ids;
        out.push_back(line);
    }
    return out;
}

} // namespace

std::string parse_cpuinfo_vendor(const std::string& cpuinfo) {
    for (const std::string& line : split_lines(cpuinfo)) {
        auto pos = line.find(':');
        if (pos == std::string::npos) continue;
        if (trim(line.substr(0, pos)) == "vendor_id") {
            return trim(line.substr(pos + 1));
        }
    }
    return {};
}

std::string chassis_code_name(int code) {
    // SMBIOS 3.x, system enclosure type (7.4.1). Bit 7 is the lock flag.
    static const std::array<const char*, 37> names = {
        "",
        "Other", "Unknown", "Desktop", "Low Profile Desktop", "Pizza Box",
        "Mini Tower", "Tower", "Portable", "Laptop", "Notebook",
        "Hand Held", "Docking Station", "All in One", "Sub Notebook", "Space-saving",
        "Lunch Box", "Main Server Chassis", "Expansion Chassis", "Sub Chassis", "Bus Expansion Chassis",
        "Peripheral Chassis", "RAID Chassis", "Rack Mount Chassis", "Sealed-case PC", "Multi-system",
        "CompactPCI", "AdvancedTCA", "Blade", "Blade Enclosing", "Tablet",
        "Convertible", "Detachable", "IoT Gateway", "Embedded PC", "Mini PC",
        "Stick PC",
    };
    code &= 0x7F;
    if (code <= 0 || code >= (int)names.size()) return {};
    return names[code];
}

bool is_display_controller_line(const std::string& lspci_line) {
    std::string l = to_lower(lspci_line);
    return contains_any(l, {"vga compatible controller", "3d controller", "display controller"});
}

std::vector<std::string> parse_input_device_names(const std::string& text) {
    std::vector<std::string> out;
    for (const std::string& line : split_lines(text)) {
        std::string t = trim(line);
        if (t.rfind("N: Name=", 0) != 0) continue;
        std::string name = t.substr(8);
        if (name.size() >= 2 && name.front() == '"' && name.back() == '"') {
            name = name.substr(1, name.size() - 2);
        }
        if (!name.empty()) out.push_back(name);
    }
    return out;
}

std::string read_cpu_vendor_string(const ProbeRoots& roots) {
    auto txt = read_text_file(roots.proc / "cpuinfo");
    if (!txt) {
        spdlog::debug("cpuinfo unreadable under {}", roots.proc.string());
        return {};
    }
    return parse_cpuinfo_vendor(*txt);
}

std::vector<std::string> list_display_controllers(const ProbeRoots& roots) {
    std::vector<std::string> out;
    if (auto lspci = run_probe_command(roots, "lspci")) {
        for (const std::string& line : split_lines(*lspci)) {
            if (is_display_controller_line(line)) out.push_back(trim(line));
        }
        return out;
    }
    spdlog::debug("lspci unavailable, reading PCI classes from sysfs");
    return display_controllers_from_sysfs(roots);
}

std::string read_chassis_type(const ProbeRoots& roots) {
    std::string code = read_first_line(roots.sys / "class" / "dmi" / "id" / "chassis_type");
    if (!code.empty()) {
        char* end = nullptr;
        long v = std::strtol(code.c_str(), &end, 10);
        if (end && end != code.c_str()) {
            std::string name = chassis_code_name((int)v);
            if (!name.empty()) return name;
        }
    }
    return dmidecode_string(roots, "chassis-type");
}

std::string read_system_manufacturer(const ProbeRoots& roots) {
    return dmi_field(roots, "sys_vendor", "system-manufacturer");
}

std::string read_system_product_name(const ProbeRoots& roots) {
    return dmi_field(roots, "product_name", "system-product-name");
}

std::string read_system_product_version(const ProbeRoots& roots) {
    return dmi_field(roots, "product_version", "system-version");
}

// Peripherals (wireless mice, keyboards, UPS HID) also report type Battery,
// but with scope Device; only a system battery counts.
bool has_battery(const ProbeRoots& roots) {
    for (const auto& supply : list_dir(roots.sys / "class" / "power_supply")) {
        if (read_first_line(supply / "scope") == "Device") continue;
        std::string name = supply.filename().string();
        if (name.rfind("BAT", 0) == 0) return true;
        if (read_first_line(supply / "type") == "Battery") return true;
    }
    return false;
}

std::string read_locale() {
    for (const char* var : {"LC_ALL", "LC_CTYPE", "LANG"}) {
        const char* v = std::getenv(var);
        if (v && *v) return v;
    }
    return {};
}

bool has_fan_control_interface(const ProbeRoots& roots) {
    std::error_code ec;
    return fs::exists(roots.proc / "acpi" / "ibm" / "fan", ec);
}

std::vector<std::string> list_pci_devices(const ProbeRoots& roots) {
    std::vector<std::string> out;
    if (auto lspci = run_probe_command(roots, "lspci")) {
        for (const std::string& line : split_lines(*lspci)) {
            std::string t = trim(line);
            if (!t.empty()) out.push_back(t);
        }
    }
    return out;
}

std::vector<std::string> list_input_devices(const ProbeRoots& roots) {
    auto txt = read_text_file(roots.proc / "bus" / "input" / "devices");
    if (!txt) return {};
    return parse_input_device_names(*txt);
}

std::vector<std::string> list_usb_devices(const ProbeRoots& roots) {
    std::vector<std::string> out;
    if (auto lsusb = run_probe_command(roots, "lsusb")) {
        for (const std::string& line : split_lines(*lsusb)) {
            std::string t = trim(line);
            if (!t.empty()) out.push_back(t);
        }
        return out;
    }

    for (const auto& dev : list_dir(roots.sys / "bus" / "usb" / "devices")) {
        std::string product = read_first_line(dev / "product");
        if (!product.empty()) out.push_back(product);
    }
    return out;
}

RawSignals collect_signals(const ProbeRoots& roots) {
    RawSignals s;

    s.cpu_vendor_string = read_cpu_vendor_string(roots);
    s.display_controllers = list_display_controllers(roots);
    s.chassis_type = read_chassis_type(roots);
    s.system_manufacturer = read_system_manufacturer(roots);
    s.system_product_name = read_system_product_name(roots);
    s.system_product_version = read_system_product_version(roots);
    s.has_battery = has_battery(roots);
    s.locale = read_locale();

    s.fan_control_interface = has_fan_control_interface(roots);
    s.pci_devices = list_pci_devices(roots);
    s.input_devices = list_input_devices(roots);
    s.usb_devices = list_usb_devices(roots);

    spdlog::debug("signals: cpu='{}' controllers={} chassis='{}' vendor='{}' product='{}' battery={}",
                  s.cpu_vendor_string, s.display_controllers.size(), s.chassis_type,
                  s.system_manufacturer, s.system_product_name, s.has_battery);
    return s;
}

} // namespace hwprov

#endif
