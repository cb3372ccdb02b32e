#include "env_file.hpp"
#include "hwprov.hpp"
#include "package_groups.hpp"
#include "text_util.hpp"

#include <map>
#include <string>
#include <vector>

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

namespace py = pybind11;
using namespace hwprov;

static py::dict profile_to_dict(const HardwareProfile& p) {
    py::dict d;
    d["cpu_vendor"] = cpu_vendor_name(p.cpu_vendor);
    d["gpu_config"] = gpu_config_name(p.gpu_config);
    d["platform"] = platform_name(p.platform);
    d["oem_family"] = oem_family_name(p.oem_family);
    d["mirror_region"] = p.mirror_region;

    std::vector<std::string> features;
    for (Feature f : all_features()) {
        if (p.features.has(f)) features.push_back(feature_name(f));
    }
    d["features"] = features;
    return d;
}

template<typename T>
static T get_or(const py::dict& d, const char* key, T def) {
    return d.contains(key) ? d[key].cast<T>() : def;
}

static RawSignals signals_from_dict(const py::dict& d) {
    using Strings = std::vector<std::string>;
    RawSignals s;
    s.cpu_vendor_string = get_or<std::string>(d, "cpu_vendor_string", "");
    s.display_controllers = get_or<Strings>(d, "display_controllers", {});
    s.chassis_type = get_or<std::string>(d, "chassis_type", "");
    s.system_manufacturer = get_or<std::string>(d, "system_manufacturer", "");
    s.system_product_name = get_or<std::string>(d, "system_product_name", "");
    s.system_product_version = get_or<std::string>(d, "system_product_version", "");
    s.has_battery = get_or<bool>(d, "has_battery", false);
    s.locale = get_or<std::string>(d, "locale", "");
    s.fan_control_interface = get_or<bool>(d, "fan_control_interface", false);
    s.pci_devices = get_or<Strings>(d, "pci_devices", {});
    s.input_devices = get_or<Strings>(d, "input_devices", {});
    s.usb_devices = get_or<Strings>(d, "usb_devices", {});
    return s;
}

// Goes through the same validation as the persisted file.
static HardwareProfile profile_from_dict(const py::dict& d) {
    std::map<std::string, std::string> env;
    env["CPU_VENDOR"] = get_or<std::string>(d, "cpu_vendor", "unknown");
    env["GPU_TYPE"] = get_or<std::string>(d, "gpu_config", "unknown");
    env["PLATFORM"] = get_or<std::string>(d, "platform", "desktop");
    env["OEM_FAMILY"] = get_or<std::string>(d, "oem_family", "generic");
    env["COUNTRY"] = get_or<std::string>(d, "mirror_region", kDefaultRegion);

    env["FEATURES"] = join(get_or<std::vector<std::string>>(d, "features", {}), ",");

    ProfileParseResult r = profile_from_env(env);
    if (!r.ok) throw py::value_error(r.error);
    return r.profile;
}

PYBIND11_MODULE(_hwprov, m) {
    m.doc() = "hwprov hardware classification (native extension)";

    m.def("detect_profile", []() {
        return profile_to_dict(detect_profile());
    }, "Probe this machine and return its hardware profile as a dict.");

    m.def("classify", [](const py::dict& signals) {
        return profile_to_dict(classify(signals_from_dict(signals)));
    }, py::arg("signals"), "Classify a dict of raw signals without touching the system.");

    m.def("resolve", [](const py::dict& profile, const std::string& kernel) {
        auto k = parse_kernel_choice(kernel);
        if (!k) throw py::value_error("unknown kernel '" + kernel + "'");
        return resolve(profile_from_dict(profile), *k);
    }, py::arg("profile"), py::arg("kernel") = "performance",
       "Return the ordered package-group keys for a profile dict.");

    m.def("load_profile_env", [](const std::string& path) {
        ProfileParseResult r = load_profile_env(path);
        if (!r.ok) throw py::value_error(r.error);
        return profile_to_dict(r.profile);
    }, py::arg("path"), "Load a persisted profile file; raises ValueError if it is rejected.");

#ifdef HWPROV_VERSION
    m.attr("__version__") = HWPROV_VERSION;
#else
    m.attr("__version__") = "0.0.0";
#endif
}
