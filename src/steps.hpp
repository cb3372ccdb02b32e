#pragma once

#include "pipeline.hpp"

#include <string>
#include <vector>

namespace hwprov {

// The fixed provisioning pipeline, in execution order:
// install-prerequisites, detect-hardware, fix-permissions, refresh-mirrors, sync-package-database,
// install-packages, install-aur-packages, create-directories,
// migrate-config-files, install-system-files, enable-services,
// reload-configuration, verify-installation.
std::vector<ProvisioningStep> build_pipeline();

// Looks a step up by name in build_pipeline(); throws std::out_of_range if absent.
ProvisioningStep pipeline_step(const std::string& name);

// Flag, then an already-installed performance kernel, then the operator, then
// the manifest default.
KernelChoice choose_kernel(StepContext& ctx);

// Packages of all groups in group order, first occurrence wins.
std::vector<std::string> flatten_packages(const std::vector<PackageGroup>& groups);

// Script-like files: "*.sh" or no extension at all.
bool looks_like_script(const std::filesystem::path& p);

StepResult install_prerequisites(StepContext& ctx);
StepResult detect_hardware(StepContext& ctx);
StepResult fix_permissions(StepContext& ctx);
StepResult refresh_mirrors(StepContext& ctx);
StepResult sync_package_database(StepContext& ctx);
StepResult install_packages(StepContext& ctx);
StepResult install_aur_packages(StepContext& ctx);

// Clones the helper's AUR repository and builds it with makepkg. Succeeds
// only when the helper is usable afterwards.
StepResult bootstrap_aur_helper(StepContext& ctx);
StepResult create_directories(StepContext& ctx);
StepResult migrate_config_files(StepContext& ctx);
StepResult install_system_files(StepContext& ctx);
StepResult enable_services(StepContext& ctx);
StepResult reload_configuration(StepContext& ctx);
StepResult verify_installation(StepContext& ctx);

} // namespace hwprov
