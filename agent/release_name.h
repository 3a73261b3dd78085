#pragma once

#include <cstddef>
#include <string>

// Maximum release name length accepted by the Helm backend
constexpr size_t kMaxReleaseNameLength = 53;

// Backend resource name for one component of a workload. Shared by the
// deployer and the monitor so both address the same release.
//
// "{workloadId}-{componentName}"; when longer than 53 characters the first 8
// characters of the workload id are kept together with the trailing part of
// the component name that fits. The result is lower-cased and underscores are
// replaced with hyphens.
std::string releaseName(const std::string& workload_id, const std::string& component_name);
