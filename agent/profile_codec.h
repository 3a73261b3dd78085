#pragma once

#include <map>
#include <string>
#include <nlohmann/json.hpp>
#include "workload_types.h"

// Converts the state-store representation of a workload into a normalized
// deployment spec. Throws ValidationError on any malformed input.
DeploymentSpec decodeDeployment(const WorkloadState& state);

// Parses a descriptor document that is already in JSON form
DeploymentSpec parseDeploymentDescriptor(const nlohmann::json& descriptor, const std::string& fallback_id);

WorkloadState encodeWorkloadState(const std::string& app_id,
                                  const std::string& app_version,
                                  const std::string& state,
                                  const nlohmann::json& descriptor);

// Per-component values override trees built from the descriptor parameters
std::map<std::string, nlohmann::json> parameterValues(const DeploymentSpec& spec);

std::string base64Encode(const std::string& input);
std::string base64Decode(const std::string& input);
std::string sha256Hex(const std::string& input);
