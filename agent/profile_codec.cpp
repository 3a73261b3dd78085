#include "profile_codec.h"
#include "errors.h"
#include <cctype>
#include <cstdlib>
#include <iomanip>
#include <memory>
#include <set>
#include <sstream>
#include <vector>
#include <openssl/bio.h>
#include <openssl/buffer.h>
#include <openssl/evp.h>

namespace {

std::vector<std::string> splitPointer(const std::string& pointer) {
    std::vector<std::string> keys;
    std::istringstream stream(pointer);
    std::string key;
    while (std::getline(stream, key, '.')) {
        keys.push_back(key);
    }
    return keys;
}

// "true"/"false" become booleans, numeric strings become numbers
nlohmann::json convertStringValue(const std::string& value) {
    if (value == "true") return true;
    if (value == "false") return false;
    if (value.empty()) return value;

    char* end = nullptr;
    long long as_int = std::strtoll(value.c_str(), &end, 10);
    if (end != nullptr && *end == '\0') {
        return as_int;
    }

    end = nullptr;
    double as_double = std::strtod(value.c_str(), &end);
    if (end != nullptr && *end == '\0') {
        return as_double;
    }

    return value;
}

void setNestedValue(nlohmann::json& values, const std::string& pointer, const nlohmann::json& value) {
    std::vector<std::string> keys = splitPointer(pointer);
    if (keys.empty()) {
        throw ValidationError("parameter target pointer cannot be empty");
    }

    nlohmann::json* current = &values;
    std::string path;
    for (size_t i = 0; i + 1 < keys.size(); ++i) {
        path += (i == 0 ? "" : ".") + keys[i];
        nlohmann::json& next = (*current)[keys[i]];
        if (next.is_null()) {
            next = nlohmann::json::object();
        }
        if (!next.is_object()) {
            throw ValidationError("conflict at key path " + path + ": expected map but found " + next.type_name());
        }
        current = &next;
    }

    (*current)[keys.back()] = value;
}

} // namespace

DeploymentSpec parseDeploymentDescriptor(const nlohmann::json& descriptor, const std::string& fallback_id) {
    if (!descriptor.is_object()) {
        throw ValidationError("deployment descriptor must be a JSON object");
    }

    DeploymentSpec spec;
    const auto metadata = descriptor.value("metadata", nlohmann::json::object());
    spec.id = metadata.value("id", fallback_id);
    spec.name = metadata.value("name", "");
    if (spec.id.empty()) {
        spec.id = fallback_id;
    }

    if (!descriptor.contains("spec") || !descriptor["spec"].is_object()) {
        throw ValidationError("deployment descriptor has no spec");
    }
    const auto& body = descriptor["spec"];

    if (!body.contains("deploymentProfile") || !body["deploymentProfile"].is_object()) {
        throw ValidationError("deployment descriptor has no deploymentProfile");
    }
    const auto& profile = body["deploymentProfile"];

    spec.profile_type = profile.value("type", "");
    if (spec.profile_type.empty()) {
        throw ValidationError("deployment profile type is required");
    }

    const auto components = profile.value("components", nlohmann::json::array());
    if (!components.is_array()) {
        throw ValidationError("deployment profile components must be a list");
    }

    for (const auto& component_json : components) {
        if (!component_json.is_object()) {
            throw ValidationError("deployment profile component must be an object");
        }
        ComponentSpec component;
        component.name = component_json.value("name", "");
        if (component.name.empty()) {
            throw ValidationError("deployment profile component name is required");
        }
        component.type = spec.profile_type;
        component.properties = component_json.value("properties", nlohmann::json::object());
        spec.components.push_back(component);
    }

    spec.parameters = body.value("parameters", nlohmann::json::object());
    return spec;
}

DeploymentSpec decodeDeployment(const WorkloadState& state) {
    if (state.deployment_base64.empty()) {
        throw ValidationError("deployment descriptor of " + state.app_id + " is empty");
    }

    std::string decoded = base64Decode(state.deployment_base64);
    if (decoded.empty()) {
        throw ValidationError("deployment descriptor of " + state.app_id + " is not valid base64");
    }

    nlohmann::json descriptor = nlohmann::json::parse(decoded, nullptr, false);
    if (descriptor.is_discarded()) {
        throw ValidationError("deployment descriptor of " + state.app_id + " is not valid JSON");
    }

    return parseDeploymentDescriptor(descriptor, state.app_id);
}

WorkloadState encodeWorkloadState(const std::string& app_id,
                                  const std::string& app_version,
                                  const std::string& state,
                                  const nlohmann::json& descriptor) {
    std::string serialized = descriptor.dump();

    WorkloadState workload;
    workload.app_id = app_id;
    workload.app_version = app_version;
    workload.state = state;
    workload.deployment_base64 = base64Encode(serialized);
    workload.deployment_hash = sha256Hex(serialized);
    return workload;
}

std::map<std::string, nlohmann::json> parameterValues(const DeploymentSpec& spec) {
    std::map<std::string, nlohmann::json> values;
    if (!spec.parameters.is_object()) {
        return values;
    }

    for (const auto& [param_name, param] : spec.parameters.items()) {
        if (!param.is_object()) {
            throw ValidationError("parameter " + param_name + " must be an object");
        }

        nlohmann::json value;
        if (param.contains("value")) {
            const auto& raw = param.at("value");
            value = raw.is_string() ? convertStringValue(raw.get<std::string>()) : raw;
        }

        for (const auto& target : param.value("targets", nlohmann::json::array())) {
            if (!target.is_object()) {
                throw ValidationError("parameter " + param_name + " has a malformed target");
            }
            std::string pointer = target.value("pointer", "");
            for (const auto& component : target.value("components", nlohmann::json::array())) {
                if (!component.is_string()) {
                    continue;
                }
                auto& component_values = values[component.get<std::string>()];
                if (component_values.is_null()) {
                    component_values = nlohmann::json::object();
                }
                setNestedValue(component_values, pointer, value);
            }
        }
    }

    return values;
}

std::string base64Encode(const std::string& input) {
    BIO* bio = BIO_new(BIO_s_mem());
    BIO* b64 = BIO_new(BIO_f_base64());
    BIO_set_flags(b64, BIO_FLAGS_BASE64_NO_NL);

    bio = BIO_push(b64, bio);

    BIO_write(bio, input.data(), static_cast<int>(input.size()));
    BIO_flush(bio);

    BUF_MEM* buffer_ptr = nullptr;
    BIO_get_mem_ptr(bio, &buffer_ptr);

    std::string result(buffer_ptr->data, buffer_ptr->length);
    BIO_free_all(bio);

    return result;
}

std::string base64Decode(const std::string& input) {
    std::string trimmed;
    trimmed.reserve(input.size());
    for (char c : input) {
        if (!std::isspace(static_cast<unsigned char>(c))) {
            trimmed.push_back(c);
        }
    }
    if (trimmed.empty()) {
        return "";
    }

    BIO* bio = BIO_new_mem_buf(trimmed.data(), static_cast<int>(trimmed.size()));
    BIO* b64 = BIO_new(BIO_f_base64());
    BIO_set_flags(b64, BIO_FLAGS_BASE64_NO_NL);

    bio = BIO_push(b64, bio);

    std::vector<char> buffer(trimmed.size());
    int decoded_length = BIO_read(bio, buffer.data(), static_cast<int>(buffer.size()));
    BIO_free_all(bio);

    if (decoded_length <= 0) {
        return "";
    }
    return std::string(buffer.data(), static_cast<size_t>(decoded_length));
}

std::string sha256Hex(const std::string& input) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_length = 0;

    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(), EVP_MD_CTX_free);
    if (!ctx ||
        EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1 ||
        EVP_DigestUpdate(ctx.get(), input.data(), input.size()) != 1 ||
        EVP_DigestFinal_ex(ctx.get(), digest, &digest_length) != 1) {
        throw std::runtime_error("sha256 digest failed");
    }

    std::ostringstream hex;
    for (unsigned int i = 0; i < digest_length; ++i) {
        hex << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(digest[i]);
    }
    return hex.str();
}
