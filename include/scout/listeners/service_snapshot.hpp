#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "nlohmann/json.hpp"
#include "scout/listeners/types.hpp"

namespace scout::listeners {

/// @brief Everything a Service was able to report at one point in time.
/// Unsupported attributes stay empty; other accessor failures also leave the
/// attribute empty and record the message in @ref errors.
struct ServiceSnapshot {
    ID id;
    std::optional<std::vector<std::string>> ad_identifiers;
    std::optional<std::map<std::string, std::string>> hosts;
    std::optional<std::vector<ContainerPort>> ports;
    std::optional<std::vector<std::string>> tags;
    std::optional<int> pid;
    std::optional<std::string> hostname;
    /// @brief Attribute name to error message.
    std::map<std::string, std::string> errors;
};

/// @brief Queries every accessor of @p service.
ServiceSnapshot capture(const Service& service);

void to_json(nlohmann::json& j, const ContainerPort& p);
void from_json(const nlohmann::json& j, ContainerPort& p);
void to_json(nlohmann::json& j, const ServiceSnapshot& s);

}  // namespace scout::listeners
