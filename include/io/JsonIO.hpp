#pragma once

#include <string>

#include "nlohmann/json.hpp"
#include "splitlens/Models.hpp"
#include "splitlens/SplitConfig.hpp"

// Legacy sentinel accepted in "assigned_to" for "split across everyone".
inline constexpr const char* kAllSentinel = "All";

splitlens::Session parseSession(const nlohmann::json& j);
splitlens::Session loadSession(const std::string& path);

// Accepts {"split_config": {...}} or a bare object; absent keys keep base values.
splitlens::SplitConfig parseSplitConfig(const nlohmann::json& j, splitlens::SplitConfig base = {});
splitlens::SplitConfig loadSplitConfig(const std::string& path, splitlens::SplitConfig base = {});
