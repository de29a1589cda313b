#pragma once

#include <filesystem>
#include <string>

#include "nlohmann/json.hpp"
#include "splitlens/Models.hpp"
#include "splitlens/SplitConfig.hpp"

namespace splitlens {

struct SplitArtifact {
    std::string session_path;

    Session session;
    SplitConfig cfg;
    SplitResult result;

    nlohmann::json to_json() const;
    void write_to(const std::filesystem::path& out_path) const;
};

nlohmann::json settlement_to_json(const Settlement& s);
nlohmann::json warning_to_json(const SettlementWarning& w);
nlohmann::json split_config_to_json(const SplitConfig& cfg);

}  // namespace splitlens
