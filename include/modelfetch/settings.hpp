#pragma once

#include "curl_http_client.hpp"
#include "ini_config.hpp"
#include "model_path_registry.hpp"
#include "transfer_coordinator.hpp"

#include <chrono>
#include <map>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

namespace modelfetch {

struct Settings {
    TransferOptions transfer;
    HttpOptions http;
    std::chrono::milliseconds pause_poll{500};
    spdlog::level::level_enum log_level{spdlog::level::info};
    std::map<std::string, std::vector<std::string>> paths;
    // Legacy category name to current name; [path_aliases] adds or overrides.
    std::map<std::string, std::string> aliases{{"unet", "diffusion_models"}, {"clip", "text_encoders"}};
    std::vector<std::string> extensions{".ckpt", ".pt", ".pt2", ".bin", ".pth", ".safetensors", ".pkl", ".sft"};

    // Missing keys keep their defaults; unparsable values are logged and ignored.
    static Settings fromConfig(const IniConfig& config);

    void applyTo(FolderPathRegistry& registry) const;
};

// Splits "a;b;;c" into {"a", "b", "c"}, trimming whitespace.
[[nodiscard]] std::vector<std::string> splitList(const std::string& value, char separator = ';');

} // namespace modelfetch
