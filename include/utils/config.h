#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>

namespace paca {

struct DownloadConfig {
    size_t max_concurrency{8};
    size_t max_per_file_concurrency{4};
    uint64_t chunk_size{32ull * 1024 * 1024};
    int max_retries{5};
    std::chrono::milliseconds backoff{500};
    std::chrono::milliseconds timeout{30000};
    // Shared bandwidth budget per remote host (0 = unlimited).
    uint64_t max_bytes_per_sec_per_host{0};
    bool preflight_disk_check{true};
    std::string endpoint{"https://huggingface.co"};
    std::string token;
    std::string models_dir;
};

// Defaults <- JSON file ($PACA_CONFIG or ~/.paca/config.json) <- environment.
DownloadConfig loadDownloadConfig();
std::pair<DownloadConfig, std::string> loadDownloadConfigWithLog();

// ~/.paca/config.json (empty when HOME is unset).
std::string defaultConfigPath();

// $XDG_CACHE_HOME/paca or ~/.cache/paca.
std::string defaultModelsDir();

}  // namespace paca
