#include "utils/config.h"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <optional>
#include <sstream>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "utils/file_lock.h"
#include "utils/url_utils.h"

namespace paca {

namespace {

constexpr uint64_t kMinChunkSize = 64ull * 1024;
constexpr uint64_t kMaxChunkSize = 1024ull * 1024 * 1024;
constexpr size_t kMaxConcurrency = 64;

std::optional<std::string> getEnvValue(const char* name) {
    if (!name || !*name) {
        return std::nullopt;
    }
    if (const char* v = std::getenv(name)) {
        return std::string(v);
    }
    return std::nullopt;
}

std::optional<long long> parseInteger(const std::string& value) {
    try {
        size_t consumed = 0;
        long long v = std::stoll(value, &consumed);
        if (consumed != value.size()) return std::nullopt;
        return v;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

bool validConcurrency(long long v) { return v > 0 && v <= static_cast<long long>(kMaxConcurrency); }

bool validChunk(long long v) {
    return v >= static_cast<long long>(kMinChunkSize) && v <= static_cast<long long>(kMaxChunkSize);
}

bool readJsonWithLock(const std::filesystem::path& path, nlohmann::json& out) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) return false;
    FileLock lock(path.string() + ".lock", true);
    std::ifstream ifs(path);
    if (!ifs.is_open()) return false;
    out = nlohmann::json::parse(ifs, nullptr, false);
    if (out.is_discarded() || !out.is_object()) {
        spdlog::warn("Config: ignoring malformed config file path='{}'", path.string());
        return false;
    }
    return true;
}

void applyJson(const nlohmann::json& j, DownloadConfig& cfg) {
    auto integer = [&](const char* key) -> std::optional<long long> {
        if (!j.contains(key) || !j[key].is_number_integer()) return std::nullopt;
        return j[key].get<long long>();
    };

    if (auto v = integer("concurrency"); v && validConcurrency(*v)) {
        cfg.max_concurrency = static_cast<size_t>(*v);
    }
    if (auto v = integer("per_file_concurrency"); v && validConcurrency(*v)) {
        cfg.max_per_file_concurrency = static_cast<size_t>(*v);
    }
    if (auto v = integer("chunk"); v && validChunk(*v)) {
        cfg.chunk_size = static_cast<uint64_t>(*v);
    }
    if (auto v = integer("max_retries"); v && *v >= 0) {
        cfg.max_retries = static_cast<int>(*v);
    }
    if (auto v = integer("backoff_ms"); v && *v >= 0) {
        cfg.backoff = std::chrono::milliseconds(*v);
    }
    if (auto v = integer("timeout_ms"); v && *v > 0) {
        cfg.timeout = std::chrono::milliseconds(*v);
    }
    if (auto v = integer("max_bps"); v && *v >= 0) {
        cfg.max_bytes_per_sec_per_host = static_cast<uint64_t>(*v);
    }
    if (j.contains("preflight_disk_check") && j["preflight_disk_check"].is_boolean()) {
        cfg.preflight_disk_check = j["preflight_disk_check"].get<bool>();
    }
    if (j.contains("endpoint") && j["endpoint"].is_string()) {
        cfg.endpoint = trimTrailingSlash(j["endpoint"].get<std::string>());
    }
    if (j.contains("models_dir") && j["models_dir"].is_string()) {
        cfg.models_dir = j["models_dir"].get<std::string>();
    }
}

}  // namespace

std::string defaultConfigPath() {
    auto home = getEnvValue("HOME");
    if (!home || home->empty()) return "";
    return (std::filesystem::path(*home) / ".paca" / "config.json").string();
}

std::string defaultModelsDir() {
    if (auto xdg = getEnvValue("XDG_CACHE_HOME"); xdg && !xdg->empty()) {
        return (std::filesystem::path(*xdg) / "paca").string();
    }
    auto home = getEnvValue("HOME");
    if (home && !home->empty()) {
        return (std::filesystem::path(*home) / ".cache" / "paca").string();
    }
    return (std::filesystem::temp_directory_path() / "paca").string();
}

DownloadConfig loadDownloadConfig() {
    return loadDownloadConfigWithLog().first;
}

std::pair<DownloadConfig, std::string> loadDownloadConfigWithLog() {
    DownloadConfig cfg;
    cfg.models_dir = defaultModelsDir();
    std::ostringstream log;
    bool used_file = false;
    bool used_env = false;

    std::filesystem::path cfg_path;
    if (auto env = getEnvValue("PACA_CONFIG")) {
        cfg_path = *env;
    } else {
        cfg_path = defaultConfigPath();
    }
    if (!cfg_path.empty()) {
        nlohmann::json j;
        if (readJsonWithLock(cfg_path, j)) {
            applyJson(j, cfg);
            log << "file=" << cfg_path.string() << " ";
            used_file = true;
        }
    }

    auto env_integer = [&](const char* name, auto&& accept) {
        auto env = getEnvValue(name);
        if (!env) return;
        auto v = parseInteger(*env);
        if (!v || !accept(*v)) {
            spdlog::warn("Config: ignoring invalid value {}='{}'", name, *env);
            return;
        }
        log << "env:" << name << "=" << *v << " ";
        used_env = true;
    };

    env_integer("PACA_DL_CONCURRENCY", [&](long long v) {
        if (!validConcurrency(v)) return false;
        cfg.max_concurrency = static_cast<size_t>(v);
        return true;
    });
    env_integer("PACA_DL_PER_FILE_CONCURRENCY", [&](long long v) {
        if (!validConcurrency(v)) return false;
        cfg.max_per_file_concurrency = static_cast<size_t>(v);
        return true;
    });
    env_integer("PACA_DL_CHUNK", [&](long long v) {
        if (!validChunk(v)) return false;
        cfg.chunk_size = static_cast<uint64_t>(v);
        return true;
    });
    env_integer("PACA_DL_MAX_RETRIES", [&](long long v) {
        if (v < 0) return false;
        cfg.max_retries = static_cast<int>(v);
        return true;
    });
    env_integer("PACA_DL_BACKOFF_MS", [&](long long v) {
        if (v < 0) return false;
        cfg.backoff = std::chrono::milliseconds(v);
        return true;
    });
    env_integer("PACA_DL_TIMEOUT_MS", [&](long long v) {
        if (v <= 0) return false;
        cfg.timeout = std::chrono::milliseconds(v);
        return true;
    });
    env_integer("PACA_DL_MAX_BPS", [&](long long v) {
        if (v < 0) return false;
        cfg.max_bytes_per_sec_per_host = static_cast<uint64_t>(v);
        return true;
    });

    // MODEL_ENDPOINT takes precedence over HF_ENDPOINT.
    if (auto v = getEnvValue("MODEL_ENDPOINT"); v && !v->empty()) {
        cfg.endpoint = trimTrailingSlash(*v);
        log << "env:MODEL_ENDPOINT=" << cfg.endpoint << " ";
        used_env = true;
    } else if (auto v2 = getEnvValue("HF_ENDPOINT"); v2 && !v2->empty()) {
        cfg.endpoint = trimTrailingSlash(*v2);
        log << "env:HF_ENDPOINT=" << cfg.endpoint << " ";
        used_env = true;
    }
    if (auto v = getEnvValue("HF_TOKEN"); v && !v->empty()) {
        cfg.token = *v;
        log << "env:HF_TOKEN=*** ";
        used_env = true;
    }
    if (auto v = getEnvValue("PACA_MODELS_DIR"); v && !v->empty()) {
        cfg.models_dir = *v;
        log << "env:MODELS_DIR=" << *v << " ";
        used_env = true;
    }

    if (cfg.max_per_file_concurrency > cfg.max_concurrency) {
        cfg.max_per_file_concurrency = cfg.max_concurrency;
    }

    if (log.tellp() > 0) log << "|";
    log << "sources=";
    if (used_env) log << "env";
    if (used_file) {
        if (used_env) log << ",";
        log << "file";
    }
    if (!used_env && !used_file) log << "default";

    return {cfg, log.str()};
}

}  // namespace paca
