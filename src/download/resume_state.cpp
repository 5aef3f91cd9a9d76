#include "download/resume_state.h"

#include <fstream>
#include <sstream>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "utils/fs_utils.h"

namespace paca {

std::string ResumeState::toJson() const {
    nlohmann::json j;
    j["version"] = kVersion;
    j["path"] = path;
    j["size"] = size;
    j["content_hash"] = content_hash;
    if (!etag.empty()) j["etag"] = etag;
    j["ranges_supported"] = ranges_supported;
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& r : ranges.ranges()) {
        arr.push_back({r.start, r.end});
    }
    j["ranges"] = arr;
    return j.dump();
}

std::optional<ResumeState> ResumeState::fromJson(const std::string& text) {
    auto j = nlohmann::json::parse(text, nullptr, false);
    if (j.is_discarded() || !j.is_object()) return std::nullopt;
    if (j.value("version", 0) != kVersion) return std::nullopt;
    if (!j.contains("path") || !j["path"].is_string()) return std::nullopt;
    if (!j.contains("size") || !j["size"].is_number_unsigned()) return std::nullopt;
    if (!j.contains("ranges") || !j["ranges"].is_array()) return std::nullopt;

    ResumeState state;
    state.path = j["path"].get<std::string>();
    state.size = j["size"].get<uint64_t>();
    if (j.contains("content_hash") && j["content_hash"].is_string()) {
        state.content_hash = j["content_hash"].get<std::string>();
    }
    if (j.contains("etag") && j["etag"].is_string()) {
        state.etag = j["etag"].get<std::string>();
    }
    if (j.contains("ranges_supported") && j["ranges_supported"].is_boolean()) {
        state.ranges_supported = j["ranges_supported"].get<bool>();
    }
    for (const auto& item : j["ranges"]) {
        if (!item.is_array() || item.size() != 2 || !item[0].is_number_unsigned() ||
            !item[1].is_number_unsigned()) {
            return std::nullopt;
        }
        ByteRange r{item[0].get<uint64_t>(), item[1].get<uint64_t>()};
        // A range past the recorded size means the sidecar is not ours to trust.
        if (r.end > state.size || r.start > r.end) return std::nullopt;
        state.ranges.add(r);
    }
    return state;
}

std::optional<ResumeState> ResumeState::load(const std::filesystem::path& sidecar) {
    std::error_code ec;
    if (!std::filesystem::exists(sidecar, ec)) return std::nullopt;
    std::ifstream ifs(sidecar, std::ios::binary);
    if (!ifs.is_open()) {
        spdlog::warn("ResumeState: cannot open sidecar path='{}'", sidecar.string());
        return std::nullopt;
    }
    std::ostringstream oss;
    oss << ifs.rdbuf();
    auto state = fromJson(oss.str());
    if (!state) {
        spdlog::warn("ResumeState: ignoring malformed sidecar path='{}'", sidecar.string());
    }
    return state;
}

bool ResumeState::save(const std::filesystem::path& sidecar, std::string& error) const {
    return writeFileDurably(sidecar, toJson(), error);
}

}  // namespace paca
