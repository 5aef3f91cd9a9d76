#include "download/model_reference.h"

#include <algorithm>
#include <cctype>

namespace paca {

namespace {

bool is_allowed_char(unsigned char c) {
    return std::isalnum(c) || c == '-' || c == '_' || c == '.';
}

bool is_valid_segment(const std::string& segment) {
    if (segment.empty()) return false;
    if (segment == "." || segment == "..") return false;
    return std::all_of(segment.begin(), segment.end(),
                       [](unsigned char c) { return is_allowed_char(c); });
}

DownloadError invalid(const std::string& text, const std::string& reason) {
    return make_error(DownloadErrorCode::kInvalidReference,
                      "'" + text + "': " + reason + " (expected format: owner/name[:quant])");
}

}  // namespace

ModelReference::ModelReference(std::string owner, std::string name, std::optional<std::string> quant_tag)
    : owner_(std::move(owner)), name_(std::move(name)), quant_tag_(std::move(quant_tag)) {}

std::string ModelReference::repo() const {
    return owner_ + "/" + name_;
}

std::string ModelReference::toString() const {
    if (!quant_tag_) return repo();
    return repo() + ":" + *quant_tag_;
}

ModelReference ModelReference::withQuantTag(std::string quant_tag) const {
    return ModelReference(owner_, name_, std::move(quant_tag));
}

std::optional<ModelReference> parseModelReference(const std::string& text, DownloadError& error) {
    error = {};
    if (text.empty()) {
        error = invalid(text, "empty reference");
        return std::nullopt;
    }
    if (std::count(text.begin(), text.end(), ':') > 1) {
        error = invalid(text, "more than one ':' separator");
        return std::nullopt;
    }

    std::string repo = text;
    std::optional<std::string> tag;
    const auto colon = text.find(':');
    if (colon != std::string::npos) {
        repo = text.substr(0, colon);
        tag = text.substr(colon + 1);
        if (tag->empty()) {
            error = invalid(text, "empty quant tag");
            return std::nullopt;
        }
    }

    if (std::count(repo.begin(), repo.end(), '/') != 1) {
        error = invalid(text, "repository must be exactly owner/name");
        return std::nullopt;
    }
    const auto slash = repo.find('/');
    std::string owner = repo.substr(0, slash);
    std::string name = repo.substr(slash + 1);

    if (owner.empty()) {
        error = invalid(text, "missing owner");
        return std::nullopt;
    }
    if (name.empty()) {
        error = invalid(text, "missing model name");
        return std::nullopt;
    }
    if (!is_valid_segment(owner) || !is_valid_segment(name)) {
        error = invalid(text, "owner and name may only contain letters, digits, '-', '_' and '.'");
        return std::nullopt;
    }
    if (tag && !is_valid_segment(*tag)) {
        error = invalid(text, "quant tag contains disallowed characters");
        return std::nullopt;
    }

    return ModelReference(std::move(owner), std::move(name), std::move(tag));
}

}  // namespace paca
