#pragma once

#include <optional>
#include <string>

#include "download/download_error.h"

namespace paca {

// Parsed `owner/name[:quant]` reference. Immutable once parsed.
class ModelReference {
public:
    ModelReference(std::string owner, std::string name, std::optional<std::string> quant_tag);

    const std::string& owner() const { return owner_; }
    const std::string& name() const { return name_; }
    const std::optional<std::string>& quantTag() const { return quant_tag_; }

    // "owner/name"
    std::string repo() const;

    // Canonical text form, round-trips through parseModelReference().
    std::string toString() const;

    // Copy with the quant tag replaced (used when the registry default is selected).
    ModelReference withQuantTag(std::string quant_tag) const;

    bool operator==(const ModelReference& other) const {
        return owner_ == other.owner_ && name_ == other.name_ && quant_tag_ == other.quant_tag_;
    }
    bool operator!=(const ModelReference& other) const { return !(*this == other); }

private:
    std::string owner_;
    std::string name_;
    std::optional<std::string> quant_tag_;
};

// Parse `owner/name[:quant]`. On failure returns std::nullopt and sets error to kInvalidReference.
std::optional<ModelReference> parseModelReference(const std::string& text, DownloadError& error);

}  // namespace paca
