#pragma once

#include "providers/context_provider.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace continuity {

enum class RenderFormat { kMarkdown, kPlain, kJson };

const char* ToString(RenderFormat format);
// Unknown names fall back to markdown with *known = false.
RenderFormat RenderFormatFromString(const std::string& name, bool* known = nullptr);

struct RenderSettings {
  bool validation_enabled = true;
  bool compression_enabled = true;
  size_t compression_threshold = 1000;
};

constexpr size_t kMarkdownSectionLength = 1000;
constexpr size_t kPlainSectionLength = 500;
constexpr size_t kJsonSectionLength = 800;
constexpr const char* kTruncationMarker = "... [content truncated]";

// type, id, title and content must be non-empty; priority, when present, must
// lie within [0, 1].
bool ValidateContextItem(const ContextItem& item, std::string* reason = nullptr);

// Content shorter than the threshold is returned as is. Otherwise whitespace
// runs collapse to one space and the result is cut at max_section_length
// (on a UTF-8 boundary) with the truncation marker appended.
std::string CompressContent(const std::string& content, size_t max_section_length, const RenderSettings& settings);

// Empty string when no item survives validation. For JSON the envelope's
// fields are emitted alongside "contextItems".
std::string RenderContext(const std::vector<ContextItem>& items,
                          RenderFormat format,
                          const RenderSettings& settings,
                          const nlohmann::json& envelope = nlohmann::json::object());

}  // namespace continuity
