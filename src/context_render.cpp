#include "context_render.hpp"

#include <cctype>
#include <cmath>
#include <iostream>

namespace continuity {
namespace {

static std::vector<const ContextItem*> ValidItems(const std::vector<ContextItem>& items, const RenderSettings& settings) {
  std::vector<const ContextItem*> out;
  out.reserve(items.size());
  for (const auto& item : items) {
    std::string reason;
    if (settings.validation_enabled && !ValidateContextItem(item, &reason)) {
      std::cout << "[context-render] warn skipping invalid item id=" << (item.id.empty() ? "unknown" : item.id)
                << " reason=" << reason << "\n";
      continue;
    }
    out.push_back(&item);
  }
  return out;
}

static std::string ToUpperAscii(std::string s) {
  for (auto& c : s) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
  return s;
}

}  // namespace

const char* ToString(RenderFormat format) {
  switch (format) {
    case RenderFormat::kMarkdown:
      return "markdown";
    case RenderFormat::kPlain:
      return "plain";
    case RenderFormat::kJson:
      return "json";
  }
  return "markdown";
}

RenderFormat RenderFormatFromString(const std::string& name, bool* known) {
  if (known) *known = true;
  if (name == "markdown" || name.empty()) return RenderFormat::kMarkdown;
  if (name == "plain") return RenderFormat::kPlain;
  if (name == "json") return RenderFormat::kJson;
  if (known) *known = false;
  return RenderFormat::kMarkdown;
}

bool ValidateContextItem(const ContextItem& item, std::string* reason) {
  auto fail = [&](const char* why) {
    if (reason) *reason = why;
    return false;
  };
  if (item.type.empty()) return fail("missing type");
  if (item.id.empty()) return fail("missing id");
  if (item.title.empty()) return fail("missing title");
  if (item.content.empty()) return fail("missing content");
  if (item.priority.has_value()) {
    const double p = *item.priority;
    if (std::isnan(p) || p < 0.0 || p > 1.0) return fail("priority out of range");
  }
  return true;
}

std::string CompressContent(const std::string& content, size_t max_section_length, const RenderSettings& settings) {
  if (!settings.compression_enabled || content.empty()) return content;
  if (content.size() < settings.compression_threshold) return content;

  std::string out;
  out.reserve(content.size());
  bool in_space = false;
  for (char c : content) {
    if (std::isspace(static_cast<unsigned char>(c))) {
      if (!in_space) out.push_back(' ');
      in_space = true;
    } else {
      out.push_back(c);
      in_space = false;
    }
  }

  if (out.size() > max_section_length) {
    size_t cut = max_section_length;
    while (cut > 0 && (static_cast<unsigned char>(out[cut]) & 0xC0) == 0x80) cut--;
    out.resize(cut);
    out += kTruncationMarker;
  }
  return out;
}

std::string RenderContext(const std::vector<ContextItem>& items,
                          RenderFormat format,
                          const RenderSettings& settings,
                          const nlohmann::json& envelope) {
  const auto valid = ValidItems(items, settings);
  if (valid.empty()) return "";

  switch (format) {
    case RenderFormat::kPlain: {
      std::string text = "CONTINUITY CONTEXT AWARENESS\n\n";
      for (const auto* item : valid) {
        text += ToUpperAscii(item->title) + "\n";
        text += std::string(item->title.size(), '-') + "\n";
        text += CompressContent(item->content, kPlainSectionLength, settings) + "\n\n";
      }
      return text;
    }
    case RenderFormat::kJson: {
      nlohmann::json j = envelope.is_object() ? envelope : nlohmann::json::object();
      j["contextItems"] = nlohmann::json::array();
      for (const auto* item : valid) {
        auto ij = ToJson(*item);
        ij["content"] = CompressContent(item->content, kJsonSectionLength, settings);
        j["contextItems"].push_back(std::move(ij));
      }
      return j.dump(2, ' ', false, nlohmann::json::error_handler_t::replace);
    }
    case RenderFormat::kMarkdown:
      break;
  }

  std::string md = "## Continuity Context Awareness\n\n";
  for (const auto* item : valid) {
    md += "### " + item->title + "\n\n";
    md += CompressContent(item->content, kMarkdownSectionLength, settings) + "\n\n";
  }
  return md;
}

}  // namespace continuity
