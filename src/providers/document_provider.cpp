#include "providers/document_provider.hpp"

#include "file_util.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <iostream>
#include <utility>

namespace continuity {

DocumentContextProvider::DocumentContextProvider(DocumentProviderConfig cfg) : cfg_(std::move(cfg)) {}

std::string DocumentContextProvider::Name() const {
  return cfg_.name;
}

std::vector<ContextItem> DocumentContextProvider::Provide(const std::string&, const ProviderOptions&) {
  if (cfg_.path.empty()) return {};
  std::string err;
  auto text = ReadFileToString(cfg_.path, &err);
  if (!text) {
    if (!err.empty()) std::cout << "[provider." << cfg_.name << "] warn read error=" << err << "\n";
    return {};
  }

  ContextItem item;
  item.type = cfg_.type;
  item.id = cfg_.id;
  item.title = cfg_.title;
  item.priority = cfg_.priority;

  if (std::filesystem::path(cfg_.path).extension() == ".json") {
    auto j = nlohmann::json::parse(*text, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
      std::cout << "[provider." << cfg_.name << "] warn invalid json file=" << cfg_.path << "\n";
      return {};
    }
    if (j.contains("title") && j["title"].is_string()) item.title = j["title"].get<std::string>();
    if (j.contains("priority") && j["priority"].is_number()) item.priority = j["priority"].get<double>();
    if (j.contains("content") && j["content"].is_string()) {
      item.content = j["content"].get<std::string>();
    } else if (j.contains("summary") && j["summary"].is_string()) {
      item.content = j["summary"].get<std::string>();
    }
    if (j.contains("principles") && j["principles"].is_array()) {
      for (const auto& p : j["principles"]) {
        if (p.is_string()) item.content += "\n\n- " + p.get<std::string>();
      }
    }
  } else {
    item.content = std::move(*text);
  }

  if (item.content.empty()) return {};
  return {item};
}

DocumentProviderConfig VisionDocumentConfig(const std::string& path) {
  DocumentProviderConfig cfg;
  cfg.name = "vision";
  cfg.type = "vision";
  cfg.id = "project_vision";
  cfg.title = "Project Vision";
  cfg.path = path;
  cfg.priority = 0.9;
  return cfg;
}

DocumentProviderConfig MetacognitiveDocumentConfig(const std::string& path) {
  DocumentProviderConfig cfg;
  cfg.name = "metacognitive";
  cfg.type = "metacognitive";
  cfg.id = "metacognitive_insights";
  cfg.title = "Meta-Cognitive Insights";
  cfg.path = path;
  cfg.priority = 0.85;
  return cfg;
}

}  // namespace continuity
