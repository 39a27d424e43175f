#pragma once

#include "providers/context_provider.hpp"

#include <string>

namespace continuity {

struct DocumentProviderConfig {
  std::string name;
  std::string type;
  std::string id;
  std::string title;
  std::string path;
  double priority = 0.5;
};

// Serves one item from a file on disk, re-read on every call. A JSON file may
// override title, content and priority; any other file is used verbatim as
// the content. A missing or empty file contributes nothing.
class DocumentContextProvider : public IContextProvider {
 public:
  explicit DocumentContextProvider(DocumentProviderConfig cfg);

  std::string Name() const override;
  std::vector<ContextItem> Provide(const std::string& query, const ProviderOptions& options) override;

 private:
  DocumentProviderConfig cfg_;
};

DocumentProviderConfig VisionDocumentConfig(const std::string& path);
DocumentProviderConfig MetacognitiveDocumentConfig(const std::string& path);

}  // namespace continuity
