#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "helpdesk_core/sources/document_source.hpp"

namespace helpdesk_core {

struct NotionSourceConfig {
  std::filesystem::path path;
  // Document id override; the file stem when empty.
  std::string id;

  // Throws ConfigError
  void validate() const;
};

// Reads one Markdown or text export as a single document. The title is the first
// Markdown heading, or the file stem when there is none.
class NotionExportReader : public DocumentSource {
 public:
  explicit NotionExportReader(NotionSourceConfig config);

  // Throws SourceError when the export is missing or unreadable.
  std::vector<Document> fetch() override;
  std::string describe() const override;

 private:
  NotionSourceConfig config_;
};

}  // namespace helpdesk_core
