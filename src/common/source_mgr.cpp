#include "common/source_mgr.h"

#include <format>

namespace sqlscan {

uint32_t SourceManager::AddSource(std::string name, std::string content) {
  uint32_t id = static_cast<uint32_t>(sources_.size()) + 1;
  SourceEntry entry{std::move(name), std::move(content), {}};
  ComputeLineOffsets(entry);
  sources_.push_back(std::move(entry));
  return id;
}

std::string_view SourceManager::SourceName(uint32_t source_id) const {
  if (source_id == 0 || source_id > sources_.size()) {
    return "<unknown>";
  }
  return sources_[source_id - 1].name;
}

std::string_view SourceManager::SourceContent(uint32_t source_id) const {
  if (source_id == 0 || source_id > sources_.size()) {
    return "";
  }
  return sources_[source_id - 1].content;
}

std::string SourceManager::FormatLoc(SourceLoc loc) const {
  if (!loc.IsValid()) {
    return "<unknown location>";
  }
  return std::format("{}:{}:{}", SourceName(loc.file_id), loc.line,
                     loc.column);
}

std::string_view SourceManager::GetLineText(SourceLoc loc) const {
  if (loc.file_id == 0 || loc.file_id > sources_.size()) {
    return "";
  }
  const auto& entry = sources_[loc.file_id - 1];
  if (loc.line == 0 || loc.line > entry.line_offsets.size()) {
    return "";
  }
  uint32_t start = entry.line_offsets[loc.line - 1];
  uint32_t end = (loc.line < entry.line_offsets.size())
                     ? entry.line_offsets[loc.line]
                     : static_cast<uint32_t>(entry.content.size());
  while (end > start &&
         (entry.content[end - 1] == '\n' || entry.content[end - 1] == '\r')) {
    --end;
  }
  return std::string_view(entry.content).substr(start, end - start);
}

void SourceManager::ComputeLineOffsets(SourceEntry& entry) {
  entry.line_offsets.push_back(0);
  for (uint32_t i = 0; i < entry.content.size(); ++i) {
    if (entry.content[i] == '\n') {
      entry.line_offsets.push_back(i + 1);
    }
  }
}

}  // namespace sqlscan
