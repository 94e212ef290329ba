#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "common/source_loc.h"

namespace sqlscan {

// Owns the text of every statement handed to the scanner so diagnostics can
// quote the offending line. Ids start at 1; 0 means "no source".
class SourceManager {
 public:
  uint32_t AddSource(std::string name, std::string content);

  std::string_view SourceName(uint32_t source_id) const;
  std::string_view SourceContent(uint32_t source_id) const;

  std::string FormatLoc(SourceLoc loc) const;
  std::string_view GetLineText(SourceLoc loc) const;

 private:
  struct SourceEntry {
    std::string name;
    std::string content;
    std::vector<uint32_t> line_offsets;
  };

  void ComputeLineOffsets(SourceEntry& entry);

  std::vector<SourceEntry> sources_;
};

}  // namespace sqlscan
