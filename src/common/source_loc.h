#pragma once

#include <cstdint>

namespace sqlscan {

struct SourceLoc {
  uint32_t file_id = 0;
  uint32_t line = 0;
  uint32_t column = 0;

  bool IsValid() const { return file_id != 0 || line != 0; }
};

}  // namespace sqlscan
