#pragma once
#include <optional>
#include <string>
#include <vector>

#include "ExportTypes.hpp"

namespace skya {

// Durable audit trail of completed exports.
class ExportRecordStore {
public:
  virtual ~ExportRecordStore() = default;

  // Validates, then inserts. Throws on validation or storage failure.
  virtual void createExportRecord(const ExportRecord& r) = 0;
  virtual std::optional<ExportRecord> getExportById(const std::string& id) = 0;
  // Newest first.
  virtual std::vector<ExportRecord> listExportsByDid(const std::string& did,
                                                     int limit,
                                                     int offset) = 0;
  virtual int64_t countExportsByDid(const std::string& did) = 0;
  // Returns false when no record had that id.
  virtual bool deleteExportRecord(const std::string& id) = 0;
};

} // namespace skya
