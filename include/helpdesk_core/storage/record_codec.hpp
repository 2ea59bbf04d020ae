#pragma once

#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

#include "helpdesk_core/errors.hpp"
#include "helpdesk_core/types/store_record.hpp"

namespace helpdesk_core {

// A single log line that cannot be turned back into a StoreRecord.
class RecordFormatError : public HelpdeskError {
 public:
  using HelpdeskError::HelpdeskError;
};

nlohmann::json encode_record(const StoreRecord &record);

// Throws RecordFormatError on missing fields, wrong types or an empty vector.
StoreRecord decode_record(const nlohmann::json &j);

// One newline-terminated line of the records log.
std::string encode_record_line(const StoreRecord &record);
StoreRecord decode_record_line(const std::string &line);

struct StoreManifest {
  static constexpr const char *kFormat = "helpdesk-records";
  static constexpr int kVersion = 1;

  std::optional<size_t> dimension;
  std::string embedding_model;
  // Sequence number the next appended record receives
  uint64_t next_sequence = 0;

  nlohmann::json to_json() const;
  // Throws RecordFormatError when the manifest is not a helpdesk-records manifest.
  static StoreManifest from_json(const nlohmann::json &j);
};

}  // namespace helpdesk_core
