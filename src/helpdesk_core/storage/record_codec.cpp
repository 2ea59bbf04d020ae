#include "helpdesk_core/storage/record_codec.hpp"

#include <stdexcept>

namespace helpdesk_core {

namespace {

const nlohmann::json &require(const nlohmann::json &j, const char *key) {
  auto it = j.find(key);
  if (it == j.end()) {
    throw RecordFormatError(std::string("missing field '") + key + "'");
  }
  return *it;
}

std::string require_string(const nlohmann::json &j, const char *key) {
  const auto &value = require(j, key);
  if (!value.is_string()) {
    throw RecordFormatError(std::string("field '") + key + "' must be a string");
  }
  return value.get<std::string>();
}

uint64_t require_unsigned(const nlohmann::json &j, const char *key) {
  const auto &value = require(j, key);
  if (!value.is_number_unsigned()) {
    throw RecordFormatError(std::string("field '") + key + "' must be a non-negative integer");
  }
  return value.get<uint64_t>();
}

}  // namespace

nlohmann::json encode_record(const StoreRecord &record) {
  nlohmann::json vector = nlohmann::json::array();
  for (float v : record.vector) {
    vector.push_back(v);
  }

  return nlohmann::json{
      {"seq", record.sequence},
      {"chunk_id", record.chunk.chunk_id},
      {"document_id", record.chunk.document_id},
      {"chunk_index", record.chunk.chunk_index},
      {"start", record.chunk.start_offset},
      {"end", record.chunk.end_offset},
      {"overlap", record.chunk.overlap_with_previous},
      {"text", record.chunk.text},
      {"vector", vector},
      {"document",
       {{"id", record.document.id},
        {"source_kind", to_string(record.document.source_kind)},
        {"origin", record.document.origin},
        {"title", record.document.title},
        {"fetched_at", format_timestamp(record.document.fetched_at)},
        {"content_hash", record.document.content_hash}}}};
}

StoreRecord decode_record(const nlohmann::json &j) {
  if (!j.is_object()) {
    throw RecordFormatError("record is not a JSON object");
  }

  StoreRecord record;
  record.sequence = require_unsigned(j, "seq");
  record.chunk.chunk_id = require_string(j, "chunk_id");
  record.chunk.document_id = require_string(j, "document_id");
  record.chunk.chunk_index = static_cast<int>(require_unsigned(j, "chunk_index"));
  record.chunk.start_offset = require_unsigned(j, "start");
  record.chunk.end_offset = require_unsigned(j, "end");
  record.chunk.overlap_with_previous = require_unsigned(j, "overlap");
  record.chunk.text = require_string(j, "text");
  if (record.chunk.end_offset < record.chunk.start_offset) {
    throw RecordFormatError("chunk end offset precedes start offset");
  }

  const auto &vector = require(j, "vector");
  if (!vector.is_array() || vector.empty()) {
    throw RecordFormatError("field 'vector' must be a non-empty array");
  }
  record.vector.reserve(vector.size());
  for (const auto &v : vector) {
    if (!v.is_number()) {
      throw RecordFormatError("field 'vector' must contain only numbers");
    }
    record.vector.push_back(v.get<float>());
  }

  const auto &document = require(j, "document");
  if (!document.is_object()) {
    throw RecordFormatError("field 'document' must be an object");
  }
  record.document.id = require_string(document, "id");
  record.document.origin = require_string(document, "origin");
  record.document.title = require_string(document, "title");
  record.document.content_hash = require_string(document, "content_hash");
  try {
    record.document.source_kind = source_kind_from_string(require_string(document, "source_kind"));
    record.document.fetched_at = parse_timestamp(require_string(document, "fetched_at"));
  } catch (const std::invalid_argument &e) {
    throw RecordFormatError(e.what());
  }
  if (record.document.id != record.chunk.document_id) {
    throw RecordFormatError("document id '" + record.document.id +
                            "' does not match chunk document id '" + record.chunk.document_id +
                            "'");
  }
  return record;
}

std::string encode_record_line(const StoreRecord &record) {
  try {
    return encode_record(record).dump() + "\n";
  } catch (const nlohmann::json::exception &e) {
    throw RecordFormatError("Cannot encode record " + record.chunk.chunk_id + ": " + e.what());
  }
}

StoreRecord decode_record_line(const std::string &line) {
  nlohmann::json j;
  try {
    j = nlohmann::json::parse(line);
  } catch (const nlohmann::json::parse_error &e) {
    throw RecordFormatError(std::string("invalid JSON: ") + e.what());
  }
  return decode_record(j);
}

nlohmann::json StoreManifest::to_json() const {
  nlohmann::json j;
  j["format"] = kFormat;
  j["version"] = kVersion;
  j["dimension"] = dimension ? nlohmann::json(*dimension) : nlohmann::json(nullptr);
  j["embedding_model"] = embedding_model;
  j["next_sequence"] = next_sequence;
  return j;
}

StoreManifest StoreManifest::from_json(const nlohmann::json &j) {
  if (!j.is_object() || !j.contains("format") || j["format"] != kFormat) {
    throw RecordFormatError("not a helpdesk-records manifest");
  }
  const auto &version = require(j, "version");
  if (!version.is_number_integer() || version.get<int>() != kVersion) {
    throw RecordFormatError("unsupported manifest version " + version.dump());
  }

  StoreManifest manifest;
  const auto &dimension = require(j, "dimension");
  if (dimension.is_number_unsigned() && dimension.get<size_t>() > 0) {
    manifest.dimension = dimension.get<size_t>();
  } else if (!dimension.is_null()) {
    throw RecordFormatError("manifest dimension must be a positive integer or null");
  }
  if (j.contains("embedding_model") && j["embedding_model"].is_string()) {
    manifest.embedding_model = j["embedding_model"].get<std::string>();
  }
  // Absent in manifests written before the high-water mark was tracked
  if (j.contains("next_sequence")) {
    manifest.next_sequence = require_unsigned(j, "next_sequence");
  }
  return manifest;
}

}  // namespace helpdesk_core
