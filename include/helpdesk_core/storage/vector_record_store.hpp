#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

#include "helpdesk_core/errors.hpp"
#include "helpdesk_core/storage/record_codec.hpp"
#include "helpdesk_core/types/store_record.hpp"

namespace helpdesk_core {

// Everything the store needs to know about where it lives.
struct StoreContext {
  std::filesystem::path root;
  // Recorded in the manifest of a fresh store; compared on open.
  std::string embedding_model;
};

struct ReplaceResult {
  // Records of the previous version that were dropped
  size_t removed = 0;
  // The replacements as written, with their sequence numbers
  std::vector<StoreRecord> committed;
};

struct StoreStats {
  size_t record_count = 0;
  size_t document_count = 0;
  std::optional<size_t> dimension;
  std::string embedding_model;
};

/**
 * @class VectorRecordStore
 * @brief Durable, append-only log of embedded chunks under one storage root.
 *
 * Layout of the root directory:
 *   records.jsonl  one JSON record per line, in insertion order
 *   manifest.json  format tag, version, dimension and embedding model
 *
 * Sequence numbers only grow. The manifest keeps the next one to hand out, so
 * numbers freed by a replace are not reused after a reopen; only clear() and
 * rebuild() start again from 0.
 *
 * Every mutation is all-or-nothing. Vectors must be finite. Appends are a single buffered write that is
 * truncated back on failure; whole-log rewrites go through a temporary file that is
 * renamed over the log. A store whose log fails validation when opened refuses
 * further appends until it is cleared or rebuilt.
 *
 * Thread safety: mutations take an exclusive lock, reads take a shared lock.
 */
class VectorRecordStore {
 public:
  static constexpr const char *kRecordsFile = "records.jsonl";
  static constexpr const char *kManifestFile = "manifest.json";

  // Creates the root if needed and validates any existing log. Throws IOError when the
  // root cannot be created or read; a corrupt log only marks the store as corrupt.
  explicit VectorRecordStore(StoreContext context);

  VectorRecordStore(const VectorRecordStore &) = delete;
  VectorRecordStore &operator=(const VectorRecordStore &) = delete;

  // Assigns sequence numbers and persists the batch. Returns the committed records.
  std::vector<StoreRecord> append(std::vector<StoreRecord> records);

  // All records in insertion order. Throws CorruptStoreError on the first bad line.
  std::vector<StoreRecord> load_all() const;

  // Removes every record of the document. Returns how many were removed.
  size_t replace_document(const std::string &document_id);
  // Removes the document's records and appends the replacements in one atomic swap.
  ReplaceResult replace_document(const std::string &document_id, std::vector<StoreRecord> records);

  void clear();

  // Rewrites the log from the given records, renumbering sequences from 0.
  void rebuild(std::vector<StoreRecord> records);

  size_t record_count() const;
  std::optional<size_t> dimension() const;
  std::vector<std::string> document_ids() const;
  std::optional<std::string> document_content_hash(const std::string &document_id) const;
  std::string embedding_model() const;
  StoreStats stats() const;

  bool is_corrupt() const;
  // Empty unless is_corrupt()
  std::string corruption_message() const;

  const std::filesystem::path &root() const {
    return context_.root;
  }

 private:
  struct DocumentEntry {
    size_t record_count = 0;
    std::string content_hash;
  };

  std::filesystem::path records_path() const;
  std::filesystem::path manifest_path() const;

  void open_locked();
  std::vector<StoreRecord> read_log_locked() const;
  void reset_state_locked();
  void forget_if_root_deleted_locked();
  void ensure_writable_locked() const;
  // Throws DimensionMismatch, or HelpdeskError for an empty or non-finite vector.
  static void validate_vectors(const std::vector<StoreRecord> &records,
                               std::optional<size_t> established,
                               const std::string &operation);
  StoreManifest current_manifest_locked() const;
  void write_manifest_locked(const StoreManifest &manifest) const;
  // Streams the surviving records plus the additions into a temp file and renames it.
  size_t rewrite_log_locked(const std::string *dropped_document_id,
                            std::vector<StoreRecord> &additions);
  void track_locked(const StoreRecord &record);

  StoreContext context_;
  mutable std::shared_mutex mutex_;

  std::optional<size_t> dimension_;
  std::string manifest_model_;
  uint64_t next_sequence_ = 0;
  size_t record_count_ = 0;
  std::map<std::string, DocumentEntry> documents_;
  std::optional<std::string> corruption_;
};

}  // namespace helpdesk_core
