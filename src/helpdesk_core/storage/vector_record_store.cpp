#include "helpdesk_core/storage/vector_record_store.hpp"

#include <algorithm>
#include <cmath>
#include <fstream>
#include <iostream>
#include <mutex>
#include <sstream>

namespace helpdesk_core {

namespace fs = std::filesystem;

namespace {

bool path_exists(const fs::path &path) {
  std::error_code ec;
  return fs::exists(path, ec);
}

fs::path temp_path_for(const fs::path &path) {
  fs::path tmp = path;
  tmp += ".tmp";
  return tmp;
}

void replace_file(const fs::path &tmp, const fs::path &target) {
  std::error_code ec;
  fs::rename(tmp, target, ec);
  if (ec) {
    std::error_code ignored;
    fs::remove(tmp, ignored);
    throw IOError("Failed to move " + tmp.string() + " over " + target.string() + ": " +
                  ec.message());
  }
}

}  // namespace

VectorRecordStore::VectorRecordStore(StoreContext context) : context_(std::move(context)) {
  std::unique_lock lock(mutex_);
  open_locked();
}

fs::path VectorRecordStore::records_path() const {
  return context_.root / kRecordsFile;
}

fs::path VectorRecordStore::manifest_path() const {
  return context_.root / kManifestFile;
}

void VectorRecordStore::open_locked() {
  std::error_code ec;
  fs::create_directories(context_.root, ec);
  if (ec) {
    throw IOError("Failed to create storage root " + context_.root.string() + ": " + ec.message());
  }

  reset_state_locked();

  bool have_manifest = false;
  if (path_exists(manifest_path())) {
    std::ifstream in(manifest_path());
    if (!in) {
      throw IOError("Failed to open " + manifest_path().string());
    }
    try {
      StoreManifest manifest = StoreManifest::from_json(nlohmann::json::parse(in));
      dimension_ = manifest.dimension;
      manifest_model_ = manifest.embedding_model;
      next_sequence_ = manifest.next_sequence;
      have_manifest = true;
    } catch (const nlohmann::json::exception &e) {
      corruption_ = "Unreadable manifest " + manifest_path().string() + ": " + e.what();
    } catch (const RecordFormatError &e) {
      corruption_ = "Invalid manifest " + manifest_path().string() + ": " + e.what();
    }
  }

  if (corruption_) {
    std::cerr << "[Store] " << *corruption_ << std::endl;
    return;
  }

  try {
    for (const auto &record : read_log_locked()) {
      track_locked(record);
    }
  } catch (const CorruptStoreError &e) {
    corruption_ = e.what();
    for (const auto &record : e.partial_records()) {
      track_locked(record);
    }
    std::cerr << "[Store] " << *corruption_ << std::endl;
    return;
  }

  bool manifest_dirty = !have_manifest;
  if (manifest_model_ != context_.embedding_model && !context_.embedding_model.empty()) {
    if (record_count_ == 0) {
      manifest_model_ = context_.embedding_model;
      manifest_dirty = true;
    } else {
      std::cerr << "[Store] Warning: store at " << context_.root.string()
                << " was built with embedding model '" << manifest_model_
                << "' but '" << context_.embedding_model << "' is configured" << std::endl;
    }
  }
  if (manifest_dirty) {
    write_manifest_locked(current_manifest_locked());
  }
}

StoreManifest VectorRecordStore::current_manifest_locked() const {
  return StoreManifest{dimension_, manifest_model_, next_sequence_};
}

std::vector<StoreRecord> VectorRecordStore::read_log_locked() const {
  std::vector<StoreRecord> records;
  if (!path_exists(records_path())) {
    return records;
  }

  std::ifstream in(records_path(), std::ios::binary);
  if (!in) {
    throw IOError("Failed to open " + records_path().string() + " for reading");
  }

  std::optional<size_t> expected_dimension = dimension_;
  std::string line;
  size_t line_number = 0;
  while (std::getline(in, line)) {
    ++line_number;
    const std::string where = records_path().string() + ":" + std::to_string(line_number);

    // getline only hits EOF here when the last line lacks its newline
    if (in.eof()) {
      throw CorruptStoreError("Torn final record at " + where, line_number, std::move(records));
    }

    StoreRecord record;
    try {
      record = decode_record_line(line);
    } catch (const RecordFormatError &e) {
      throw CorruptStoreError("Corrupt record at " + where + ": " + e.what(), line_number,
                              std::move(records));
    }

    if (!expected_dimension) {
      expected_dimension = record.vector.size();
    } else if (record.vector.size() != *expected_dimension) {
      throw CorruptStoreError("Corrupt record at " + where + ": vector has " +
                                  std::to_string(record.vector.size()) + " dimensions, expected " +
                                  std::to_string(*expected_dimension),
                              line_number, std::move(records));
    }
    if (!records.empty() && record.sequence <= records.back().sequence) {
      throw CorruptStoreError("Corrupt record at " + where + ": sequence " +
                                  std::to_string(record.sequence) + " is out of order",
                              line_number, std::move(records));
    }
    records.push_back(std::move(record));
  }

  if (in.bad()) {
    throw IOError("Failed while reading " + records_path().string());
  }
  return records;
}

void VectorRecordStore::reset_state_locked() {
  dimension_.reset();
  manifest_model_ = context_.embedding_model;
  next_sequence_ = 0;
  record_count_ = 0;
  documents_.clear();
  corruption_.reset();
}

void VectorRecordStore::forget_if_root_deleted_locked() {
  if (path_exists(records_path()) || path_exists(manifest_path())) {
    return;
  }
  if (record_count_ > 0 || dimension_ || corruption_) {
    std::cout << "[Store] Storage root " << context_.root.string()
              << " was removed, starting empty" << std::endl;
  }
  reset_state_locked();
}

void VectorRecordStore::ensure_writable_locked() const {
  if (corruption_) {
    throw CorruptStoreError("Refusing to write to a corrupt store: " + *corruption_, 0);
  }
}

void VectorRecordStore::validate_vectors(const std::vector<StoreRecord> &records,
                                         std::optional<size_t> established,
                                         const std::string &operation) {
  if (records.empty()) {
    return;
  }
  const size_t expected = established ? *established : records.front().vector.size();
  if (expected == 0) {
    throw HelpdeskError(operation + ": record " + records.front().chunk.chunk_id +
                        " has an empty vector");
  }
  for (const auto &record : records) {
    if (record.vector.size() != expected) {
      throw DimensionMismatch(operation + " of " + record.chunk.chunk_id, expected,
                              record.vector.size());
    }
    // JSON has no NaN or infinity; such a line could never be read back
    for (size_t i = 0; i < record.vector.size(); ++i) {
      if (!std::isfinite(record.vector[i])) {
        throw HelpdeskError(operation + ": record " + record.chunk.chunk_id +
                            " has a non-finite vector component at index " + std::to_string(i));
      }
    }
  }
}

void VectorRecordStore::write_manifest_locked(const StoreManifest &manifest) const {
  const fs::path tmp = temp_path_for(manifest_path());
  {
    std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
    if (!out) {
      throw IOError("Failed to open " + tmp.string() + " for writing");
    }
    out << manifest.to_json().dump(2) << "\n";
    out.flush();
    if (!out) {
      throw IOError("Failed to write " + tmp.string());
    }
  }
  replace_file(tmp, manifest_path());
}

void VectorRecordStore::track_locked(const StoreRecord &record) {
  auto &entry = documents_[record.chunk.document_id];
  entry.record_count++;
  entry.content_hash = record.document.content_hash;
  record_count_++;
  next_sequence_ = std::max(next_sequence_, record.sequence + 1);
}

std::vector<StoreRecord> VectorRecordStore::append(std::vector<StoreRecord> records) {
  std::unique_lock lock(mutex_);
  if (records.empty()) {
    return records;
  }

  forget_if_root_deleted_locked();
  ensure_writable_locked();
  validate_vectors(records, dimension_, "append");

  std::string buffer;
  uint64_t sequence = next_sequence_;
  for (auto &record : records) {
    record.sequence = sequence++;
    buffer += encode_record_line(record);
  }

  std::error_code ec;
  fs::create_directories(context_.root, ec);
  if (ec) {
    throw IOError("Failed to create storage root " + context_.root.string() + ": " + ec.message());
  }

  const fs::path path = records_path();
  const uintmax_t previous_size = path_exists(path) ? fs::file_size(path, ec) : 0;
  if (ec) {
    throw IOError("Failed to stat " + path.string() + ": " + ec.message());
  }

  bool written = false;
  {
    std::ofstream out(path, std::ios::binary | std::ios::app);
    if (out) {
      out.write(buffer.data(), static_cast<std::streamsize>(buffer.size()));
      out.flush();
      written = out.good();
    }
  }

  if (!written) {
    std::error_code ignored;
    fs::resize_file(path, previous_size, ignored);
    throw IOError("Failed to append " + std::to_string(records.size()) + " records to " +
                  path.string());
  }

  // The manifest carries the sequence high-water mark, so it moves with every append
  try {
    write_manifest_locked(StoreManifest{dimension_.value_or(records.front().vector.size()),
                                        manifest_model_, sequence});
  } catch (const IOError &) {
    std::error_code ignored;
    fs::resize_file(path, previous_size, ignored);
    throw;
  }
  if (!dimension_) {
    dimension_ = records.front().vector.size();
  }

  for (const auto &record : records) {
    track_locked(record);
  }
  return records;
}

std::vector<StoreRecord> VectorRecordStore::load_all() const {
  std::shared_lock lock(mutex_);
  std::vector<StoreRecord> records = read_log_locked();
  if (corruption_) {
    throw CorruptStoreError(*corruption_, 0, std::move(records));
  }
  return records;
}

size_t VectorRecordStore::rewrite_log_locked(const std::string *dropped_document_id,
                                             std::vector<StoreRecord> &additions) {
  const fs::path path = records_path();
  const fs::path tmp = temp_path_for(path);
  size_t removed = 0;

  std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
  if (!out) {
    throw IOError("Failed to open " + tmp.string() + " for writing");
  }

  if (dropped_document_id && path_exists(path)) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
      throw IOError("Failed to open " + path.string() + " for reading");
    }
    std::string line;
    size_t line_number = 0;
    while (std::getline(in, line)) {
      ++line_number;
      StoreRecord record;
      try {
        record = decode_record_line(line);
      } catch (const RecordFormatError &e) {
        out.close();
        std::error_code ignored;
        fs::remove(tmp, ignored);
        throw CorruptStoreError("Corrupt record at " + path.string() + ":" +
                                    std::to_string(line_number) + ": " + e.what(),
                                line_number);
      }
      if (record.chunk.document_id == *dropped_document_id) {
        removed++;
        continue;
      }
      out << line << '\n';
    }
  }

  for (const auto &record : additions) {
    out << encode_record_line(record);
  }
  out.flush();
  const bool written = out.good();
  out.close();
  if (!written || out.fail()) {
    std::error_code ignored;
    fs::remove(tmp, ignored);
    throw IOError("Failed to write " + tmp.string());
  }

  replace_file(tmp, path);
  return removed;
}

size_t VectorRecordStore::replace_document(const std::string &document_id) {
  std::vector<StoreRecord> none;
  return replace_document(document_id, std::move(none)).removed;
}

ReplaceResult VectorRecordStore::replace_document(const std::string &document_id,
                                                  std::vector<StoreRecord> records) {
  std::unique_lock lock(mutex_);
  forget_if_root_deleted_locked();
  ensure_writable_locked();
  validate_vectors(records, dimension_, "replace of document " + document_id);

  for (const auto &record : records) {
    if (record.chunk.document_id != document_id) {
      throw HelpdeskError("Record " + record.chunk.chunk_id + " does not belong to document " +
                          document_id);
    }
  }

  ReplaceResult result;
  if (documents_.find(document_id) == documents_.end() && records.empty()) {
    return result;
  }

  uint64_t sequence = next_sequence_;
  for (auto &record : records) {
    record.sequence = sequence++;
  }

  const StoreManifest previous = current_manifest_locked();
  StoreManifest updated = previous;
  updated.next_sequence = sequence;
  if (!updated.dimension && !records.empty()) {
    updated.dimension = records.front().vector.size();
  }
  const bool manifest_changes =
      updated.dimension != previous.dimension || updated.next_sequence != previous.next_sequence;
  if (manifest_changes) {
    write_manifest_locked(updated);
  }

  try {
    result.removed = rewrite_log_locked(&document_id, records);
  } catch (const HelpdeskError &) {
    if (manifest_changes) {
      write_manifest_locked(previous);
    }
    throw;
  }

  dimension_ = updated.dimension;
  documents_.erase(document_id);
  record_count_ -= result.removed;
  for (const auto &record : records) {
    track_locked(record);
  }
  result.committed = std::move(records);
  return result;
}

void VectorRecordStore::clear() {
  std::unique_lock lock(mutex_);
  std::error_code ec;
  fs::remove(records_path(), ec);
  if (ec) {
    throw IOError("Failed to remove " + records_path().string() + ": " + ec.message());
  }

  const std::string model =
      context_.embedding_model.empty() ? manifest_model_ : context_.embedding_model;
  reset_state_locked();
  manifest_model_ = model;

  fs::create_directories(context_.root, ec);
  if (ec) {
    throw IOError("Failed to create storage root " + context_.root.string() + ": " + ec.message());
  }
  write_manifest_locked(current_manifest_locked());
}

void VectorRecordStore::rebuild(std::vector<StoreRecord> records) {
  std::unique_lock lock(mutex_);

  // Only the new records have to agree with each other; the old dimension may be
  // what made the store corrupt.
  validate_vectors(records, std::nullopt, "rebuild");

  uint64_t sequence = 0;
  for (auto &record : records) {
    record.sequence = sequence++;
  }

  std::error_code ec;
  fs::create_directories(context_.root, ec);
  if (ec) {
    throw IOError("Failed to create storage root " + context_.root.string() + ": " + ec.message());
  }
  rewrite_log_locked(nullptr, records);

  const std::string model = manifest_model_.empty() ? context_.embedding_model : manifest_model_;
  reset_state_locked();
  manifest_model_ = model;
  if (!records.empty()) {
    dimension_ = records.front().vector.size();
  }
  for (const auto &record : records) {
    track_locked(record);
  }
  write_manifest_locked(current_manifest_locked());
}

size_t VectorRecordStore::record_count() const {
  std::shared_lock lock(mutex_);
  return record_count_;
}

std::optional<size_t> VectorRecordStore::dimension() const {
  std::shared_lock lock(mutex_);
  return dimension_;
}

std::vector<std::string> VectorRecordStore::document_ids() const {
  std::shared_lock lock(mutex_);
  std::vector<std::string> ids;
  ids.reserve(documents_.size());
  for (const auto &[id, entry] : documents_) {
    ids.push_back(id);
  }
  return ids;
}

std::optional<std::string> VectorRecordStore::document_content_hash(
    const std::string &document_id) const {
  std::shared_lock lock(mutex_);
  auto it = documents_.find(document_id);
  if (it == documents_.end()) {
    return std::nullopt;
  }
  return it->second.content_hash;
}

std::string VectorRecordStore::embedding_model() const {
  std::shared_lock lock(mutex_);
  return manifest_model_;
}

StoreStats VectorRecordStore::stats() const {
  std::shared_lock lock(mutex_);
  return StoreStats{.record_count = record_count_,
                    .document_count = documents_.size(),
                    .dimension = dimension_,
                    .embedding_model = manifest_model_};
}

bool VectorRecordStore::is_corrupt() const {
  std::shared_lock lock(mutex_);
  return corruption_.has_value();
}

std::string VectorRecordStore::corruption_message() const {
  std::shared_lock lock(mutex_);
  return corruption_.value_or("");
}

}  // namespace helpdesk_core
