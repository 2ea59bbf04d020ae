#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "helpdesk_core/types/store_record.hpp"

namespace helpdesk_core {

class HelpdeskError : public std::exception {
 public:
  explicit HelpdeskError(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

// Disk or permission failure inside the storage root.
class IOError : public HelpdeskError {
 public:
  using HelpdeskError::HelpdeskError;
};

class ConfigError : public HelpdeskError {
 public:
  using HelpdeskError::HelpdeskError;
};

class ChunkingError : public HelpdeskError {
 public:
  using HelpdeskError::HelpdeskError;
};

class SourceError : public HelpdeskError {
 public:
  using HelpdeskError::HelpdeskError;
};

class DimensionMismatch : public HelpdeskError {
 public:
  DimensionMismatch(const std::string &context, size_t expected, size_t actual)
      : HelpdeskError(context + ": vector dimension mismatch. Expected " +
                      std::to_string(expected) + ", got " + std::to_string(actual)),
        expected_(expected),
        actual_(actual) {}

  size_t expected() const {
    return expected_;
  }
  size_t actual() const {
    return actual_;
  }

 private:
  size_t expected_;
  size_t actual_;
};

/**
 * Raised when a persisted record cannot be decoded. The records decoded before the
 * offending line are kept for diagnostics and for `helpdesk_cli repair`; they are never
 * handed out as a successful load.
 */
class CorruptStoreError : public HelpdeskError {
 public:
  CorruptStoreError(const std::string &message,
                    size_t line_number,
                    std::vector<StoreRecord> partial_records = {})
      : HelpdeskError(message),
        line_number_(line_number),
        partial_records_(std::move(partial_records)) {}

  size_t line_number() const {
    return line_number_;
  }
  const std::vector<StoreRecord> &partial_records() const {
    return partial_records_;
  }

 private:
  size_t line_number_;
  std::vector<StoreRecord> partial_records_;
};

enum class ProviderErrorKind { Quota, Network, Auth, Timeout, InvalidResponse, Unknown };

inline std::string to_string(ProviderErrorKind kind) {
  switch (kind) {
    case ProviderErrorKind::Quota:
      return "quota";
    case ProviderErrorKind::Network:
      return "network";
    case ProviderErrorKind::Auth:
      return "auth";
    case ProviderErrorKind::Timeout:
      return "timeout";
    case ProviderErrorKind::InvalidResponse:
      return "invalid_response";
    default:
      return "unknown";
  }
}

class ProviderError : public HelpdeskError {
 public:
  ProviderError(ProviderErrorKind kind, const std::string &message)
      : HelpdeskError("(" + to_string(kind) + ") " + message), kind_(kind) {}

  ProviderErrorKind kind() const {
    return kind_;
  }

 private:
  ProviderErrorKind kind_;
};

class IngestError : public HelpdeskError {
 public:
  IngestError(const std::string &document_id, int batch_index, const std::string &reason)
      : HelpdeskError("Ingest of document '" + document_id + "' failed" +
                      (batch_index >= 0 ? " at batch " + std::to_string(batch_index) : "") +
                      ": " + reason),
        document_id_(document_id),
        batch_index_(batch_index) {}

  const std::string &document_id() const {
    return document_id_;
  }
  // -1 when the failure is not tied to an embedding batch
  int batch_index() const {
    return batch_index_;
  }

 private:
  std::string document_id_;
  int batch_index_;
};

class IngestCancelled : public HelpdeskError {
 public:
  explicit IngestCancelled(const std::string &document_id)
      : HelpdeskError("Ingest of document '" + document_id + "' was cancelled"),
        document_id_(document_id) {}

  const std::string &document_id() const {
    return document_id_;
  }

 private:
  std::string document_id_;
};

}  // namespace helpdesk_core
