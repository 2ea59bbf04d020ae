#pragma once

#include <gtest/gtest.h>

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "helpdesk_core/db/database_manager.hpp"
#include "helpdesk_core/db/task_queue_repo.hpp"
#include "helpdesk_core/types.hpp"

namespace helpdesk_tests {

/**
 * Utility class providing common functionality for all tests
 */
class TestUtilities {
 public:
  // A fresh, empty directory under the system temp dir
  static std::filesystem::path create_temp_dir(const std::string& prefix = "helpdesk_test");
  static void remove_temp_dir(const std::filesystem::path& dir);

  static void write_file(const std::filesystem::path& path, const std::string& contents);
  static std::string read_file(const std::filesystem::path& path);

  static helpdesk_core::DocumentMetadata create_test_metadata(
      const std::string& id,
      helpdesk_core::SourceKind kind = helpdesk_core::SourceKind::Web,
      const std::string& content_hash = "hash");

  static helpdesk_core::Document create_test_document(
      const std::string& id,
      const std::string& text,
      helpdesk_core::SourceKind kind = helpdesk_core::SourceKind::Web);

  // Record for chunk `index` (0-based) of document `document_id`
  static helpdesk_core::StoreRecord create_test_record(const std::string& document_id,
                                                       int index,
                                                       helpdesk_core::EmbeddingVector vector,
                                                       const std::string& content_hash = "hash");

  // Deterministic non-zero vector derived from the seed text
  static helpdesk_core::EmbeddingVector create_test_vector(const std::string& seed_text,
                                                           int dimension = 8);
};

/**
 * Fixture owning a temporary storage root, removed after each test
 */
class TempDirTestBase : public ::testing::Test {
 protected:
  void SetUp() override {
    temp_dir_ = TestUtilities::create_temp_dir();
  }

  void TearDown() override {
    TestUtilities::remove_temp_dir(temp_dir_);
  }

  std::filesystem::path temp_dir_;
};

/**
 * Fixture providing a TaskQueueRepo over a fresh SQLite database
 */
class TaskQueueTestBase : public TempDirTestBase {
 protected:
  void SetUp() override {
    TempDirTestBase::SetUp();
    db_manager_ = std::make_unique<helpdesk_core::DatabaseManager>(temp_dir_ / "tasks.db", 4);
    task_queue_repo_ = std::make_shared<helpdesk_core::TaskQueueRepo>(*db_manager_);
  }

  void TearDown() override {
    task_queue_repo_.reset();
    if (db_manager_) {
      db_manager_->shutdown();
      db_manager_.reset();
    }
    TempDirTestBase::TearDown();
  }

  std::unique_ptr<helpdesk_core::DatabaseManager> db_manager_;
  std::shared_ptr<helpdesk_core::TaskQueueRepo> task_queue_repo_;
};

}  // namespace helpdesk_tests
