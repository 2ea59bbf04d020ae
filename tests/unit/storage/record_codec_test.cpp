#include <gtest/gtest.h>

#include "helpdesk_core/storage/record_codec.hpp"
#include "utilities_test.hpp"

namespace helpdesk_tests {

using namespace helpdesk_core;

class RecordCodecTest : public ::testing::Test {
 protected:
  void SetUp() override {
    record_ = TestUtilities::create_test_record("reset-password", 2, {0.5f, -0.25f, 1.0f});
    record_.sequence = 41;
    record_.chunk.overlap_with_previous = 3;
  }

  StoreRecord record_;
};

TEST_F(RecordCodecTest, LineRoundTripsEveryField) {
  const std::string line = encode_record_line(record_);
  ASSERT_FALSE(line.empty());
  EXPECT_EQ(line.back(), '\n');
  EXPECT_EQ(line.find('\n'), line.size() - 1);

  StoreRecord decoded = decode_record_line(line);
  EXPECT_EQ(decoded, record_);
}

TEST_F(RecordCodecTest, RejectsMissingField) {
  nlohmann::json j = encode_record(record_);
  j.erase("chunk_id");
  EXPECT_THROW(decode_record(j), RecordFormatError);
}

TEST_F(RecordCodecTest, RejectsWrongTypes) {
  nlohmann::json j = encode_record(record_);
  j["seq"] = "41";
  EXPECT_THROW(decode_record(j), RecordFormatError);

  j = encode_record(record_);
  j["vector"] = nlohmann::json::array({1.0, "x"});
  EXPECT_THROW(decode_record(j), RecordFormatError);

  j = encode_record(record_);
  j["document"]["source_kind"] = "confluence";
  EXPECT_THROW(decode_record(j), RecordFormatError);
}

TEST_F(RecordCodecTest, RejectsEmptyVector) {
  nlohmann::json j = encode_record(record_);
  j["vector"] = nlohmann::json::array();
  EXPECT_THROW(decode_record(j), RecordFormatError);
}

TEST_F(RecordCodecTest, RejectsDocumentIdDisagreement) {
  nlohmann::json j = encode_record(record_);
  j["document"]["id"] = "someone-else";
  EXPECT_THROW(decode_record(j), RecordFormatError);
}

TEST_F(RecordCodecTest, RejectsTruncatedLine) {
  std::string line = encode_record_line(record_);
  line.resize(line.size() / 2);
  EXPECT_THROW(decode_record_line(line), RecordFormatError);
}

TEST(StoreManifestTest, RoundTripsDimensionAndModel) {
  StoreManifest manifest;
  manifest.dimension = 1024;
  manifest.embedding_model = "mxbai-embed-large";
  manifest.next_sequence = 42;

  StoreManifest parsed = StoreManifest::from_json(manifest.to_json());
  ASSERT_TRUE(parsed.dimension.has_value());
  EXPECT_EQ(*parsed.dimension, 1024u);
  EXPECT_EQ(parsed.embedding_model, "mxbai-embed-large");
  EXPECT_EQ(parsed.next_sequence, 42u);
}

TEST(StoreManifestTest, MissingNextSequenceStartsAtZero) {
  StoreManifest parsed = StoreManifest::from_json(
      {{"format", StoreManifest::kFormat}, {"version", 1}, {"dimension", 3}});
  EXPECT_EQ(parsed.next_sequence, 0u);
  EXPECT_THROW(StoreManifest::from_json({{"format", StoreManifest::kFormat},
                                         {"version", 1},
                                         {"dimension", 3},
                                         {"next_sequence", -1}}),
               RecordFormatError);
}

TEST(StoreManifestTest, NullDimensionMeansUnset) {
  StoreManifest manifest;
  EXPECT_TRUE(manifest.to_json()["dimension"].is_null());
  EXPECT_FALSE(StoreManifest::from_json(manifest.to_json()).dimension.has_value());
}

TEST(StoreManifestTest, RejectsForeignOrInvalidManifests) {
  EXPECT_THROW(StoreManifest::from_json(nlohmann::json::array()), RecordFormatError);
  EXPECT_THROW(StoreManifest::from_json({{"format", "other"}, {"version", 1}}), RecordFormatError);
  EXPECT_THROW(StoreManifest::from_json(
                   {{"format", StoreManifest::kFormat}, {"version", 99}, {"dimension", 3}}),
               RecordFormatError);
  EXPECT_THROW(StoreManifest::from_json(
                   {{"format", StoreManifest::kFormat}, {"version", 1}, {"dimension", 0}}),
               RecordFormatError);
}

}  // namespace helpdesk_tests
