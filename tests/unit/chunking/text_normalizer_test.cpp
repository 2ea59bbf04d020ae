#include <gtest/gtest.h>

#include "helpdesk_core/chunking/text_normalizer.hpp"

namespace helpdesk_tests {

using namespace helpdesk_core;

TEST(TextNormalizerTest, CollapsesWhitespaceAndTrims) {
  EXPECT_EQ(normalize_text("  How   do I\n\n reset\tmy password?  \r\n"),
            "How do I reset my password?");
  EXPECT_EQ(normalize_text(" \n\t "), "");
  EXPECT_EQ(normalize_text(""), "");
}

TEST(TextNormalizerTest, ReplacesInvalidUtf8) {
  const std::string normalized = normalize_text("ok\xFF" "done");
  EXPECT_EQ(normalized, "ok\xEF\xBF\xBD" "done");
}

TEST(TextNormalizerTest, RepairUtf8KeepsWhitespace) {
  EXPECT_EQ(repair_utf8("Caf\xE9  Guide\n"), "Caf\xEF\xBF\xBD  Guide\n");
  EXPECT_EQ(repair_utf8("caf\xC3\xA9"), "caf\xC3\xA9");
}

TEST(TextNormalizerTest, KeepsMultibyteCharacters) {
  EXPECT_EQ(normalize_text("caf\xC3\xA9  ouvert"), "caf\xC3\xA9 ouvert");
}

TEST(TextNormalizerTest, ContentHashIsSha256Hex) {
  EXPECT_EQ(compute_content_hash(""),
            "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
  EXPECT_EQ(compute_content_hash("abc"),
            "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
  EXPECT_NE(compute_content_hash("a"), compute_content_hash("b"));
}

}  // namespace helpdesk_tests
