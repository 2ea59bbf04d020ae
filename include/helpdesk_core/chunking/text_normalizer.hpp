#pragma once

#include <string>

namespace helpdesk_core {

// Replaces invalid UTF-8 sequences with U+FFFD, collapses every whitespace run to a
// single space and trims both ends. The chunker expects text in this form.
std::string normalize_text(const std::string& raw_text);

// Replaces invalid UTF-8 sequences with U+FFFD and leaves everything else alone.
std::string repair_utf8(const std::string& raw);

// Lowercase hex SHA-256 of the given bytes.
std::string compute_content_hash(const std::string& content);

}  // namespace helpdesk_core
