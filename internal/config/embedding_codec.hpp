#pragma once

#include <string>
#include <string_view>

#include "internal/model/embedding.hpp"

namespace atelier::config {

/*
  Text encodings accepted for an embedding held in an environment variable.

    base64:<payload>   RFC 4648 base64 of 768 IEEE-754 binary64 values,
                       little-endian, 6144 bytes once decoded
    anything else      comma-separated decimal list, 768 entries,
                       whitespace around entries and enclosing [ ] allowed

  Both reject non-finite values and wrong element counts.
*/

inline constexpr std::string_view kBase64Prefix = "base64:";

// Throws util::MalformedSource.
model::Embedding ParseEmbeddingText(std::string_view text);

std::string EncodeEmbeddingBase64(const model::Embedding& vector);
std::string EncodeEmbeddingCsv(const model::Embedding& vector);

} // namespace atelier::config
