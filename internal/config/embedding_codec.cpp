#include "embedding_codec.hpp"

#include <arrow/util/base64.h>

#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <iomanip>
#include <limits>
#include <sstream>

#include "internal/util/errors.hpp"

namespace atelier::config {

using model::Embedding;
using model::kEmbeddingDimension;

namespace {

constexpr std::size_t kBytesPerElement = sizeof(double);

std::string_view Trim(std::string_view s) {
  const auto first = s.find_first_not_of(" \t\r\n");
  if (first == std::string_view::npos) {
    return {};
  }
  const auto last = s.find_last_not_of(" \t\r\n");
  return s.substr(first, last - first + 1);
}

bool IsBase64Char(char c) {
  return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '+' || c == '/';
}

// arrow's decoder does not report bad input, so check the alphabet first
void ValidateBase64(std::string_view payload) {
  if (payload.empty() || payload.size() % 4 != 0) {
    throw util::MalformedSource("base64 payload length must be a non-zero multiple of 4");
  }

  std::size_t padding = 0;
  while (padding < 2 && payload[payload.size() - 1 - padding] == '=') {
    ++padding;
  }
  for (std::size_t i = 0; i < payload.size() - padding; ++i) {
    if (!IsBase64Char(payload[i])) {
      throw util::MalformedSource("invalid base64 character at offset " + std::to_string(i));
    }
  }
}

void CheckLength(std::size_t count) {
  if (count != kEmbeddingDimension) {
    throw util::MalformedSource("expected " + std::to_string(kEmbeddingDimension) + " elements, got " + std::to_string(count));
  }
}

void CheckFinite(double value, std::size_t index) {
  if (!std::isfinite(value)) {
    throw util::MalformedSource("element " + std::to_string(index) + " is not finite");
  }
}

Embedding ParseBase64(std::string_view payload) {
  payload = Trim(payload);
  ValidateBase64(payload);

  const std::string bytes = arrow::util::base64_decode(payload);
  if (bytes.size() % kBytesPerElement != 0) {
    throw util::MalformedSource("decoded size " + std::to_string(bytes.size()) + " is not a multiple of 8");
  }
  CheckLength(bytes.size() / kBytesPerElement);

  Embedding out(kEmbeddingDimension);
  for (std::size_t i = 0; i < kEmbeddingDimension; ++i) {
    std::uint64_t bits = 0;
    for (std::size_t b = 0; b < kBytesPerElement; ++b) {
      bits |= static_cast<std::uint64_t>(static_cast<unsigned char>(bytes[i * kBytesPerElement + b])) << (8 * b);
    }
    std::memcpy(&out[i], &bits, sizeof(bits));
    CheckFinite(out[i], i);
  }
  return out;
}

Embedding ParseCsv(std::string_view text) {
  text = Trim(text);
  if (text.size() >= 2 && text.front() == '[' && text.back() == ']') {
    text = Trim(text.substr(1, text.size() - 2));
  }
  if (text.empty()) {
    throw util::MalformedSource("empty value");
  }

  Embedding out;
  out.reserve(kEmbeddingDimension);

  std::size_t start = 0;
  while (start <= text.size()) {
    auto end = text.find(',', start);
    if (end == std::string_view::npos) {
      end = text.size();
    }

    const std::string element(Trim(text.substr(start, end - start)));
    char*             endptr = nullptr;
    const double      value  = std::strtod(element.c_str(), &endptr);
    if (element.empty() || endptr == nullptr || *endptr != '\0') {
      throw util::MalformedSource("element " + std::to_string(out.size()) + " is not a number: '" + element + "'");
    }
    CheckFinite(value, out.size());
    out.push_back(value);

    // bail out early on absurdly long inputs
    if (out.size() > kEmbeddingDimension) {
      break;
    }
    start = end + 1;
  }

  CheckLength(out.size());
  return out;
}

} // namespace

Embedding ParseEmbeddingText(std::string_view text) {
  if (text.substr(0, kBase64Prefix.size()) == kBase64Prefix) {
    return ParseBase64(text.substr(kBase64Prefix.size()));
  }
  return ParseCsv(text);
}

std::string EncodeEmbeddingBase64(const Embedding& vector) {
  std::string bytes;
  bytes.reserve(vector.size() * kBytesPerElement);
  for (double value : vector) {
    std::uint64_t bits = 0;
    std::memcpy(&bits, &value, sizeof(bits));
    for (std::size_t b = 0; b < kBytesPerElement; ++b) {
      bytes.push_back(static_cast<char>((bits >> (8 * b)) & 0xFF));
    }
  }
  return std::string(kBase64Prefix) + arrow::util::base64_encode(bytes);
}

std::string EncodeEmbeddingCsv(const Embedding& vector) {
  std::ostringstream out;
  out << std::setprecision(std::numeric_limits<double>::max_digits10);
  for (std::size_t i = 0; i < vector.size(); ++i) {
    if (i != 0) {
      out << ',';
    }
    out << vector[i];
  }
  return out.str();
}

} // namespace atelier::config
