#pragma once

#include <filesystem>
#include <optional>

#include "internal/model/embedding.hpp"

namespace atelier::storage {

/*
  Embedding array file.

  Container: Arrow IPC file format (random access, "Feather v2").
    schema   : one non-nullable field "embedding",
               type fixed_size_list<double>[768]
               metadata shape=768, dtype=float64
    contents : exactly one record batch holding exactly one non-null row

  The field type carries shape and dtype, so a reader validates both
  by comparing the schema with the expected one.
*/

inline constexpr const char* kEmbeddingFieldName = "embedding";

/*
  Read an embedding file.

  Returns nullopt when nothing exists at path.
  Throws util::MalformedSource when the file exists but cannot be read,
  its shape does not match or an element is NaN/inf.
*/
std::optional<model::Embedding> ReadEmbeddingFile(const std::filesystem::path& path);

/*
  Atomic write:
      create parent dirs -> write tmp -> rename over path

  Throws util::StorageError on a wrong length, a non-finite element or
  any I/O failure.
*/
void WriteEmbeddingFile(const std::filesystem::path& path, const model::Embedding& vector);

} // namespace atelier::storage
