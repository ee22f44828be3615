#include "embedding_file.hpp"

#include <arrow/array.h>
#include <arrow/builder.h>
#include <arrow/io/file.h>
#include <arrow/ipc/reader.h>
#include <arrow/ipc/writer.h>
#include <arrow/record_batch.h>
#include <arrow/type.h>
#include <arrow/util/key_value_metadata.h>

#include <cmath>
#include <string>
#include <system_error>

#include "internal/storage/common/arrow_utils.hpp"
#include "internal/util/errors.hpp"

namespace atelier::storage {

using namespace atelier::storage::common;
using model::kEmbeddingDimension;

namespace {

std::shared_ptr<arrow::DataType> EmbeddingType() {
  return arrow::fixed_size_list(arrow::float64(), static_cast<int32_t>(kEmbeddingDimension));
}

std::shared_ptr<arrow::Schema> EmbeddingSchema() {
  auto metadata = arrow::key_value_metadata({"shape", "dtype"}, {std::to_string(kEmbeddingDimension), "float64"});
  return arrow::schema({arrow::field(kEmbeddingFieldName, EmbeddingType(), /*nullable=*/false)}, std::move(metadata));
}

model::Embedding Decode(const std::filesystem::path& path) {
  auto file   = Unwrap(arrow::io::ReadableFile::Open(path.string()));
  auto reader = Unwrap(arrow::ipc::RecordBatchFileReader::Open(file));

  auto schema = reader->schema();
  if (schema->num_fields() != 1 || !schema->field(0)->type()->Equals(*EmbeddingType())) {
    throw util::MalformedSource("unexpected schema " + schema->ToString() + ", want " + EmbeddingSchema()->ToString());
  }
  if (reader->num_record_batches() != 1) {
    throw util::MalformedSource("expected 1 record batch, found " + std::to_string(reader->num_record_batches()));
  }

  auto batch = Unwrap(reader->ReadRecordBatch(0));
  if (batch->num_rows() != 1) {
    throw util::MalformedSource("expected 1 row, found " + std::to_string(batch->num_rows()));
  }

  auto list = std::static_pointer_cast<arrow::FixedSizeListArray>(batch->column(0));
  if (list->IsNull(0)) {
    throw util::MalformedSource("embedding row is null");
  }

  auto          values = std::static_pointer_cast<arrow::DoubleArray>(list->values());
  const int64_t offset = list->value_offset(0);

  model::Embedding out;
  out.reserve(kEmbeddingDimension);
  for (int64_t i = offset; i < offset + static_cast<int64_t>(kEmbeddingDimension); ++i) {
    if (values->IsNull(i)) {
      throw util::MalformedSource("embedding element " + std::to_string(i - offset) + " is null");
    }
    if (!std::isfinite(values->Value(i))) {
      throw util::MalformedSource("embedding element " + std::to_string(i - offset) + " is not finite");
    }
    out.push_back(values->Value(i));
  }
  return out;
}

} // namespace

std::optional<model::Embedding> ReadEmbeddingFile(const std::filesystem::path& path) {
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    return std::nullopt;
  }

  try {
    return Decode(path);
  } catch (const util::MalformedSource&) {
    throw;
  } catch (const std::exception& e) {
    throw util::MalformedSource(path.string() + ": " + e.what());
  }
}

void WriteEmbeddingFile(const std::filesystem::path& path, const model::Embedding& vector) {
  if (vector.size() != kEmbeddingDimension) {
    throw util::StorageError("embedding must have " + std::to_string(kEmbeddingDimension) + " elements, got " +
                             std::to_string(vector.size()));
  }
  for (std::size_t i = 0; i < vector.size(); ++i) {
    if (!std::isfinite(vector[i])) {
      throw util::StorageError("embedding element " + std::to_string(i) + " is not finite");
    }
  }

  std::error_code ec;
  if (path.has_parent_path()) {
    std::filesystem::create_directories(path.parent_path(), ec);
    if (ec) {
      throw util::StorageError("cannot create directory " + path.parent_path().string() + ": " + ec.message());
    }
  }

  const auto tmp_path = path.string() + ".tmp";

  try {
    arrow::DoubleBuilder builder;
    Unwrap(builder.AppendValues(vector));
    auto values = Unwrap(builder.Finish());
    auto list   = Unwrap(arrow::FixedSizeListArray::FromArrays(values, static_cast<int32_t>(kEmbeddingDimension)));

    auto schema = EmbeddingSchema();
    auto batch  = arrow::RecordBatch::Make(schema, 1, {list});

    auto out    = Unwrap(arrow::io::FileOutputStream::Open(tmp_path));
    auto writer = Unwrap(arrow::ipc::MakeFileWriter(out, schema));
    Unwrap(writer->WriteRecordBatch(*batch));
    Unwrap(writer->Close());
    Unwrap(out->Close());
  } catch (const std::exception& e) {
    std::filesystem::remove(tmp_path, ec);
    throw util::StorageError("cannot write " + tmp_path + ": " + e.what());
  }

  std::filesystem::rename(tmp_path, path, ec);
  if (ec) {
    std::error_code ignored;
    std::filesystem::remove(tmp_path, ignored);
    throw util::StorageError("cannot move " + tmp_path + " to " + path.string() + ": " + ec.message());
  }
}

} // namespace atelier::storage
