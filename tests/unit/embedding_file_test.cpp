#include "internal/storage/embedding_file.hpp"

#include <arrow/builder.h>
#include <arrow/io/file.h>
#include <arrow/ipc/writer.h>
#include <arrow/record_batch.h>
#include <arrow/type.h>

#include <cassert>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <limits>
#include <string>

#include "internal/util/errors.hpp"

namespace {

using atelier::model::Embedding;
using atelier::model::kEmbeddingDimension;
using atelier::storage::ReadEmbeddingFile;
using atelier::storage::WriteEmbeddingFile;

std::filesystem::path TestDir(const std::string& test_name) {
  const auto dir = std::filesystem::temp_directory_path() / "atelier_embedding_file_tests" / test_name;
  std::filesystem::remove_all(dir);
  std::filesystem::create_directories(dir);
  return dir;
}

// rows x fixed_size_list<double>[width], every element set to fill.
void WriteForeignArrowFile(const std::filesystem::path& path, int32_t width, int64_t rows, double fill = 1.0) {
  arrow::DoubleBuilder builder;
  for (int64_t i = 0; i < static_cast<int64_t>(width) * rows; ++i) {
    assert(builder.Append(fill).ok());
  }
  auto values = builder.Finish().ValueOrDie();
  auto list   = arrow::FixedSizeListArray::FromArrays(values, width).ValueOrDie();

  auto schema = arrow::schema({arrow::field("embedding", arrow::fixed_size_list(arrow::float64(), width), false)});
  auto batch  = arrow::RecordBatch::Make(schema, rows, {list});

  auto out    = arrow::io::FileOutputStream::Open(path.string()).ValueOrDie();
  auto writer = arrow::ipc::MakeFileWriter(out, schema).ValueOrDie();
  assert(writer->WriteRecordBatch(*batch).ok());
  assert(writer->Close().ok());
  assert(out->Close().ok());
}

bool ReadIsMalformed(const std::filesystem::path& path) {
  try {
    (void)ReadEmbeddingFile(path);
  } catch (const atelier::util::MalformedSource&) {
    return true;
  }
  return false;
}

void TestMissingFileIsAbsent() {
  const auto dir = TestDir("missing");
  assert(!ReadEmbeddingFile(dir / "nothing.arrow").has_value());
}

void TestWriteCreatesParentsAndReadsBack() {
  const auto dir  = TestDir("write_read");
  const auto path = dir / "nested" / "deeper" / "beauty_standard_embedding.arrow";

  Embedding vector(kEmbeddingDimension, 0.0);
  vector[0]   = 1.0;
  vector[767] = -2.5;

  WriteEmbeddingFile(path, vector);
  assert(std::filesystem::exists(path));
  assert(!std::filesystem::exists(path.string() + ".tmp"));

  auto read = ReadEmbeddingFile(path);
  assert(read.has_value());
  assert(*read == vector);
}

void TestOverwriteReplacesContents() {
  const auto dir  = TestDir("overwrite");
  const auto path = dir / "v.arrow";

  WriteEmbeddingFile(path, Embedding(kEmbeddingDimension, 1.0));
  WriteEmbeddingFile(path, Embedding(kEmbeddingDimension, 2.0));

  auto read = ReadEmbeddingFile(path);
  assert(read.has_value());
  assert((*read)[100] == 2.0);
}

void TestWrongLengthIsRejected() {
  const auto dir  = TestDir("wrong_length");
  const auto path = dir / "v.arrow";

  bool threw = false;
  try {
    WriteEmbeddingFile(path, Embedding(767, 0.0));
  } catch (const atelier::util::StorageError&) {
    threw = true;
  }
  assert(threw);
  assert(!std::filesystem::exists(path));
}

void TestShapeMismatchIsMalformed() {
  const auto dir = TestDir("shape_mismatch");

  WriteForeignArrowFile(dir / "narrow.arrow", 3, 1);
  assert(ReadIsMalformed(dir / "narrow.arrow"));

  WriteForeignArrowFile(dir / "two_rows.arrow", static_cast<int32_t>(kEmbeddingDimension), 2);
  assert(ReadIsMalformed(dir / "two_rows.arrow"));
}

void TestNonFiniteElementsAreRejected() {
  const auto dir = TestDir("non_finite");

  WriteForeignArrowFile(dir / "nan.arrow", static_cast<int32_t>(kEmbeddingDimension), 1, std::nan(""));
  assert(ReadIsMalformed(dir / "nan.arrow"));

  WriteForeignArrowFile(dir / "inf.arrow", static_cast<int32_t>(kEmbeddingDimension), 1, std::numeric_limits<double>::infinity());
  assert(ReadIsMalformed(dir / "inf.arrow"));

  Embedding vector(kEmbeddingDimension, 0.0);
  vector[3] = std::nan("");

  bool threw = false;
  try {
    WriteEmbeddingFile(dir / "written.arrow", vector);
  } catch (const atelier::util::StorageError&) {
    threw = true;
  }
  assert(threw);
  assert(!std::filesystem::exists(dir / "written.arrow"));
}

void TestGarbageIsMalformed() {
  const auto dir  = TestDir("garbage");
  const auto path = dir / "v.arrow";

  std::ofstream out(path, std::ios::binary);
  out << "definitely not an arrow file";
  out.close();

  assert(ReadIsMalformed(path));
}

void TestUnwritableTargetIsStorageError() {
  const auto dir     = TestDir("unwritable");
  const auto blocker = dir / "file";

  // a regular file where a directory is needed
  std::ofstream(blocker) << "x";

  bool threw = false;
  try {
    WriteEmbeddingFile(blocker / "v.arrow", Embedding(kEmbeddingDimension, 0.0));
  } catch (const atelier::util::StorageError&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestMissingFileIsAbsent();
  TestWriteCreatesParentsAndReadsBack();
  TestOverwriteReplacesContents();
  TestWrongLengthIsRejected();
  TestShapeMismatchIsMalformed();
  TestNonFiniteElementsAreRejected();
  TestGarbageIsMalformed();
  TestUnwritableTargetIsStorageError();

  std::cout << "atelier_unit_embedding_file: pass\n";
  return 0;
}
