#include "internal/transfer/staging.hpp"

#include <arrow/buffer.h>
#include <arrow/io/memory.h>

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>

#include "internal/util/errors.hpp"
#include "testing/test_support.hpp"

namespace {

using migrator::testing::CountEntries;
using migrator::testing::FailingInputStream;
using migrator::testing::TempDir;
using migrator::transfer::StagedObject;
using migrator::transfer::StagingArea;

std::shared_ptr<arrow::io::BufferReader> ReaderOf(const std::string& content) {
  return std::make_shared<arrow::io::BufferReader>(arrow::Buffer::FromString(content));
}

void TestDiskStagingOwnsFile() {
  TempDir     dir("staging_disk");
  StagingArea staging(dir.path() / "bucket", false, 4);
  staging.Prepare();

  const std::string content = "hello staging area";
  auto              input   = ReaderOf(content);

  std::filesystem::path staged_path;
  {
    StagedObject staged = staging.Stage("photos/2024/a.jpg", *input);
    staged_path         = staged.path();

    assert(std::filesystem::exists(staged_path));
    assert(staged_path.parent_path() == staging.run_directory());
    assert(staging.run_directory().parent_path() == staging.root());
    assert(staged.size() == static_cast<int64_t>(content.size()));
    assert(staged.data()->ToString() == content);
  }

  // destruction removes the file
  assert(!std::filesystem::exists(staged_path));
  assert(CountEntries(staging.run_directory()) == 0);
}

void TestStagedBytesStayOnDisk() {
  TempDir     dir("staging_mapped");
  StagingArea staging(dir.path(), false, 3);
  staging.Prepare();

  auto         input  = ReaderOf("original bytes");
  StagedObject staged = staging.Stage("mapped", *input);

  // the buffer is a view of the staging file, not a heap copy of it
  {
    std::fstream file(staged.path(), std::ios::in | std::ios::out | std::ios::binary);
    file.seekp(0);
    file.write("O", 1);
  }
  assert(staged.data()->ToString() == "Original bytes");

  auto         empty_input = ReaderOf("");
  StagedObject empty       = staging.Stage("empty", *empty_input);
  assert(empty.size() == 0);
  assert(std::filesystem::exists(empty.path()));
}

void TestReleaseIsIdempotent() {
  TempDir     dir("staging_release");
  StagingArea staging(dir.path(), false, 1024);
  staging.Prepare();

  auto         input  = ReaderOf("abc");
  StagedObject staged = staging.Stage("k", *input);
  const auto   path   = staged.path();

  staged.Release();
  assert(!std::filesystem::exists(path));
  assert(staged.data() == nullptr);
  assert(staged.size() == 0);
  staged.Release();

  auto         again = ReaderOf("def");
  StagedObject moved = staging.Stage("k", *again);
  StagedObject owner = std::move(moved);
  assert(moved.path().empty());
  assert(std::filesystem::exists(owner.path()));
}

void TestPrefixKeysDoNotCollide() {
  StagingArea staging("/tmp/object_migrator_staging_paths", false, 1024);

  const auto leaf   = staging.PathFor("a");
  const auto nested = staging.PathFor("a/b");
  assert(leaf != nested);
  assert(leaf.parent_path() == staging.run_directory());
  assert(nested.parent_path() == staging.run_directory());
}

void TestEscapingKeysAreRejected() {
  StagingArea staging("/tmp/object_migrator_staging_reject", false, 1024);

  for (const std::string key : {"../x", "a/../../x", "/etc/passwd", ""}) {
    bool threw = false;
    try {
      (void)staging.PathFor(key);
    } catch (const migrator::util::InvalidInput&) {
      threw = true;
    }
    assert(threw);
  }
}

void TestFailedStageLeavesNothing() {
  TempDir     dir("staging_failure");
  StagingArea staging(dir.path(), false, 8);
  staging.Prepare();

  FailingInputStream input(20);
  bool               threw = false;
  try {
    (void)staging.Stage("broken", input);
  } catch (const migrator::util::TransientIOError&) {
    threw = true;
  }
  assert(threw);
  assert(CountEntries(staging.run_directory()) == 0);
}

void TestCleanupRemovesRoot() {
  TempDir     dir("staging_cleanup");
  StagingArea staging(dir.path() / "bucket", false, 1024);
  staging.Prepare();
  assert(std::filesystem::exists(staging.root()));

  staging.Cleanup();
  assert(!std::filesystem::exists(staging.root()));

  // a second cleanup on a missing root is harmless
  staging.Cleanup();
}

void TestCleanupLeavesOtherFilesAlone() {
  TempDir dir("staging_shared");
  {
    std::ofstream foreign(dir.path() / "notes.txt");
    foreign << "not ours";
  }

  StagingArea first(dir.path(), false, 1024);
  StagingArea second(dir.path(), false, 1024);
  first.Prepare();
  second.Prepare();
  assert(first.run_directory() != second.run_directory());

  auto         a_input  = ReaderOf("first run");
  auto         b_input  = ReaderOf("second run");
  StagedObject a_staged = first.Stage("same/key", *a_input);
  StagedObject b_staged = second.Stage("same/key", *b_input);
  assert(a_staged.path() != b_staged.path());

  a_staged.Release();
  first.Cleanup();

  assert(!std::filesystem::exists(first.run_directory()));
  assert(std::filesystem::exists(dir.path() / "notes.txt"));
  assert(std::filesystem::exists(b_staged.path()));
  assert(b_staged.data()->ToString() == "second run");

  b_staged.Release();
  second.Cleanup();
  // the root existed before either run, so it stays
  assert(std::filesystem::exists(dir.path()));
  assert(CountEntries(dir.path()) == 1);
}

void TestInMemoryStagingTouchesNoDisk() {
  TempDir     dir("staging_memory");
  StagingArea staging(dir.path() / "unused", true, 2);
  staging.Prepare();
  assert(!std::filesystem::exists(staging.root()));

  auto         input  = ReaderOf("kept in memory");
  StagedObject staged = staging.Stage("a/b", *input);
  assert(staged.path().empty());
  assert(staged.data()->ToString() == "kept in memory");
  assert(!std::filesystem::exists(staging.root()));
}

} // namespace

int main() {
  TestDiskStagingOwnsFile();
  TestStagedBytesStayOnDisk();
  TestReleaseIsIdempotent();
  TestPrefixKeysDoNotCollide();
  TestEscapingKeysAreRejected();
  TestFailedStageLeavesNothing();
  TestCleanupRemovesRoot();
  TestCleanupLeavesOtherFilesAlone();
  TestInMemoryStagingTouchesNoDisk();

  std::cout << "object_migrator_unit_staging: pass\n";
  return 0;
}
