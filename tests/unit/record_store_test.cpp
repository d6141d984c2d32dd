#include <cassert>
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <string>
#include <vector>

#include "internal/storage/common/arrow_utils.hpp"
#include "internal/storage/disk/disk_record_store.hpp"
#include "internal/storage/memory/memory_record_store.hpp"
#include "internal/util/errors.hpp"

namespace {

using outbox::storage::DiskRecordStore;
using outbox::storage::MemoryRecordStore;
using outbox::storage::RecordStore;
using outbox::storage::common::ToBuffer;

std::filesystem::path FreshDir(const std::string& test_name) {
  const auto dir = std::filesystem::temp_directory_path() / "outbox_record_store_tests" / test_name;
  std::filesystem::remove_all(dir);
  return dir;
}

std::vector<std::string> Sorted(std::vector<std::string> names) {
  std::sort(names.begin(), names.end());
  return names;
}

/*
  Behavior both backends must share.
*/
void ExerciseContract(RecordStore& store, const std::filesystem::path& dir) {
  store.EnsureDirectory(dir);
  store.EnsureDirectory(dir);
  assert(store.List(dir).empty());

  store.Write(dir / "a.json", ToBuffer("alpha"), true);
  store.Write(dir / "b.json", ToBuffer("beta"), false);
  assert(Sorted(store.List(dir)) == (std::vector<std::string>{"a.json", "b.json"}));
  assert(store.Read(dir / "a.json")->ToString() == "alpha");

  // replace
  store.Write(dir / "a.json", ToBuffer("alpha-2"), true);
  assert(store.Read(dir / "a.json")->ToString() == "alpha-2");
  assert(store.List(dir).size() == 2);

  assert(store.Remove(dir / "a.json"));
  assert(!store.Remove(dir / "a.json"));
  assert(store.List(dir) == std::vector<std::string>{"b.json"});

  bool threw = false;
  try {
    (void)store.Read(dir / "a.json");
  } catch (const outbox::util::NotFound&) {
    threw = true;
  }
  assert(threw && "reading a removed record must throw NotFound");

  // nested directories do not leak into the parent's listing
  store.EnsureDirectory(dir / "child");
  store.Write(dir / "child" / "c.json", ToBuffer("gamma"), true);
  assert(store.List(dir) == std::vector<std::string>{"b.json"});
  assert(store.List(dir / "child") == std::vector<std::string>{"c.json"});
}

void TestDiskContract() {
  DiskRecordStore store;
  ExerciseContract(store, FreshDir("contract"));
}

void TestMemoryContract() {
  MemoryRecordStore store;
  ExerciseContract(store, "/outbox/errors");
}

void TestDiskListSkipsTemporaryFiles() {
  const auto      dir = FreshDir("tmp_files");
  DiskRecordStore store;
  store.EnsureDirectory(dir);
  store.Write(dir / "a.json", ToBuffer("alpha"), true);

  {
    std::ofstream out(dir / "b.json.tmp");
    out << "half written";
  }

  assert(store.List(dir) == std::vector<std::string>{"a.json"});
}

void TestDiskSyncedWriteIsComplete() {
  const auto      dir = FreshDir("synced");
  DiskRecordStore store;
  store.EnsureDirectory(dir);

  store.Write(dir / "a.json", ToBuffer("alpha"), true);
  store.Write(dir / "a.json", ToBuffer("alpha-2"), true);

  std::vector<std::string> on_disk;
  for (const auto& entry : std::filesystem::directory_iterator(dir)) {
    on_disk.push_back(entry.path().filename().string());
  }
  assert(on_disk == std::vector<std::string>{"a.json"});

  std::ifstream in(dir / "a.json");
  std::string   contents((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  assert(contents == "alpha-2");

  bool threw = false;
  try {
    store.Write(dir / "gone" / "b.json", ToBuffer("beta"), true);
  } catch (const outbox::util::StorageFailure&) {
    threw = true;
  }
  assert(threw);
  assert(!std::filesystem::exists(dir / "gone"));
}

void TestMissingDirectoryIsStorageFailure() {
  DiskRecordStore disk;
  bool            threw = false;
  try {
    (void)disk.List(FreshDir("missing"));
  } catch (const outbox::util::StorageFailure&) {
    threw = true;
  }
  assert(threw);

  MemoryRecordStore memory;
  threw = false;
  try {
    memory.Write("/nowhere/a.json", ToBuffer("x"), true);
  } catch (const outbox::util::StorageFailure&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestDiskContract();
  TestMemoryContract();
  TestDiskListSkipsTemporaryFiles();
  TestDiskSyncedWriteIsComplete();
  TestMissingDirectoryIsStorageFailure();

  std::cout << "outbox_unit_record_store: pass\n";
  return 0;
}
