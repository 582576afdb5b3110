#include "internal/core/migration_engine.hpp"

#include <cassert>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "testing/memory_object_store.hpp"
#include "testing/test_support.hpp"

namespace {

using migrator::config::ConfigLoader;
using migrator::storage::MemoryObjectStore;
using migrator::testing::FailTimes;
using migrator::testing::FaultySink;
using migrator::testing::FaultySource;
using migrator::testing::MakeConfig;
using migrator::testing::TempDir;
using migrator::util::ErrorKind;

migrator::runtime::config::RuntimeConfig ConfigWithStaging(const TempDir& dir, uint32_t workers) {
  auto config = MakeConfig("photos", "photos-archive", workers, 1);
  ConfigLoader::Validate(config);
  config.mutable_staging()->set_directory((dir.path() / "staging").string());
  return config;
}

std::shared_ptr<MemoryObjectStore> SeedSource(int count, int bytes) {
  auto src = std::make_shared<MemoryObjectStore>("photos");
  for (int i = 0; i < count; ++i) {
    src->PutObject("img/" + std::to_string(i) + ".jpg", std::string(static_cast<std::size_t>(bytes), static_cast<char>('0' + i % 10)));
  }
  return src;
}

void TestMissingDestinationAbortsBeforeAnyTask() {
  TempDir dir("engine_missing");
  auto    inner = SeedSource(5, 10);
  auto    src   = std::make_shared<FaultySource>(inner);
  auto    dst   = std::make_shared<MemoryObjectStore>("photos-archive", false);

  auto config = ConfigWithStaging(dir, 4);
  auto app    = migrator::factory::Build(config, src, dst);

  bool threw = false;
  try {
    (void)app.engine->Run();
  } catch (const migrator::util::DestinationMissing&) {
    threw = true;
  }
  assert(threw);
  assert(src->fetch_calls() == 0);
  assert(!std::filesystem::exists(dir.path() / "staging"));
}

void TestEmptySource() {
  TempDir dir("engine_empty");
  auto    src = std::make_shared<MemoryObjectStore>("photos");
  auto    dst = std::make_shared<MemoryObjectStore>("photos-archive");

  auto app     = migrator::factory::Build(ConfigWithStaging(dir, 2), src, dst);
  auto summary = app.engine->Run();

  assert(summary.run.listed == 0);
  assert(!summary.verification);
  assert(summary.ExitCode() == 0);
  assert(!std::filesystem::exists(dir.path() / "staging"));
}

void TestFullMigrationThenIdempotentRerun() {
  TempDir dir("engine_full");
  auto    src = SeedSource(100, 10 * 1024);
  auto    dst = std::make_shared<MemoryObjectStore>("photos-archive");

  auto config = ConfigWithStaging(dir, 10);

  {
    auto app      = migrator::factory::Build(config, src, dst);
    int  observed = 0;
    auto summary  = app.engine->Run([&observed](const migrator::model::TransferResult&) { ++observed; });

    assert(observed == 100);
    assert(summary.run.succeeded == 100);
    assert(summary.verification);
    assert(summary.verification->matched);
    assert(summary.verification->destination_count == 100u);
    assert(summary.ExitCode() == 0);
    assert(dst->Count() == 100);
    // staging removed on the way out
    assert(!std::filesystem::exists(dir.path() / "staging"));
  }

  {
    auto app     = migrator::factory::Build(config, src, dst);
    auto summary = app.engine->Run();

    assert(summary.run.skipped == 100);
    assert(summary.run.succeeded == 0);
    assert(summary.run.bytes_transferred == 0);
    assert(summary.verification->matched);
    assert(summary.ExitCode() == 0);
    assert(dst->put_count() == 100);
  }
}

void TestFingerprintVerification() {
  TempDir dir("engine_fingerprints");
  auto    src = SeedSource(4, 64);
  auto    dst = std::make_shared<MemoryObjectStore>("photos-archive");

  auto config = ConfigWithStaging(dir, 2);
  config.mutable_verification()->set_verify_fingerprints(true);

  auto summary = migrator::factory::Build(config, src, dst).engine->Run();
  assert(summary.verification->matched);
  assert(summary.verification->fingerprint_mismatches.empty());
}

void TestFailedObjectGivesExitThree() {
  TempDir dir("engine_partial");
  auto    src   = SeedSource(5, 32);
  auto    inner = std::make_shared<MemoryObjectStore>("photos-archive");
  auto    dst   = std::make_shared<FaultySink>(inner);

  auto always_fail = FailTimes<migrator::util::TransientIOError>(-1, "500 internal error");
  dst->SetPutHook([always_fail](const std::string& key) {
    if (key == "img/3.jpg") always_fail(key);
  });

  auto summary = migrator::factory::Build(ConfigWithStaging(dir, 2), src, dst).engine->Run();

  assert(!summary.run.cancelled);
  assert(summary.run.failed == 1);
  assert(summary.run.succeeded == 4);
  assert(summary.verification);
  assert(!summary.verification->matched);
  assert(summary.ExitCode() == 3);
}

void TestExpiredCredentialsGiveExitTwo() {
  TempDir dir("engine_auth");
  auto    src   = SeedSource(20, 32);
  auto    inner = std::make_shared<MemoryObjectStore>("photos-archive");
  auto    dst   = std::make_shared<FaultySink>(inner);
  dst->SetPutHook(FailTimes<migrator::util::AuthExpired>(-1, "ExpiredToken"));

  auto summary = migrator::factory::Build(ConfigWithStaging(dir, 3), src, dst).engine->Run();

  assert(summary.run.cancelled);
  assert(summary.run.failed == 20);
  assert(summary.ExitCode() == 2);

  bool saw_cancelled = false;
  for (const auto& result : summary.run.results) {
    if (result.error_kind == ErrorKind::kCancelled) saw_cancelled = true;
  }
  assert(saw_cancelled);
  assert(!std::filesystem::exists(dir.path() / "staging"));
}

} // namespace

int main() {
  TestMissingDestinationAbortsBeforeAnyTask();
  TestEmptySource();
  TestFullMigrationThenIdempotentRerun();
  TestFingerprintVerification();
  TestFailedObjectGivesExitThree();
  TestExpiredCredentialsGiveExitTwo();

  std::cout << "object_migrator_unit_migration_engine: pass\n";
  return 0;
}
