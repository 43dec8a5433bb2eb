#include <atomic>
#include <cassert>
#include <chrono>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "internal/core/inspection_manager.hpp"
#include "internal/core/sync_queue.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"

namespace {

using fieldsync::core::InspectionManager;
using fieldsync::core::SyncQueue;
using fieldsync::model::InspectionStatus;

constexpr int kThreads = 8;
constexpr int kRounds  = 25;

std::string TempDbPath() {
  const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
  return (std::filesystem::temp_directory_path() / ("fieldsync_claim_" + std::to_string(stamp) + ".db")).string();
}

void RunClaimRace(const std::string& name, std::shared_ptr<fieldsync::db::Repository> repository) {
  repository->Open();
  auto clock       = std::make_shared<fieldsync::util::WallClock>();
  auto queue       = std::make_shared<SyncQueue>(repository, clock);
  auto inspections = std::make_shared<InspectionManager>(repository, queue, clock);

  for (int round = 0; round < kRounds; ++round) {
    const auto id = name + "-race-" + std::to_string(round);
    inspections->Save(id, "{}");

    std::atomic<int>         winners{0};
    std::atomic<bool>        go{false};
    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
      threads.emplace_back([&]() {
        while (!go.load()) std::this_thread::yield();
        if (inspections->Claim(id)) winners.fetch_add(1);
      });
    }
    go = true;
    for (auto& thread : threads) thread.join();

    assert(winners.load() == 1 && "exactly one claimer may win");
    assert(inspections->Get(id)->status == InspectionStatus::kSyncing);
  }

  // concurrent writers on distinct ids all land
  std::vector<std::thread> writers;
  for (int t = 0; t < kThreads; ++t) {
    writers.emplace_back([&, t]() {
      for (int i = 0; i < 10; ++i) inspections->Save(name + "-w" + std::to_string(t) + "-" + std::to_string(i), "{}");
    });
  }
  for (auto& writer : writers) writer.join();

  assert(queue->Count() == static_cast<uint64_t>(kRounds + kThreads * 10));
  repository->Close();
}

} // namespace

int main() {
  RunClaimRace("memory", std::make_shared<fieldsync::db::memory::MemoryRepository>());

  const auto                           path = TempDbPath();
  fieldsync::db::sqlite::SqliteOptions options;
  options.path = path;
  RunClaimRace("sqlite", std::make_shared<fieldsync::db::sqlite::SqliteRepository>(options));
  std::filesystem::remove(path);
  std::filesystem::remove(path + "-wal");
  std::filesystem::remove(path + "-shm");

  std::cout << "fieldsync_unit_claim_concurrency: pass\n";
  return 0;
}
