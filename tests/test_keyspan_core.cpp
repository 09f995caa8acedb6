#include <algorithm>
#include <atomic>
#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include "app/cli.hpp"
#include "core/api/core_api.hpp"
#include "core/model/app_meta.hpp"
#include "core/partition/partitioner.hpp"
#include "core/pool/assignment_table.hpp"
#include "core/pool/coordinator.hpp"
#include "core/pool/local_pool_server.hpp"
#include "core/schedule/scheduler.hpp"
#include "core/storage/directory_lock.hpp"
#include "core/storage/json_codec.hpp"
#include "core/storage/ledger.hpp"

namespace {

using keyspan::BigKey;

std::filesystem::path temp_dir(const std::string& name) {
  const auto root = std::filesystem::temp_directory_path() / "keyspan-tests" / name;
  std::error_code ec;
  std::filesystem::remove_all(root, ec);
  std::filesystem::create_directories(root, ec);
  return root;
}

struct FakeClock {
  std::shared_ptr<std::atomic<std::int64_t>> now = std::make_shared<std::atomic<std::int64_t>>(1700000000);

  std::function<std::int64_t()> fn() const {
    auto shared = now;
    return [shared] { return shared->load(); };
  }
  void advance(std::int64_t seconds) { now->fetch_add(seconds); }
};

keyspan::StorageContext context_for(const std::filesystem::path& dir, const FakeClock& clock) {
  return {.root = dir.string(), .now_unix = clock.fn()};
}

BigKey key(std::uint64_t value) {
  return BigKey{value};
}

keyspan::KeyRange make_range(const std::string& id, std::uint64_t start, std::uint64_t end, int priority = 50) {
  keyspan::KeyRange range;
  range.id = id;
  range.start = key(start);
  range.end = key(end);
  range.priority = priority;
  return range;
}

// Forwards to a real pool until switched offline.
class FlakyRemote final : public keyspan::IPoolRemote {
public:
  explicit FlakyRemote(keyspan::IPoolRemote& inner) : inner_(inner) {}

  void set_online(bool online) { online_ = online; }

  keyspan::Result register_participant(std::string_view client_id, std::chrono::milliseconds timeout) override {
    return online_ ? inner_.register_participant(client_id, timeout) : offline();
  }
  keyspan::Result request_assignment(const keyspan::AssignmentRequest& request, std::chrono::milliseconds timeout,
                                     keyspan::Assignment& out) override {
    return online_ ? inner_.request_assignment(request, timeout, out) : offline();
  }
  keyspan::Result report_progress(const keyspan::ProgressReport& report, std::chrono::milliseconds timeout) override {
    return online_ ? inner_.report_progress(report, timeout) : offline();
  }
  keyspan::Result report_completion(const keyspan::CompletionReport& report,
                                    std::chrono::milliseconds timeout) override {
    return online_ ? inner_.report_completion(report, timeout) : offline();
  }
  keyspan::Result abandon_assignment(std::string_view assignment_id, std::string_view client_id,
                                     std::string_view reason, std::chrono::milliseconds timeout) override {
    return online_ ? inner_.abandon_assignment(assignment_id, client_id, reason, timeout) : offline();
  }
  keyspan::Result fetch_stats(std::string_view client_id, std::chrono::milliseconds timeout,
                              keyspan::PoolStats& out) override {
    return online_ ? inner_.fetch_stats(client_id, timeout, out) : offline();
  }

private:
  static keyspan::Result offline() {
    return keyspan::Result::failure(keyspan::ErrorCode::Unavailable, "pool offline");
  }

  keyspan::IPoolRemote& inner_;
  std::atomic<bool> online_{true};
};

void test_big_key_codecs() {
  const auto hex = BigKey::parse("0x1000");
  const auto dec = BigKey::parse("4096");
  assert(hex.has_value() && dec.has_value());
  assert(*hex == *dec);
  assert(hex->to_hex() == "1000");
  assert(BigKey::pow2(71).to_hex() == "800000000000000000");
  assert(BigKey::pow2(70).to_decimal() == "1180591620717411303424");

  assert(!BigKey::parse("").has_value());
  assert(!BigKey::parse("12a").has_value());
  assert(!BigKey::parse("0xZZ").has_value());
  assert(!BigKey::parse("-5").has_value());

  assert(keyspan::percent_hundredths(BigKey::pow2(68), BigKey::pow2(69)) == 5000);
  assert(keyspan::format_hundredths(keyspan::percent_hundredths(BigKey::pow2(68), BigKey::pow2(69))) == "50.00");
  assert(keyspan::format_hundredths(5) == "0.05");
  assert(keyspan::format_hundredths(10000) == "100.00");
  assert(keyspan::percent_hundredths(key(1), key(3)) == 3333);
  assert(BigKey::saturating_sub(key(3), key(5)).is_zero());
}

void test_partitioner_manifest() {
  const keyspan::KeyspacePartitioner partitioner;
  const keyspan::KeyspaceConfig keyspace;

  BigKey end;
  assert(keyspan::KeyspacePartitioner::position_to_offset(100.0, keyspace.range_min, keyspace.range_size(), end).ok);
  assert(end == BigKey::pow2(71));
  BigKey begin;
  assert(keyspan::KeyspacePartitioner::position_to_offset(0.0, keyspace.range_min, keyspace.range_size(), begin).ok);
  assert(begin == BigKey::pow2(70));
  BigKey ignored;
  const auto out_of_range =
      keyspan::KeyspacePartitioner::position_to_offset(100.5, keyspace.range_min, keyspace.range_size(), ignored);
  assert(!out_of_range.ok && out_of_range.code == keyspan::ErrorCode::Validation);

  keyspan::Manifest manifest;
  const auto generated = partitioner.generate_manifest(keyspace, {.central = 50.0, .ci_lower = 40.0, .ci_upper = 90.0},
                                                       1700000000, manifest);
  assert(generated.ok);
  assert(manifest.core.id == "high_priority");
  assert(manifest.core.priority == 90);
  assert(manifest.parallel_splits.size() == 3);
  assert(manifest.parallel_splits[0].id == "gpu_0");
  assert(manifest.parallel_splits[0].start == manifest.core.start);
  assert(manifest.parallel_splits[2].end == manifest.core.end);
  for (std::size_t i = 0; i + 1 < manifest.parallel_splits.size(); ++i) {
    assert(manifest.parallel_splits[i].end == manifest.parallel_splits[i + 1].start);
    assert(manifest.parallel_splits[i].priority == 80);
  }

  assert(manifest.fallback.size() == 2);
  assert(manifest.fallback[0].id == "fallback_0");
  assert(manifest.fallback[0].priority == 40);
  assert(manifest.fallback[0].start == BigKey::pow2(70));
  assert(manifest.fallback[0].end == manifest.core.start);
  assert(manifest.fallback[1].id == "fallback_1");
  assert(manifest.fallback[1].priority == 35);
  assert(manifest.fallback[1].start == manifest.core.end);
  assert(manifest.fallback[1].end == BigKey::pow2(71));

  keyspan::KeyspaceConfig small;
  small.range_min = key(0);
  small.range_max = key(9999);
  keyspan::Manifest small_manifest;
  assert(partitioner.generate_manifest(small, {}, 0, small_manifest).ok);
  assert(small_manifest.core.start == key(4000));
  assert(small_manifest.core.end == key(9000));
  assert(small_manifest.parallel_splits[0].end == key(5500));
  assert(small_manifest.parallel_splits[1].end == key(7000));

  keyspan::Manifest rejected;
  const auto bad_central = partitioner.generate_manifest(keyspace, {.central = 101.0}, 0, rejected);
  assert(!bad_central.ok && bad_central.code == keyspan::ErrorCode::Validation);
  const auto inverted =
      partitioner.generate_manifest(keyspace, {.central = 50.0, .ci_lower = 60.0, .ci_upper = 40.0}, 0, rejected);
  assert(!inverted.ok && inverted.code == keyspan::ErrorCode::Validation);
}

void test_ledger_validation_and_persistence() {
  const auto dir = temp_dir("ledger");
  FakeClock clock;
  const auto context = context_for(dir, clock);

  {
    keyspan::ProgressLedger ledger;
    assert(ledger.open(context).ok);
    assert(ledger.register_range(make_range("r1", 0, 1000)).ok);
    assert(!ledger.register_range(make_range("r1", 0, 1000)).ok);
    assert(!ledger.register_range(make_range("bad", 10, 10)).ok);

    keyspan::ProgressRecord record;
    const auto first = ledger.update("r1", key(500), 100.0, record);
    assert(first.ok);
    assert(record.percent_hundredths == 5000);
    assert(record.status == keyspan::RangeStatus::Active);
    assert(record.estimated_completion_unix.has_value());
    assert(*record.estimated_completion_unix == clock.now->load() + 5);

    const auto decreased = ledger.update("r1", key(400), std::nullopt, record);
    assert(!decreased.ok && decreased.code == keyspan::ErrorCode::Validation);
    const auto over = ledger.update("r1", key(1001), std::nullopt, record);
    assert(!over.ok && over.code == keyspan::ErrorCode::Validation);
    const auto unknown = ledger.update("nope", key(1), std::nullopt, record);
    assert(!unknown.ok && unknown.code == keyspan::ErrorCode::Validation);
    const auto negative_rate = ledger.update("r1", key(600), -1.0, record);
    assert(!negative_rate.ok && negative_rate.code == keyspan::ErrorCode::Validation);

    const auto stored = ledger.find("r1");
    assert(stored.has_value() && stored->progress.searched_keys == key(500));
  }

  {
    keyspan::ProgressLedger reopened;
    assert(reopened.open(context).ok);
    const auto entry = reopened.find("r1");
    assert(entry.has_value());
    assert(entry->progress.searched_keys == key(500));
    assert(entry->progress.percent_hundredths == 5000);

    keyspan::ProgressRecord record;
    assert(reopened.update("r1", key(1000), std::nullopt, record).ok);
    assert(record.status == keyspan::RangeStatus::Completed);
    assert(keyspan::format_hundredths(record.percent_hundredths) == "100.00");
    const auto after = reopened.update("r1", key(1000), std::nullopt, record);
    assert(!after.ok && after.code == keyspan::ErrorCode::InvalidState);
  }
}

void test_ledger_rejects_corrupt_file() {
  const auto dir = temp_dir("ledger-corrupt");
  {
    std::ofstream out(dir / keyspan::kProgressFile);
    out << "{ this is not json";
  }
  keyspan::ProgressLedger ledger;
  FakeClock clock;
  const auto opened = ledger.open(context_for(dir, clock));
  assert(!opened.ok);
  assert(opened.code == keyspan::ErrorCode::Corrupt);

  {
    std::ofstream out(dir / keyspan::kProgressFile, std::ios::trunc);
    out << R"([{"range": {"id": "x", "start": "10", "end": "5"}, "progress": {}}])";
  }
  keyspan::ProgressLedger second;
  const auto reopened = second.open(context_for(dir, clock));
  assert(!reopened.ok && reopened.code == keyspan::ErrorCode::Corrupt);
}

void test_ledger_seed_from_manifest() {
  const auto dir = temp_dir("ledger-seed");
  FakeClock clock;
  keyspan::ProgressLedger ledger;
  assert(ledger.open(context_for(dir, clock)).ok);

  keyspan::KeyspaceConfig keyspace;
  keyspace.range_min = key(0);
  keyspace.range_max = key(9999);
  keyspan::Manifest manifest;
  assert(keyspan::KeyspacePartitioner{}.generate_manifest(keyspace, {}, clock.now->load(), manifest).ok);
  assert(ledger.seed_from_manifest(manifest).ok);
  assert(ledger.seeded());
  assert(ledger.size() == 6);

  const auto core = ledger.find("high_priority");
  assert(core.has_value());
  assert(core->range.status == keyspan::RangeStatus::Abandoned);
  assert(core->range.split_reason == "manifest_split_3way");
  assert(ledger.find("gpu_1")->range.parent_id == "high_priority");

  const auto coverage = ledger.aggregate_coverage();
  assert(coverage.total_keyspace == key(10000));
  assert(coverage.searched_keyspace.is_zero());

  const auto again = ledger.seed_from_manifest(manifest);
  assert(!again.ok && again.code == keyspan::ErrorCode::InvalidState);
}

void test_scheduler_priority() {
  const keyspan::AdaptiveScheduler scheduler;
  keyspan::ProgressRecord record;
  assert(scheduler.priority(record) == 50);

  record.search_rate = 2e9;
  assert(scheduler.priority(record) == 70);

  record.percent_hundredths = 8000;
  assert(scheduler.priority(record) == 40);

  record.search_rate = 1e6;
  record.percent_hundredths = 6000;
  assert(scheduler.priority(record) == 35);

  record.percent_hundredths = 7500;
  assert(scheduler.priority(record) == 35);
  record.percent_hundredths = 7501;
  assert(scheduler.priority(record) == 20);
}

void test_scheduler_stall_detection() {
  const auto dir = temp_dir("scheduler-stall");
  FakeClock clock;
  keyspan::ProgressLedger ledger;
  assert(ledger.open(context_for(dir, clock)).ok);
  assert(ledger.register_range(make_range("r1", 0, 1000000)).ok);
  keyspan::ProgressRecord record;
  assert(ledger.update("r1", key(10), 1e8, record).ok);

  const keyspan::AdaptiveScheduler scheduler;
  const auto start = clock.now->load();
  assert(scheduler.stalled_ranges(ledger.snapshot(), start + 10 * 60).empty());
  const auto stalled = scheduler.stalled_ranges(ledger.snapshot(), start + 3 * 60 * 60);
  assert(stalled.size() == 1 && stalled.front() == "r1");

  const auto lines = scheduler.recommendations(ledger.snapshot(), start + 3 * 60 * 60);
  bool saw_slow = false;
  bool saw_stalled = false;
  bool saw_started = false;
  for (const auto& line : lines) {
    saw_slow = saw_slow || line.find("slow") != std::string::npos;
    saw_stalled = saw_stalled || line.find("stalled: r1") != std::string::npos;
    saw_started = saw_started || line.find("just started") != std::string::npos;
  }
  assert(saw_slow && saw_stalled && saw_started);
}

void test_scheduler_select_next() {
  const auto dir = temp_dir("scheduler-select");
  FakeClock clock;
  keyspan::ProgressLedger ledger;
  assert(ledger.open(context_for(dir, clock)).ok);

  keyspan::KeyspaceConfig keyspace;
  keyspace.range_min = key(0);
  keyspace.range_max = key(9999);
  keyspan::Manifest manifest;
  assert(keyspan::KeyspacePartitioner{}.generate_manifest(keyspace, {}, clock.now->load(), manifest).ok);
  assert(ledger.seed_from_manifest(manifest).ok);

  const keyspan::AdaptiveScheduler scheduler;
  assert(!scheduler.high_priority_exhausted(ledger.snapshot()));
  assert(scheduler.select_next(ledger.snapshot(), {}).empty());
  const auto early = scheduler.recommended_set(ledger.snapshot(), {});
  assert(early.size() == 5);
  assert(early.front().id == "gpu_0");

  keyspan::ProgressRecord record;
  assert(ledger.update("gpu_0", key(1425), std::nullopt, record).ok);
  assert(ledger.update("gpu_1", key(1425), std::nullopt, record).ok);
  assert(!scheduler.high_priority_exhausted(ledger.snapshot()));
  assert(ledger.update("gpu_2", key(1900), std::nullopt, record).ok);
  assert(scheduler.high_priority_exhausted(ledger.snapshot()));

  const auto next = scheduler.select_next(ledger.snapshot(), {});
  assert(next.size() == 2);
  assert(next[0].id == "fallback_0");
  assert(next[1].id == "fallback_1");
  assert(scheduler.select_next(ledger.snapshot(), {"fallback_0"}).front().id == "fallback_1");

  const auto strategy = scheduler.build_strategy(ledger.snapshot(), clock.now->load());
  assert(strategy.current_ranges.size() == 3);
  assert(strategy.next_recommended.size() == 2);
  assert(strategy.high_priority_complete_hundredths == 9500);
  assert(scheduler.save_strategy(context_for(dir, clock), strategy).ok);
  assert(std::filesystem::exists(dir / keyspan::kStrategyFile));
}

void test_split_range() {
  const auto dir = temp_dir("split");
  FakeClock clock;
  keyspan::ProgressLedger ledger;
  assert(ledger.open(context_for(dir, clock)).ok);
  assert(ledger.register_range(make_range("r", 0, 10)).ok);
  assert(ledger.register_range(make_range("active", 100, 200)).ok);
  assert(ledger.register_range(make_range("done", 300, 400)).ok);

  const keyspan::AdaptiveScheduler scheduler;
  std::vector<keyspan::KeyRange> children;
  assert(scheduler.split_range(ledger, "r", 3, clock.now->load(), children).ok);
  assert(children.size() == 3);
  assert(children[0].id == "r_split_0");
  assert(children[0].start == key(0) && children[0].end == key(3));
  assert(children[1].start == key(3) && children[1].end == key(6));
  assert(children[2].start == key(6) && children[2].end == key(10));
  assert(children[2].parent_id == "r");

  const auto parent = ledger.find("r");
  assert(parent->range.status == keyspan::RangeStatus::Abandoned);
  assert(parent->range.split_reason == "split_3way");
  assert(ledger.find("r_split_1").has_value());

  const auto zero = scheduler.split_range(ledger, "active", 0, clock.now->load(), children);
  assert(!zero.ok && zero.code == keyspan::ErrorCode::Validation);
  const auto too_many = scheduler.split_range(ledger, "active", 101, clock.now->load(), children);
  assert(!too_many.ok && too_many.code == keyspan::ErrorCode::Validation);

  keyspan::ProgressRecord record;
  assert(ledger.update("active", key(1), 1e9, record).ok);
  assert(scheduler.split_range(ledger, "active", 2, clock.now->load(), children).ok);
  assert(children[0].priority == 70);

  assert(ledger.mark_completed("done", true).ok);
  const auto completed = scheduler.split_range(ledger, "done", 2, clock.now->load(), children);
  assert(!completed.ok && completed.code == keyspan::ErrorCode::InvalidState);
  const auto again = scheduler.split_range(ledger, "r", 2, clock.now->load(), children);
  assert(!again.ok && again.code == keyspan::ErrorCode::InvalidState);
}

void test_assignment_table_claims() {
  keyspan::AssignmentTable table;
  keyspan::Assignment first;
  assert(table.try_claim(make_range("a", 0, 100), "c1", "", 0, 600, first).ok);
  keyspan::Assignment second;
  assert(!table.try_claim(make_range("a", 0, 100), "c2", "", 0, 600, second).ok);
  assert(!table.try_claim(make_range("b", 50, 150), "c2", "", 0, 600, second).ok);
  assert(table.try_claim(make_range("c", 100, 200), "c2", "", 0, 600, second).ok);

  BigKey credited;
  assert(table.heartbeat(first.assignment_id, "c1", key(40), 100, credited).ok);
  assert(credited == key(40));
  assert(table.heartbeat(first.assignment_id, "c1", key(60), 200, credited).ok);
  assert(credited == key(20));
  assert(!table.heartbeat(first.assignment_id, "intruder", key(70), 200, credited).ok);

  const auto expired = table.reap_expired(701);
  assert(expired.size() == 1 && expired.front().assignment.range_id == "c");
  assert(!table.heartbeat(second.assignment_id, "c2", key(1), 702, credited).ok);
  assert(table.try_claim(make_range("c", 100, 200), "c3", "", 702, 600, second).ok);

  keyspan::AssignmentRecord closed;
  assert(table.close(first.assignment_id, "c1", keyspan::AssignmentState::Completed, closed).ok);
  assert(!table.close(first.assignment_id, "c1", keyspan::AssignmentState::Abandoned, closed).ok);
  assert(!table.claimed_range_ids().contains("a"));
}

void test_concurrent_claims_are_exclusive() {
  const auto root = temp_dir("concurrent-claims");
  FakeClock clock;
  keyspan::ProgressLedger ledger;
  assert(ledger.open(context_for(root / "pool", clock)).ok);
  constexpr std::uint64_t kRanges = 8;
  for (std::uint64_t i = 0; i < kRanges; ++i) {
    assert(ledger.register_range(make_range("r" + std::to_string(i), i * 1000, (i + 1) * 1000)).ok);
  }
  keyspan::LocalPoolServer server(ledger, keyspan::AdaptiveScheduler{});
  assert(server.open(context_for(root / "pool", clock)).ok);

  constexpr int kParticipants = 12;
  std::vector<std::unique_ptr<keyspan::PoolCoordinator>> participants;
  for (int i = 0; i < kParticipants; ++i) {
    const auto dir = root / ("participant-" + std::to_string(i));
    participants.push_back(
        std::make_unique<keyspan::PoolCoordinator>(context_for(dir, clock), ledger, server, keyspan::CoordinatorOptions{}));
    assert(participants.back()->initialize().ok);
  }

  std::mutex results_mutex;
  std::vector<std::string> granted;
  std::atomic<int> rejected{0};
  std::vector<std::thread> threads;
  for (int i = 0; i < kParticipants; ++i) {
    threads.emplace_back([&, i] {
      keyspan::Assignment assignment;
      const auto result = participants[static_cast<std::size_t>(i)]->request_assignment(assignment);
      if (result.ok) {
        std::lock_guard lock(results_mutex);
        granted.push_back(assignment.range_id);
      } else {
        rejected.fetch_add(1);
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }

  const std::set<std::string> unique(granted.begin(), granted.end());
  assert(granted.size() == kRanges);
  assert(unique.size() == kRanges);
  assert(rejected.load() == kParticipants - static_cast<int>(kRanges));
  for (const auto& entry : ledger.snapshot()) {
    assert(entry.range.status == keyspan::RangeStatus::Active);
  }
}

void test_same_range_concurrent_updates() {
  const auto dir = temp_dir("concurrent-updates");
  FakeClock clock;
  const auto context = context_for(dir, clock);
  keyspan::ProgressLedger ledger;
  assert(ledger.open(context).ok);
  assert(ledger.register_range(make_range("shared", 0, 1000000)).ok);
  assert(ledger.register_range(make_range("other", 1000000, 2000000)).ok);

  std::atomic<std::uint64_t> highest_accepted{0};
  std::vector<std::thread> threads;
  for (int t = 0; t < 8; ++t) {
    threads.emplace_back([&, t] {
      for (std::uint64_t step = 1; step <= 50; ++step) {
        const std::uint64_t value = step * 1000 + static_cast<std::uint64_t>(t);
        keyspan::ProgressRecord record;
        const auto result = ledger.update(t % 2 == 0 ? "shared" : "other", key(value), 1e9, record);
        if (result.ok && t % 2 == 0) {
          std::uint64_t seen = highest_accepted.load();
          while (seen < value && !highest_accepted.compare_exchange_weak(seen, value)) {
          }
        } else if (!result.ok) {
          assert(result.code == keyspan::ErrorCode::Validation);
        }
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }

  const auto shared = ledger.find("shared");
  assert(shared.has_value());
  assert(shared->progress.searched_keys == key(highest_accepted.load()));
  assert(shared->progress.searched_keys <= shared->progress.total_keys);

  keyspan::ProgressLedger reopened;
  assert(reopened.open(context).ok);
  assert(reopened.find("shared")->progress.searched_keys == shared->progress.searched_keys);
  assert(reopened.find("other")->progress.searched_keys == ledger.find("other")->progress.searched_keys);
}

void test_expired_assignment_is_reassigned() {
  const auto root = temp_dir("expiry");
  FakeClock clock;
  keyspan::ProgressLedger ledger;
  assert(ledger.open(context_for(root / "pool", clock)).ok);
  assert(ledger.register_range(make_range("only", 0, 10000)).ok);
  keyspan::LocalPoolServer server(ledger, keyspan::AdaptiveScheduler{});
  assert(server.open(context_for(root / "pool", clock)).ok);

  keyspan::PoolCoordinator alice(context_for(root / "alice", clock), ledger, server);
  keyspan::PoolCoordinator bob(context_for(root / "bob", clock), ledger, server);
  assert(alice.initialize().ok);
  assert(bob.initialize().ok);

  keyspan::Assignment first;
  assert(alice.request_assignment(first).ok);
  assert(first.range_id == "only");
  keyspan::Assignment blocked;
  const auto busy = bob.request_assignment(blocked);
  assert(!busy.ok && busy.code == keyspan::ErrorCode::NotFound);

  clock.advance(10);
  assert(alice.report_progress(key(100), 1e9).ok);

  // Default lease: 300 s interval x 2.0 grace.
  clock.advance(700);
  const auto ticked = server.tick(std::chrono::milliseconds(500));
  assert(ticked.ok && ticked.data == "1");
  assert(ledger.find("only")->range.status == keyspan::RangeStatus::Pending);
  bool saw_expired = false;
  for (const auto& record : server.assignments()) {
    saw_expired = saw_expired || (record.assignment.assignment_id == first.assignment_id &&
                                  record.state == keyspan::AssignmentState::Expired);
  }
  assert(saw_expired);

  keyspan::Assignment second;
  assert(bob.request_assignment(second).ok);
  assert(second.range_id == "only");
  assert(second.assignment_id != first.assignment_id);
  assert(ledger.find("only")->progress.searched_keys == key(100));

  assert(ledger.find("only")->progress.holder == second.assignment_id);

  // The reaped participant must not move bob's counters.
  const auto stale = alice.report_progress(key(9000), 1e9);
  assert(!stale.ok && stale.code == keyspan::ErrorCode::InvalidState);
  assert(ledger.find("only")->progress.searched_keys == key(100));
  assert(ledger.find("only")->range.status == keyspan::RangeStatus::Active);
  assert(!alice.current_assignment().has_value());
  assert(bob.current_assignment().has_value());
  assert(bob.report_progress(key(300), 1e9).ok);
  assert(ledger.find("only")->progress.searched_keys == key(300));
}

void test_stale_holder_cannot_complete_or_abandon() {
  const auto root = temp_dir("stale-holder");
  FakeClock clock;
  keyspan::ProgressLedger ledger;
  assert(ledger.open(context_for(root / "pool", clock)).ok);
  assert(ledger.register_range(make_range("only", 0, 10000)).ok);
  keyspan::LocalPoolServer server(ledger, keyspan::AdaptiveScheduler{});
  assert(server.open(context_for(root / "pool", clock)).ok);

  keyspan::PoolCoordinator alice(context_for(root / "alice", clock), ledger, server);
  keyspan::PoolCoordinator bob(context_for(root / "bob", clock), ledger, server);
  keyspan::PoolCoordinator carol(context_for(root / "carol", clock), ledger, server);
  keyspan::PoolCoordinator dave(context_for(root / "dave", clock), ledger, server);
  assert(alice.initialize().ok && bob.initialize().ok && carol.initialize().ok && dave.initialize().ok);

  const auto hand_over = [&](keyspan::PoolCoordinator& next) {
    clock.advance(700);
    assert(server.tick(std::chrono::milliseconds(500)).ok);
    keyspan::Assignment taken;
    assert(next.request_assignment(taken).ok);
    assert(taken.range_id == "only");
    return taken;
  };

  keyspan::Assignment first;
  assert(alice.request_assignment(first).ok);
  assert(alice.report_progress(key(100), 1e9).ok);

  const auto to_bob = hand_over(bob);
  const auto exhausted = alice.report_completion(false, "");
  assert(!exhausted.ok && exhausted.code == keyspan::ErrorCode::InvalidState);
  assert(!alice.current_assignment().has_value());
  auto entry = ledger.find("only");
  assert(entry->range.status == keyspan::RangeStatus::Active);
  assert(entry->progress.searched_keys == key(100));
  assert(entry->progress.holder == to_bob.assignment_id);

  const auto to_carol = hand_over(carol);
  const auto abandoned = bob.abandon_assignment("user_requested");
  assert(!abandoned.ok && abandoned.code == keyspan::ErrorCode::InvalidState);
  assert(!bob.current_assignment().has_value());
  entry = ledger.find("only");
  assert(entry->range.status == keyspan::RangeStatus::Active);
  assert(entry->progress.holder == to_carol.assignment_id);

  const auto to_dave = hand_over(dave);
  const auto found = carol.report_completion(true, "candidate 0x42");
  assert(!found.ok && found.code == keyspan::ErrorCode::InvalidState);
  entry = ledger.find("only");
  assert(entry->range.status == keyspan::RangeStatus::Active);
  assert(entry->progress.holder == to_dave.assignment_id);

  keyspan::ProgressRecord record;
  const auto direct = ledger.update("only", key(200), std::nullopt, record, to_bob.assignment_id);
  assert(!direct.ok && direct.code == keyspan::ErrorCode::InvalidState);
  assert(!ledger.release("only", to_carol.assignment_id).ok);
  assert(ledger.find("only")->range.status == keyspan::RangeStatus::Active);

  assert(dave.report_completion(false, "").ok);
  entry = ledger.find("only");
  assert(entry->range.status == keyspan::RangeStatus::Completed);
  assert(entry->progress.holder.empty());

  keyspan::ProgressLedger reopened;
  assert(reopened.open(context_for(root / "pool", clock)).ok);
  assert(reopened.find("only")->range.status == keyspan::RangeStatus::Completed);
}

void test_stats_fall_back_when_pool_unreachable() {
  const auto root = temp_dir("stale-stats");
  FakeClock clock;
  keyspan::ProgressLedger ledger;
  assert(ledger.open(context_for(root / "pool", clock)).ok);
  assert(ledger.register_range(make_range("r0", 0, 1000)).ok);
  assert(ledger.register_range(make_range("r1", 1000, 2000)).ok);
  keyspan::LocalPoolServer server(ledger, keyspan::AdaptiveScheduler{});
  assert(server.open(context_for(root / "pool", clock)).ok);

  FlakyRemote remote(server);
  keyspan::PoolCoordinator coordinator(context_for(root / "me", clock), ledger, remote);
  assert(coordinator.initialize().ok);

  keyspan::Assignment assignment;
  assert(coordinator.request_assignment(assignment).ok);
  assert(coordinator.report_progress(key(500), 1e9).ok);

  keyspan::PoolStats live;
  assert(coordinator.get_stats(live).ok);
  assert(!live.stale);
  assert(live.participant_count == 1);
  assert(live.your_contribution.has_value());
  assert(live.your_contribution->keys_searched == key(500));
  assert(live.your_contribution->rank == 1);

  remote.set_online(false);
  const auto offline_report = coordinator.report_progress(key(700), 1e9);
  assert(offline_report.ok);
  assert(coordinator.pending_sync());
  assert(ledger.find(assignment.range_id)->progress.searched_keys == key(700));

  keyspan::PoolStats cached;
  assert(coordinator.get_stats(cached).ok);
  assert(cached.stale);
  assert(cached.participant_count == 1);

  keyspan::PoolCoordinator restarted(context_for(root / "me", clock), ledger, remote);
  assert(restarted.initialize().ok);
  assert(restarted.config().client_id == coordinator.config().client_id);
  assert(restarted.current_assignment().has_value());
  keyspan::PoolStats persisted;
  assert(restarted.get_stats(persisted).ok);
  assert(persisted.stale);
  assert(persisted.participant_count == 1);
  assert(persisted.your_contribution.has_value());

  keyspan::PoolCoordinator cold(context_for(root / "cold", clock), ledger, remote);
  assert(cold.initialize().ok);
  keyspan::PoolStats derived;
  assert(cold.get_stats(derived).ok);
  assert(derived.stale);
  assert(derived.participant_count == 0);
  assert(derived.searched_hundredths == keyspan::percent_hundredths(key(700), key(2000)));
}

void test_auto_report_flushes_on_stop() {
  const auto root = temp_dir("auto-report");
  FakeClock clock;
  keyspan::ProgressLedger ledger;
  assert(ledger.open(context_for(root / "pool", clock)).ok);
  assert(ledger.register_range(make_range("r", 0, 1000)).ok);
  keyspan::LocalPoolServer server(ledger, keyspan::AdaptiveScheduler{});
  assert(server.open(context_for(root / "pool", clock)).ok);

  keyspan::CoordinatorOptions options;
  options.tick = std::chrono::milliseconds(10);
  keyspan::PoolCoordinator coordinator(context_for(root / "me", clock), ledger, server, options);
  assert(coordinator.initialize().ok);
  keyspan::Assignment assignment;
  assert(coordinator.request_assignment(assignment).ok);

  std::atomic<std::uint64_t> worker_keys{42};
  const auto started = coordinator.start_auto_reporting([&worker_keys]() -> std::optional<keyspan::ProgressSnapshot> {
    return keyspan::ProgressSnapshot{BigKey{worker_keys.load()}, 1e9};
  });
  assert(started.ok);
  assert(coordinator.auto_reporting());
  assert(coordinator.start_auto_reporting([] { return std::optional<keyspan::ProgressSnapshot>{}; }).ok);

  std::this_thread::sleep_for(std::chrono::milliseconds(30));
  const auto stop_begin = std::chrono::steady_clock::now();
  coordinator.stop_auto_reporting();
  const auto stop_elapsed = std::chrono::steady_clock::now() - stop_begin;
  assert(stop_elapsed < std::chrono::seconds(2));
  assert(!coordinator.auto_reporting());
  assert(ledger.find("r")->progress.searched_keys == key(42));

  coordinator.stop_auto_reporting();
}

void test_find_completes_overlapping_ranges() {
  const auto root = temp_dir("found");
  FakeClock clock;
  keyspan::ProgressLedger ledger;
  assert(ledger.open(context_for(root / "pool", clock)).ok);
  assert(ledger.register_range(make_range("a", 0, 100)).ok);
  assert(ledger.register_range(make_range("b", 50, 150)).ok);
  assert(ledger.register_range(make_range("c", 150, 250)).ok);
  keyspan::LocalPoolServer server(ledger, keyspan::AdaptiveScheduler{});
  assert(server.open(context_for(root / "pool", clock)).ok);

  keyspan::PoolCoordinator coordinator(context_for(root / "me", clock), ledger, server);
  assert(coordinator.initialize().ok);
  keyspan::Assignment assignment;
  assert(coordinator.request_assignment(assignment).ok);
  assert(assignment.range_id == "a");
  assert(coordinator.report_completion(true, "candidate 0x42").ok);

  assert(ledger.find("a")->range.status == keyspan::RangeStatus::Completed);
  assert(ledger.find("b")->range.status == keyspan::RangeStatus::Completed);
  assert(ledger.find("c")->range.status == keyspan::RangeStatus::Pending);
  assert(!coordinator.current_assignment().has_value());
}

void test_abandon_releases_range() {
  const auto root = temp_dir("abandon");
  FakeClock clock;
  keyspan::ProgressLedger ledger;
  assert(ledger.open(context_for(root / "pool", clock)).ok);
  assert(ledger.register_range(make_range("r0", 0, 1000)).ok);
  assert(ledger.register_range(make_range("r1", 1000, 2000)).ok);
  keyspan::LocalPoolServer server(ledger, keyspan::AdaptiveScheduler{});
  assert(server.open(context_for(root / "pool", clock)).ok);

  keyspan::PoolCoordinator first(context_for(root / "first", clock), ledger, server);
  keyspan::PoolCoordinator second(context_for(root / "second", clock), ledger, server);
  assert(first.initialize().ok);
  assert(second.initialize().ok);

  const auto nothing = first.abandon_assignment("user_requested");
  assert(!nothing.ok && nothing.code == keyspan::ErrorCode::InvalidState);

  keyspan::Assignment assignment;
  assert(first.request_assignment(assignment).ok);
  assert(assignment.range_id == "r0");
  assert(first.report_progress(key(100), 1e9).ok);
  assert(first.abandon_assignment("user_requested").ok);
  assert(!first.current_assignment().has_value());

  const auto released = ledger.find("r0");
  assert(released->range.status == keyspan::RangeStatus::Pending);
  assert(released->progress.searched_keys == key(100));
  assert(!released->progress.estimated_completion_unix.has_value());

  keyspan::Assignment taken;
  assert(second.request_assignment(taken).ok);
  assert(taken.range_id == "r0");
}

void test_end_to_end_custom_range_flow() {
  const auto dir = temp_dir("e2e");
  FakeClock clock;

  keyspan::CoreApi api;
  assert(api.init({.data_dir = dir.string(), .clock = clock.fn()}).ok);

  keyspan::Assignment before_init;
  const auto not_ready = api.request(before_init);
  assert(!not_ready.ok && not_ready.code == keyspan::ErrorCode::InvalidState);

  const auto start = BigKey::parse("0x1000");
  const auto end = BigKey::parse("0x2000");
  const auto initialized = api.pool_init(keyspan::CustomRange{*start, *end});
  assert(initialized.ok);
  assert(initialized.data.starts_with("client_"));
  assert(api.coordinator().config().scan_type == keyspan::ScanType::CustomRange);
  assert(std::filesystem::exists(dir / keyspan::kPoolConfigFile));

  keyspan::Assignment assignment;
  assert(api.request(assignment).ok);
  assert(assignment.range_id == "custom_1000_2000");
  assert(assignment.start == *start && assignment.end == *end);
  assert(std::filesystem::exists(dir / keyspan::kPoolAssignmentFile));

  const auto reported = api.report(*BigKey::parse("0x800"), 1e9);
  assert(reported.ok);
  assert(reported.data == "50.00");

  const auto completed = api.complete(false, "");
  assert(completed.ok);
  const auto entry = api.ledger().find("custom_1000_2000");
  assert(entry->range.status == keyspan::RangeStatus::Completed);
  assert(entry->progress.searched_keys == entry->progress.total_keys);
  assert(!std::filesystem::exists(dir / keyspan::kPoolAssignmentFile));

  keyspan::Assignment again;
  const auto exhausted = api.request(again);
  assert(!exhausted.ok && exhausted.code == keyspan::ErrorCode::NotFound);

  keyspan::PoolStats stats;
  assert(api.stats(stats).ok);
  assert(stats.ranges_completed == 1);
  assert(stats.keyspace_covered_hundredths == 10000);

  Json::Value history;
  assert(keyspan::codec::read_file((dir / keyspan::kPoolProgressFile).string(), history).ok);
  assert(history.isArray() && history.size() >= 4);
}

void test_core_api_plan_and_status() {
  const auto dir = temp_dir("plan");
  FakeClock clock;
  keyspan::CoreApi api;
  assert(api.init({.data_dir = dir.string(), .clock = clock.fn()}).ok);

  keyspan::KeyspaceConfig keyspace;
  keyspace.range_min = key(0);
  keyspace.range_max = key(9999);
  keyspace.target_id = "puzzle-71";
  keyspan::Manifest manifest;
  assert(api.plan({}, keyspace, manifest).ok);
  assert(std::filesystem::exists(dir / keyspan::kManifestFile));
  const auto loaded = api.manifest();
  assert(loaded.has_value());
  assert(loaded->core.end == key(9000));
  assert(loaded->keyspace.target_id == "puzzle-71");

  keyspan::Manifest second;
  const auto replanned = api.plan({}, keyspace, second);
  assert(!replanned.ok && replanned.code == keyspan::ErrorCode::InvalidState);

  keyspan::ProgressRecord record;
  assert(api.update("gpu_0", key(750), 2e9, record).ok);
  assert(record.percent_hundredths == 5000);

  std::vector<keyspan::KeyRange> children;
  assert(api.split("fallback_0", 4, children).ok);
  assert(children.size() == 4);

  keyspan::AdaptiveStrategy strategy;
  assert(api.strategy(strategy).ok);
  assert(strategy.current_ranges.size() == 1);
  assert(strategy.current_ranges.front().score == 70);
  assert(std::filesystem::exists(dir / keyspan::kStrategyFile));

  assert(api.pool_init(std::nullopt).ok);
  keyspan::Assignment assignment;
  assert(api.request(assignment).ok);
  assert(assignment.target_id == "puzzle-71");
  assert(assignment.range_id.starts_with("gpu_"));
}


void test_unreported_rate_is_not_slow() {
  const auto dir = temp_dir("scheduler-rate");
  FakeClock clock;
  keyspan::ProgressLedger ledger;
  assert(ledger.open(context_for(dir, clock)).ok);
  assert(ledger.register_range(make_range("r1", 0, 1000000)).ok);
  assert(ledger.activate("r1", "asg_test").ok);

  const keyspan::AdaptiveScheduler scheduler;
  const auto has_slow = [&scheduler, &ledger, &clock] {
    const auto lines = scheduler.recommendations(ledger.snapshot(), clock.now->load() + 60);
    return std::ranges::any_of(lines, [](const std::string& line) { return line.find("slow") != std::string::npos; });
  };
  assert(ledger.find("r1")->progress.search_rate == 0.0);
  assert(!has_slow());

  keyspan::ProgressRecord record;
  assert(ledger.update("r1", key(10), 1000.0, record, "asg_test").ok);
  assert(has_slow());
}

void test_storage_root_lock_is_exclusive() {
  const auto dir = temp_dir("lock");
  FakeClock clock;
  {
    keyspan::CoreApi first;
    assert(first.init({.data_dir = dir.string(), .clock = clock.fn()}).ok);

    const auto begin = std::chrono::steady_clock::now();
    keyspan::CoreApi second;
    const auto refused = second.init({.data_dir = dir.string(), .clock = clock.fn()});
    assert(!refused.ok && refused.code == keyspan::ErrorCode::Unavailable);
    assert(std::chrono::steady_clock::now() - begin < std::chrono::seconds(2));

    keyspan::DirectoryLock lock;
    const auto held = lock.acquire((dir / keyspan::kLockFile).string(), true);
    assert(!held.ok && held.code == keyspan::ErrorCode::Unavailable);
    assert(!lock.held());
  }

  keyspan::CoreApi after;
  assert(after.init({.data_dir = dir.string(), .clock = clock.fn()}).ok);
}

void test_ledger_save_failure_keeps_memory() {
  const auto dir = temp_dir("ledger-save-failure");
  FakeClock clock;
  const auto context = context_for(dir, clock);
  const auto file = dir / keyspan::kProgressFile;

  {
    keyspan::ProgressLedger ledger;
    assert(ledger.open(context).ok);
    assert(ledger.register_range(make_range("r1", 0, 1000)).ok);

    // A directory in place of the ledger file makes the atomic rename fail.
    std::filesystem::remove(file);
    std::filesystem::create_directory(file);

    keyspan::ProgressRecord record;
    const auto failed = ledger.update("r1", key(500), std::nullopt, record);
    assert(!failed.ok && failed.code == keyspan::ErrorCode::Io);
    assert(ledger.find("r1")->progress.searched_keys == key(500));
    for (const auto& item : std::filesystem::directory_iterator(dir)) {
      assert(!item.path().filename().string().starts_with(std::string{keyspan::kProgressFile} + ".tmp"));
    }

    std::filesystem::remove(file);
    assert(ledger.update("r1", key(600), std::nullopt, record).ok);
  }

  keyspan::ProgressLedger reopened;
  assert(reopened.open(context).ok);
  assert(reopened.find("r1")->progress.searched_keys == key(600));
}

void test_damaged_stats_cache_falls_back() {
  const auto root = temp_dir("stats-cache");
  FakeClock clock;
  keyspan::ProgressLedger ledger;
  assert(ledger.open(context_for(root / "pool", clock)).ok);
  assert(ledger.register_range(make_range("r0", 0, 1000)).ok);
  keyspan::LocalPoolServer server(ledger, keyspan::AdaptiveScheduler{});
  assert(server.open(context_for(root / "pool", clock)).ok);

  FlakyRemote remote(server);
  {
    keyspan::PoolCoordinator coordinator(context_for(root / "me", clock), ledger, remote);
    assert(coordinator.initialize().ok);
    keyspan::PoolStats live;
    assert(coordinator.get_stats(live).ok);
    assert(live.participant_count == 1);
  }
  const auto cache = root / "me" / keyspan::kPoolStatsFile;
  assert(std::filesystem::exists(cache));
  remote.set_online(false);

  const std::vector<std::string> damaged = {
      R"({"participants": [], "keyspace_covered_hundredths": 0, "searched_hundredths": 0, "as_of_unix": 1, "stale": "yes"})",
      R"({"participants": [], "as_of_unix": 18446744073709551615})",
      R"({"participants": ["not an object"]})",
      "{{{",
  };
  for (const auto& text : damaged) {
    {
      std::ofstream out(cache, std::ios::trunc);
      out << text;
    }
    keyspan::PoolCoordinator restarted(context_for(root / "me", clock), ledger, remote);
    assert(restarted.initialize().ok);
    keyspan::PoolStats derived;
    assert(restarted.get_stats(derived).ok);
    assert(derived.stale);
    assert(derived.participant_count == 0);
    assert(derived.participants.empty());
  }
}

void test_expired_records_are_bounded() {
  keyspan::AssignmentTable table;
  const auto range = make_range("r", 0, 100);
  for (std::int64_t cycle = 0; cycle < 300; ++cycle) {
    const std::int64_t now = cycle * 1000;
    keyspan::Assignment claimed;
    assert(table.try_claim(range, "c1", "", now, 10, claimed).ok);
    const auto expired = table.reap_expired(now + 20);
    assert(expired.size() == 1 && expired.front().assignment.assignment_id == claimed.assignment_id);
    assert(table.records().size() <= keyspan::AssignmentTable::kRetainedClosedRecords);
  }
  assert(table.records().size() == keyspan::AssignmentTable::kRetainedClosedRecords);

  keyspan::Assignment live;
  assert(table.try_claim(range, "c2", "", 400000, 600, live).ok);
  assert(table.records().size() == keyspan::AssignmentTable::kRetainedClosedRecords + 1);
  assert(table.find(live.assignment_id).has_value());
}

int run_quiet(std::vector<std::string> args) {
  std::ostringstream sink;
  std::streambuf* const out = std::cout.rdbuf(sink.rdbuf());
  std::streambuf* const err = std::cerr.rdbuf(sink.rdbuf());
  const int code = keyspan::app::run_cli(std::move(args));
  std::cout.rdbuf(out);
  std::cerr.rdbuf(err);
  return code;
}

void test_cli_exit_codes() {
  const auto dir = temp_dir("cli").string();
  const auto at = [&dir](std::vector<std::string> args) {
    args.insert(args.begin(), {"--data-dir", dir});
    return run_quiet(std::move(args));
  };

  assert(run_quiet({}) == 2);
  assert(run_quiet({"--bogus"}) == 2);
  assert(run_quiet({"--data-dir"}) == 2);
  assert(run_quiet({"--version"}) == 0);
  assert(at({"bogus"}) == 2);

  assert(at({"plan", "50", "40", "60", "xyz", "9999"}) == 2);
  assert(at({"plan", "fifty", "40", "60"}) == 2);
  assert(at({"plan", "50", "60", "40", "0", "9999"}) == 1);
  assert(at({"plan", "50", "40", "60", "0", "9999"}) == 0);
  assert(at({"plan", "50", "40", "60", "0", "9999"}) == 1);

  assert(at({"update", "no_such_range", "5"}) == 1);
  assert(at({"update", "gpu_0", "abc"}) == 2);
  assert(at({"update", "gpu_0", "10", "fast"}) == 2);
  assert(at({"update", "gpu_0", "10"}) == 0);
  assert(at({"split", "fallback_0", "0"}) == 1);
  assert(at({"split", "fallback_0", "two"}) == 2);
  assert(at({"status"}) == 0);

  assert(at({"request"}) == 1);
  assert(at({"init", "0x10"}) == 2);
  assert(at({"init"}) == 0);
  assert(at({"report", "10", "1e9"}) == 1);
  assert(at({"request"}) == 0);
  assert(at({"report", "ten", "1e9"}) == 2);
  assert(at({"complete", "ture"}) == 2);
  assert(at({"complete", "false"}) == 0);
  assert(at({"complete", "false"}) == 1);
  assert(at({"abandon"}) == 1);
  assert(at({"abandon", "a", "b"}) == 2);
  assert(at({"stats"}) == 0);
}

}  // namespace

int main() {
  test_big_key_codecs();
  test_partitioner_manifest();
  test_ledger_validation_and_persistence();
  test_ledger_rejects_corrupt_file();
  test_ledger_save_failure_keeps_memory();
  test_ledger_seed_from_manifest();
  test_scheduler_priority();
  test_scheduler_stall_detection();
  test_unreported_rate_is_not_slow();
  test_scheduler_select_next();
  test_split_range();
  test_assignment_table_claims();
  test_expired_records_are_bounded();
  test_concurrent_claims_are_exclusive();
  test_same_range_concurrent_updates();
  test_expired_assignment_is_reassigned();
  test_stale_holder_cannot_complete_or_abandon();
  test_stats_fall_back_when_pool_unreachable();
  test_damaged_stats_cache_falls_back();
  test_auto_report_flushes_on_stop();
  test_find_completes_overlapping_ranges();
  test_abandon_releases_range();
  test_end_to_end_custom_range_flow();
  test_core_api_plan_and_status();
  test_storage_root_lock_is_exclusive();
  test_cli_exit_codes();

  std::cout << "keyspan core tests passed\n";
  return 0;
}
