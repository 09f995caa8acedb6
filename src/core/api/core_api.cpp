#include "core/api/core_api.hpp"

#include <filesystem>
#include <system_error>
#include <utility>

#include "core/model/app_meta.hpp"
#include "core/storage/json_codec.hpp"

namespace keyspan {
namespace {

constexpr std::string_view kComponent = "api";

}  // namespace

CoreApi::~CoreApi() {
  if (coordinator_) {
    coordinator_->stop_auto_reporting();
  }
}

Result CoreApi::init(const InitConfig& config) {
  config_ = config;
  if (config_.data_dir.empty()) {
    return Result::failure(ErrorCode::Validation, "Init failed: data_dir is required.");
  }

  std::error_code ec;
  std::filesystem::create_directories(config_.data_dir, ec);
  if (ec) {
    return Result::failure(ErrorCode::Io, "Init failed: unable to create data_dir: " + ec.message());
  }

  context_.root = config_.data_dir;
  context_.now_unix = config_.clock;

  const Result locked = lock_.acquire(context_.path_for(kLockFile), true);
  if (!locked.ok) {
    return locked;
  }
  journal_.open(context_.path_for(kJournalFile), context_.now_unix);

  partitioner_ = KeyspacePartitioner{config_.partition};
  scheduler_ = AdaptiveScheduler{config_.scheduler};

  ledger_ = std::make_unique<ProgressLedger>();
  const Result ledger_open = ledger_->open(context_);
  if (!ledger_open.ok) {
    journal_.record(kComponent, "startup aborted: " + ledger_open.message);
    return ledger_open;
  }

  server_ = std::make_unique<LocalPoolServer>(*ledger_, scheduler_);
  const Result server_open = server_->open(context_);
  if (!server_open.ok) {
    journal_.record(kComponent, "startup aborted: " + server_open.message);
    return server_open;
  }
  if (const auto current = manifest(); current.has_value()) {
    server_->set_target_id(current->keyspace.target_id);
  }

  coordinator_ = std::make_unique<PoolCoordinator>(context_, *ledger_, *server_, config_.coordinator);
  pool_ready_ = false;
  return Result::success("Storage root " + context_.root + " opened.", ledger_open.data);
}

Result CoreApi::require_ready() const {
  if (!ledger_) {
    return Result::failure(ErrorCode::InvalidState, "Core is not initialized.");
  }
  return Result::success();
}

Result CoreApi::ensure_pool() {
  if (Result ready = require_ready(); !ready.ok) {
    return ready;
  }
  if (pool_ready_) {
    return Result::success();
  }
  std::error_code ec;
  if (!std::filesystem::exists(context_.path_for(kPoolConfigFile), ec)) {
    return Result::failure(ErrorCode::InvalidState, "Pool participant not initialized; run init first.");
  }
  const Result initialized = coordinator_->initialize();
  pool_ready_ = initialized.ok;
  return initialized;
}

Result CoreApi::plan(const ProbabilityEstimate& estimate, const KeyspaceConfig& keyspace, Manifest& out) {
  if (Result ready = require_ready(); !ready.ok) {
    return ready;
  }
  if (ledger_->seeded()) {
    return Result::failure(ErrorCode::InvalidState, "Ledger already holds ranges; refusing to re-plan.");
  }

  Manifest manifest;
  const Result generated = partitioner_.generate_manifest(keyspace, estimate, context_.now(), manifest);
  if (!generated.ok) {
    journal_.record(kComponent, "plan rejected: " + generated.message);
    return generated;
  }
  if (Result saved = codec::write_file_atomic(context_.path_for(kManifestFile), codec::encode_manifest(manifest));
      !saved.ok) {
    return saved;
  }
  if (Result seeded = ledger_->seed_from_manifest(manifest); !seeded.ok) {
    return seeded;
  }
  server_->set_target_id(manifest.keyspace.target_id);
  journal_.record(kComponent, "manifest generated with " +
                                  std::to_string(manifest.parallel_splits.size() + manifest.fallback.size()) +
                                  " assignable ranges.");
  out = std::move(manifest);
  return Result::success("Manifest generated and ledger seeded.");
}

Result CoreApi::update(std::string_view range_id, const BigKey& searched_keys, std::optional<double> rate,
                       ProgressRecord& out) {
  if (Result ready = require_ready(); !ready.ok) {
    return ready;
  }
  return ledger_->update(range_id, searched_keys, rate, out);
}

Result CoreApi::split(std::string_view range_id, std::size_t count, std::vector<KeyRange>& out) {
  if (Result ready = require_ready(); !ready.ok) {
    return ready;
  }
  return scheduler_.split_range(*ledger_, range_id, count, context_.now(), out);
}

Result CoreApi::strategy(AdaptiveStrategy& out) {
  if (Result ready = require_ready(); !ready.ok) {
    return ready;
  }
  AdaptiveStrategy built = scheduler_.build_strategy(ledger_->snapshot(), context_.now());
  if (Result saved = scheduler_.save_strategy(context_, built); !saved.ok) {
    return saved;
  }
  out = std::move(built);
  return Result::success("Adaptive strategy refreshed.");
}

Result CoreApi::pool_init(std::optional<CustomRange> custom_range) {
  if (Result ready = require_ready(); !ready.ok) {
    return ready;
  }
  const Result initialized = coordinator_->initialize(std::move(custom_range));
  pool_ready_ = initialized.ok;
  return initialized;
}

Result CoreApi::request(Assignment& out) {
  if (Result ready = ensure_pool(); !ready.ok) {
    return ready;
  }
  return coordinator_->request_assignment(out);
}

Result CoreApi::report(const BigKey& searched_keys, double search_rate) {
  if (Result ready = ensure_pool(); !ready.ok) {
    return ready;
  }
  return coordinator_->report_progress(searched_keys, search_rate);
}

Result CoreApi::complete(bool found, std::string_view evidence) {
  if (Result ready = ensure_pool(); !ready.ok) {
    return ready;
  }
  return coordinator_->report_completion(found, evidence);
}

Result CoreApi::abandon(std::string_view reason) {
  if (Result ready = ensure_pool(); !ready.ok) {
    return ready;
  }
  return coordinator_->abandon_assignment(reason);
}

Result CoreApi::stats(PoolStats& out) {
  if (Result ready = ensure_pool(); !ready.ok) {
    return ready;
  }
  return coordinator_->get_stats(out);
}

std::vector<LedgerEntry> CoreApi::ranges() const {
  if (!ledger_) {
    return {};
  }
  return ledger_->snapshot();
}

CoverageSummary CoreApi::coverage() const {
  if (!ledger_) {
    return {};
  }
  return ledger_->aggregate_coverage();
}

std::optional<Manifest> CoreApi::manifest() const {
  Json::Value root;
  if (!codec::read_file(context_.path_for(kManifestFile), root).ok) {
    return std::nullopt;
  }
  Manifest loaded;
  if (!codec::decode_manifest(root, loaded)) {
    journal_.record(kComponent, "range_manifest.json is unreadable.");
    return std::nullopt;
  }
  return loaded;
}

}  // namespace keyspan
