/*
 * Licensed to the Apache Software Foundation (ASF) under one
 * or more contributor license agreements.  See the NOTICE file
 * distributed with this work for additional information
 * regarding copyright ownership.  The ASF licenses this file
 * to you under the Apache License, Version 2.0 (the
 * "License"); you may not use this file except in compliance
 * with the License.  You may obtain a copy of the License at
 *
 *   http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing,
 * software distributed under the License is distributed on an
 * "AS IS" BASIS, WITHOUT WARRANTIES OR CONDITIONS OF ANY
 * KIND, either express or implied.  See the License for the
 * specific language governing permissions and limitations
 * under the License.
 */

#include "snaplake/engine.h"

#include <chrono>
#include <mutex>
#include <ranges>

#include "snaplake/exception.h"
#include "snaplake/util/formatter.h"  // IWYU pragma: keep
#include "snaplake/util/logging.h"
#include "snaplake/util/macros.h"

namespace snaplake {

namespace {

struct EngineSettings {
  std::string warehouse;
  std::string default_database;
  RetentionPolicy policy;
  int64_t min_snapshot_age_ms;
  std::string log_level;
};

Result<EngineSettings> ReadSettings(const EngineConfig& config) {
  EngineSettings settings;
  try {
    settings.warehouse = config.Get(EngineConfig::kWarehouse);
    settings.default_database = config.Get(EngineConfig::kDefaultDatabase);
    settings.min_snapshot_age_ms = config.Get(EngineConfig::kMinSnapshotAgeMs);
    settings.log_level = config.Get(EngineConfig::kLogLevel);
  } catch (const SnaplakeError& e) {
    return InvalidArgument("Invalid engine configuration: {}", e.what());
  }
  if (settings.warehouse.empty()) {
    return InvalidArgument("Engine configuration '{}' is required",
                           EngineConfig::kWarehouse.key());
  }
  if (settings.default_database.empty()) {
    return InvalidArgument("Engine configuration '{}' must not be empty",
                           EngineConfig::kDefaultDatabase.key());
  }
  if (settings.min_snapshot_age_ms < 0) {
    return InvalidArgument("Engine configuration '{}' must not be negative, was {}",
                           EngineConfig::kMinSnapshotAgeMs.key(),
                           settings.min_snapshot_age_ms);
  }
  SNAPLAKE_ASSIGN_OR_RAISE(
      settings.policy,
      RetentionPolicyFromString(config.Get(EngineConfig::kRetentionPolicy)));
  return settings;
}

}  // namespace

Result<std::unique_ptr<Engine>> Engine::Open(const EngineConfig& config,
                                             std::shared_ptr<FileIO> io) {
  if (io == nullptr) {
    return InvalidArgument("FileIO must not be null");
  }
  SNAPLAKE_ASSIGN_OR_RAISE(auto settings, ReadSettings(config));
  SNAPLAKE_RETURN_UNEXPECTED(SetLogLevel(settings.log_level));

  Logger()->info("Opening warehouse {} (retention policy: {})", settings.warehouse,
                 RetentionPolicyToString(settings.policy));
  auto store = std::make_shared<SnapshotStore>(io, settings.warehouse);
  SNAPLAKE_RETURN_UNEXPECTED(store->Open());
  auto history = std::make_shared<HistoryIndex>(io, settings.warehouse);
  auto tracker = std::make_shared<LivenessTracker>(store, settings.policy);
  auto catalog =
      std::make_shared<WarehouseCatalog>(io, settings.warehouse, history, tracker);
  SNAPLAKE_RETURN_UNEXPECTED(catalog->Open());
  if (!catalog->DatabaseExists(settings.default_database)) {
    SNAPLAKE_RETURN_UNEXPECTED(catalog->CreateDatabase(settings.default_database));
  }

  return std::unique_ptr<Engine>(
      new Engine(config, std::move(io), std::move(settings.default_database),
                 settings.min_snapshot_age_ms, std::move(store), std::move(history),
                 std::move(tracker), std::move(catalog)));
}

Engine::Engine(EngineConfig config, std::shared_ptr<FileIO> io,
               std::string default_database, int64_t min_snapshot_age_ms,
               std::shared_ptr<SnapshotStore> store,
               std::shared_ptr<HistoryIndex> history,
               std::shared_ptr<LivenessTracker> tracker,
               std::shared_ptr<WarehouseCatalog> catalog)
    : config_(std::move(config)),
      io_(std::move(io)),
      default_database_(std::move(default_database)),
      min_snapshot_age_ms_(min_snapshot_age_ms),
      store_(std::move(store)),
      history_(std::move(history)),
      tracker_(std::move(tracker)),
      catalog_(std::move(catalog)),
      resolver_(store_),
      orchestrator_(catalog_, store_, history_, tracker_) {}

Engine::~Engine() = default;

Status Engine::Close() {
  if (closed_.exchange(true)) {
    return NotAllowed("Engine is already closed");
  }
  Logger()->info("Closed warehouse {}", catalog_->warehouse());
  return {};
}

Status Engine::CheckOpen() const {
  if (closed_.load()) {
    return NotAllowed("Engine is closed");
  }
  return {};
}

TableIdentifier Engine::Qualify(const TableIdentifier& identifier) const {
  if (!identifier.database.empty()) {
    return identifier;
  }
  return TableIdentifier{.database = default_database_, .name = identifier.name};
}

Status Engine::CreateDatabase(const std::string& name, bool if_not_exists) {
  SNAPLAKE_RETURN_UNEXPECTED(CheckOpen());
  auto status = catalog_->CreateDatabase(name);
  if (!status && if_not_exists && status.error().kind == ErrorKind::kAlreadyExists) {
    return {};
  }
  return status;
}

Status Engine::DropDatabase(const std::string& name, bool if_exists) {
  SNAPLAKE_RETURN_UNEXPECTED(CheckOpen());
  if (name == WarehouseCatalog::kDefaultDatabase || name == default_database_) {
    return NotAllowed("Cannot drop the default database '{}'", name);
  }
  auto tables = catalog_->ListTables(name);
  if (!tables.has_value()) {
    if (if_exists && tables.error().kind == ErrorKind::kNoSuchDatabase) {
      return {};
    }
    return std::unexpected(tables.error());
  }
  for (const auto& table : tables.value()) {
    SNAPLAKE_RETURN_UNEXPECTED(
        DropTable(TableIdentifier{.database = name, .name = table}, /*if_exists=*/true));
  }
  return catalog_->DropDatabase(name);
}

Result<std::vector<std::string>> Engine::ListDatabases() const {
  SNAPLAKE_RETURN_UNEXPECTED(CheckOpen());
  return catalog_->ListDatabases();
}

Result<std::vector<std::string>> Engine::ListTables(const std::string& database) const {
  SNAPLAKE_RETURN_UNEXPECTED(CheckOpen());
  return catalog_->ListTables(database);
}

Result<TableId> Engine::CreateTable(const CreateTableRequest& request,
                                    std::stop_token stop_token) {
  SNAPLAKE_RETURN_UNEXPECTED(CheckOpen());
  auto identifier = Qualify(request.identifier);
  SNAPLAKE_ASSIGN_OR_RAISE(auto options, TableOptions::Make(request.options));

  if (request.if_not_exists) {
    auto existing = catalog_->GetEntry(identifier);
    if (existing.has_value()) {
      return existing.value()->metadata.table_id;
    }
  }

  auto created = options.HasSnapshotLocation()
                     ? CloneTable(identifier, request.schema, options,
                                  std::move(stop_token))
                     : CreateEmptyTable(identifier, request.schema, options);

  // Another statement may have created the table since the check above.
  if (!created.has_value() && request.if_not_exists &&
      created.error().kind == ErrorKind::kTableNameCollision) {
    auto existing = catalog_->GetEntry(identifier);
    if (existing.has_value()) {
      return existing.value()->metadata.table_id;
    }
  }
  return created;
}

Result<TableId> Engine::CloneTable(const TableIdentifier& identifier,
                                   const Schema& schema, const TableOptions& options,
                                   std::stop_token stop_token) {
  SNAPLAKE_ASSIGN_OR_RAISE(auto snapshot_id, resolver_.Resolve(options));
  TableDefinition definition{
      .identifier = identifier, .schema = schema, .options = options};
  return orchestrator_.Clone(definition, snapshot_id, std::move(stop_token));
}

Result<TableId> Engine::CreateEmptyTable(const TableIdentifier& identifier,
                                         const Schema& schema,
                                         const TableOptions& options) {
  SNAPLAKE_ASSIGN_OR_RAISE(auto reservation, catalog_->ReserveName(identifier));
  auto table_id = TableId::Generate();
  TableMetadata metadata{.table_id = table_id,
                         .identifier = identifier,
                         .location = catalog_->TableLocation(table_id),
                         .schema = schema,
                         .options = options.configs(),
                         .created_at = CurrentTimePointMs()};
  SNAPLAKE_RETURN_UNEXPECTED(
      catalog_->CommitTable(std::move(reservation), std::move(metadata)));
  Logger()->info("Created table {} ({})", identifier.ToString(),
                 table_id.ToString());
  return table_id;
}

Result<std::shared_ptr<Table>> Engine::LoadTable(
    const TableIdentifier& identifier) const {
  SNAPLAKE_RETURN_UNEXPECTED(CheckOpen());
  SNAPLAKE_ASSIGN_OR_RAISE(auto entry, catalog_->GetEntry(Qualify(identifier)));
  return std::make_shared<Table>(std::move(entry), store_, history_, tracker_);
}

Status Engine::DropTable(const TableIdentifier& identifier, bool if_exists) {
  SNAPLAKE_RETURN_UNEXPECTED(CheckOpen());
  auto qualified = Qualify(identifier);
  auto entry = catalog_->UnregisterTable(qualified);
  if (!entry.has_value()) {
    if (if_exists && (entry.error().kind == ErrorKind::kNoSuchTable ||
                      entry.error().kind == ErrorKind::kNoSuchDatabase)) {
      return {};
    }
    return std::unexpected(entry.error());
  }

  // Wait for an in-flight append; later appends see the dropped flag.
  const auto& table_id = entry.value()->metadata.table_id;
  std::lock_guard lock(entry.value()->commit_mutex);
  SNAPLAKE_ASSIGN_OR_RAISE(auto released, tracker_->ReleaseAll(table_id));
  // A ledger left behind by a failed purge belongs to no table and is purged
  // on the next open.
  SNAPLAKE_RETURN_UNEXPECTED(history_->Purge(table_id));
  Logger()->info("Dropped table {} ({}), released {} snapshot references",
                 qualified.ToString(), table_id.ToString(), released);
  return {};
}

Result<std::vector<HistoryRecord>> Engine::History(const std::string& database,
                                                   const std::string& table) const {
  SNAPLAKE_RETURN_UNEXPECTED(CheckOpen());
  SNAPLAKE_ASSIGN_OR_RAISE(auto entry, catalog_->GetEntry(Qualify(
                                           TableIdentifier{.database = database,
                                                           .name = table})));
  auto entries = history_->Entries(entry->metadata.table_id);
  std::vector<HistoryRecord> records;
  records.reserve(entries.size());
  for (const auto& history_entry : entries | std::views::reverse) {
    SNAPLAKE_ASSIGN_OR_RAISE(
        auto snapshot, store_->GetReferenced(history_entry.snapshot_id,
                                             entry->metadata.identifier.ToString()));
    records.push_back(HistoryRecord{
        .snapshot_id = snapshot->snapshot_id,
        .snapshot_location = Locator::For(snapshot->snapshot_id),
        .prev_snapshot_id = snapshot->parent_snapshot_id,
        .sequence_number = history_entry.sequence_number,
        .timestamp = history_entry.timestamp_ms,
        .data_file_count = snapshot->summary.total_data_files,
        .row_count = snapshot->summary.total_records,
        .bytes = snapshot->summary.total_file_size});
  }
  return records;
}

Result<SweepReport> Engine::Sweep() {
  return Sweep(CurrentTimePointMs() - std::chrono::milliseconds(min_snapshot_age_ms_));
}

Result<SweepReport> Engine::Sweep(TimePointMs older_than) {
  SNAPLAKE_RETURN_UNEXPECTED(CheckOpen());
  return tracker_->Sweep(*io_, older_than);
}

}  // namespace snaplake
