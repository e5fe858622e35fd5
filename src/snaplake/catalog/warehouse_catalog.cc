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

#include "snaplake/catalog/warehouse_catalog.h"

#include <algorithm>
#include <set>
#include <utility>

#include <nlohmann/json.hpp>

#include "snaplake/json_internal.h"
#include "snaplake/util/formatter.h"  // IWYU pragma: keep
#include "snaplake/util/json_util_internal.h"
#include "snaplake/util/logging.h"
#include "snaplake/util/macros.h"

namespace snaplake {

namespace {

constexpr std::string_view kRecordSuffix = ".json";
constexpr std::string_view kTempSuffix = ".tmp";

}  // namespace

struct WarehouseCatalog::Database {
  DatabaseMetadata metadata;
  std::map<std::string, std::shared_ptr<TableEntry>> tables;
  std::set<std::string> reservations;

  bool InUse(const std::string& table_name) const {
    return tables.contains(table_name) || reservations.contains(table_name);
  }
};

NameReservation::NameReservation(NameReservation&& other) noexcept
    : catalog_(std::exchange(other.catalog_, nullptr)),
      identifier_(std::move(other.identifier_)) {}

NameReservation& NameReservation::operator=(NameReservation&& other) noexcept {
  if (this != &other) {
    Release();
    catalog_ = std::exchange(other.catalog_, nullptr);
    identifier_ = std::move(other.identifier_);
  }
  return *this;
}

NameReservation::~NameReservation() { Release(); }

void NameReservation::Release() {
  if (catalog_ != nullptr) {
    catalog_->ReleaseName(identifier_);
    catalog_ = nullptr;
  }
}

WarehouseCatalog::WarehouseCatalog(std::shared_ptr<FileIO> io, std::string warehouse,
                                   std::shared_ptr<HistoryIndex> history,
                                   std::shared_ptr<LivenessTracker> tracker)
    : io_(std::move(io)),
      warehouse_(std::move(warehouse)),
      history_(std::move(history)),
      tracker_(std::move(tracker)) {}

WarehouseCatalog::~WarehouseCatalog() = default;

std::string WarehouseCatalog::DatabaseLocation(const std::string& name) const {
  return std::format("{}/{}/{}{}", warehouse_, kDatabaseDir, name, kRecordSuffix);
}

std::string WarehouseCatalog::MetadataLocation(const TableId& table_id) const {
  return std::format("{}/{}/{}{}", warehouse_, kMetadataDir, table_id, kRecordSuffix);
}

std::string WarehouseCatalog::IntentLocation(const TableId& table_id) const {
  return std::format("{}/{}/{}{}", warehouse_, kIntentDir, table_id, kRecordSuffix);
}

std::string WarehouseCatalog::TableLocation(const TableId& table_id) const {
  return std::format("{}/{}", warehouse_, table_id);
}

Status WarehouseCatalog::WriteRecord(const std::string& location,
                                     std::string_view content) {
  auto temp_location = std::format("{}{}", location, kTempSuffix);
  SNAPLAKE_RETURN_UNEXPECTED(io_->WriteFile(temp_location, content));
  if (auto status = io_->RenameFile(temp_location, location); !status) {
    if (auto cleanup = io_->DeleteFile(temp_location); !cleanup) {
      Logger()->warn("Failed to delete temporary record {}: {}", temp_location,
                     cleanup.error().message);
    }
    return std::unexpected<Error>(status.error());
  }
  return {};
}

// Returns the full locations of the records in a directory, removing
// temporary files left behind by interrupted writes.
Result<std::vector<std::string>> WarehouseCatalog::ListRecords(std::string_view dir) {
  auto dir_location = std::format("{}/{}", warehouse_, dir);
  SNAPLAKE_ASSIGN_OR_RAISE(auto names, io_->ListFiles(dir_location));
  std::vector<std::string> locations;
  for (const auto& name : names) {
    auto location = std::format("{}/{}", dir_location, name);
    if (name.ends_with(kTempSuffix)) {
      SNAPLAKE_RETURN_UNEXPECTED(io_->DeleteFile(location));
      continue;
    }
    if (name.ends_with(kRecordSuffix)) {
      locations.push_back(std::move(location));
    }
  }
  return locations;
}

Status WarehouseCatalog::Open() {
  std::unique_lock lock(mutex_);
  databases_.clear();
  SNAPLAKE_RETURN_UNEXPECTED(LoadDatabases());
  SNAPLAKE_RETURN_UNEXPECTED(LoadTables());
  SNAPLAKE_RETURN_UNEXPECTED(RecoverIntents());
  SNAPLAKE_RETURN_UNEXPECTED(PurgeOrphanLedgers());
  SNAPLAKE_RETURN_UNEXPECTED(RestoreReferences());

  size_t table_count = 0;
  for (const auto& [_, database] : databases_) {
    table_count += database->tables.size();
  }
  Logger()->info("Opened warehouse {} with {} databases and {} tables", warehouse_,
                 databases_.size(), table_count);
  return {};
}

Status WarehouseCatalog::LoadDatabases() {
  SNAPLAKE_ASSIGN_OR_RAISE(auto locations, ListRecords(kDatabaseDir));
  for (const auto& location : locations) {
    SNAPLAKE_ASSIGN_OR_RAISE(auto content, io_->ReadFile(location, std::nullopt));
    SNAPLAKE_ASSIGN_OR_RAISE(auto database,
                             ParseJson(content).and_then(DatabaseMetadataFromJson));
    auto name = database.name;
    databases_.emplace(name, std::make_unique<Database>(Database{.metadata = database}));
  }

  std::string default_database(kDefaultDatabase);
  if (!databases_.contains(default_database)) {
    DatabaseMetadata database{.name = default_database,
                              .created_at = CurrentTimePointMs()};
    SNAPLAKE_RETURN_UNEXPECTED(
        WriteRecord(DatabaseLocation(default_database), SafeDumpJson(ToJson(database))));
    databases_.emplace(default_database,
                       std::make_unique<Database>(Database{.metadata = database}));
  }
  return {};
}

Status WarehouseCatalog::LoadTables() {
  SNAPLAKE_ASSIGN_OR_RAISE(auto locations, ListRecords(kMetadataDir));
  for (const auto& location : locations) {
    SNAPLAKE_ASSIGN_OR_RAISE(auto content, io_->ReadFile(location, std::nullopt));
    auto metadata = ParseJson(content).and_then(TableMetadataFromJson);
    if (!metadata.has_value()) {
      Logger()->error("Cannot read table metadata {}: {}", location,
                      metadata.error().message);
      return std::unexpected<Error>(metadata.error());
    }

    const auto& identifier = metadata->identifier;
    auto it = databases_.find(identifier.database);
    if (it == databases_.end()) {
      Logger()->warn("Restoring missing database {} of table {}", identifier.database,
                     identifier.ToString());
      DatabaseMetadata database{.name = identifier.database,
                                .created_at = CurrentTimePointMs()};
      SNAPLAKE_RETURN_UNEXPECTED(WriteRecord(DatabaseLocation(database.name),
                                             SafeDumpJson(ToJson(database))));
      it = databases_
               .emplace(database.name,
                        std::make_unique<Database>(Database{.metadata = database}))
               .first;
    }
    auto& tables = it->second->tables;
    if (tables.contains(identifier.name)) {
      return InvalidArgument("Table {} is registered twice", identifier.ToString());
    }
    auto name = identifier.name;
    tables.emplace(std::move(name),
                   std::make_shared<TableEntry>(std::move(metadata.value())));
  }
  return {};
}

Status WarehouseCatalog::RecoverIntents() {
  std::unordered_set<TableId> live;
  for (const auto& [database_name, database] : databases_) {
    for (const auto& [table_name, entry] : database->tables) {
      live.insert(entry->metadata.table_id);
    }
  }

  SNAPLAKE_ASSIGN_OR_RAISE(auto locations, ListRecords(kIntentDir));
  for (const auto& location : locations) {
    auto name = location.substr(location.find_last_of('/') + 1);
    auto table_id =
        TableId::FromString(name.substr(0, name.size() - kRecordSuffix.size()));
    if (!table_id.has_value()) {
      Logger()->warn("Ignoring unexpected file {} in intent directory", location);
      continue;
    }
    if (live.contains(*table_id)) {
      Logger()->info("Clone of table {} was committed, removing its intent",
                     table_id->ToString());
    } else {
      Logger()->warn("Clone of table {} was interrupted, discarding its history",
                     table_id->ToString());
      SNAPLAKE_RETURN_UNEXPECTED(history_->Purge(*table_id));
    }
    SNAPLAKE_RETURN_UNEXPECTED(io_->DeleteFile(location));
  }
  return {};
}

Status WarehouseCatalog::PurgeOrphanLedgers() {
  std::unordered_set<TableId> live;
  for (const auto& [database_name, database] : databases_) {
    for (const auto& [table_name, entry] : database->tables) {
      live.insert(entry->metadata.table_id);
    }
  }
  SNAPLAKE_ASSIGN_OR_RAISE(auto table_ids, history_->ListTableIds());
  for (const auto& table_id : table_ids) {
    if (!live.contains(table_id)) {
      Logger()->warn("Purging history of unknown table {}", table_id.ToString());
      SNAPLAKE_RETURN_UNEXPECTED(history_->Purge(table_id));
    }
  }
  return {};
}

Status WarehouseCatalog::RestoreReferences() {
  for (const auto& [database_name, database] : databases_) {
    for (const auto& [table_name, entry] : database->tables) {
      const auto& table_id = entry->metadata.table_id;
      if (auto status = history_->Load(table_id); !status) {
        Logger()->error("History of table {} is invalid: {}",
                        entry->metadata.identifier.ToString(), status.error().message);
        return status;
      }
      for (const auto& history_entry : history_->Entries(table_id)) {
        auto status = tracker_->Acquire(table_id, history_entry.snapshot_id);
        if (!status && status.error().kind != ErrorKind::kAlreadyExists) {
          Logger()->error("Table {} references snapshot {} which cannot be retained: {}",
                          entry->metadata.identifier.ToString(),
                          history_entry.snapshot_id.ToString(), status.error().message);
        }
      }
    }
  }
  return {};
}

Status WarehouseCatalog::CreateDatabase(const std::string& name) {
  if (name.empty() || name.find('/') != std::string::npos) {
    return InvalidArgument("Invalid database name '{}'", name);
  }
  std::unique_lock lock(mutex_);
  if (databases_.contains(name)) {
    return AlreadyExists("Database {} already exists", name);
  }
  DatabaseMetadata database{.name = name, .created_at = CurrentTimePointMs()};
  SNAPLAKE_RETURN_UNEXPECTED(
      WriteRecord(DatabaseLocation(name), SafeDumpJson(ToJson(database))));
  databases_.emplace(name, std::make_unique<Database>(Database{.metadata = database}));
  Logger()->info("Created database {}", name);
  return {};
}

Status WarehouseCatalog::DropDatabase(const std::string& name) {
  if (name == kDefaultDatabase) {
    return NotAllowed("Cannot drop the default database");
  }
  std::unique_lock lock(mutex_);
  auto it = databases_.find(name);
  if (it == databases_.end()) {
    return NoSuchDatabase("Database {} does not exist", name);
  }
  if (!it->second->tables.empty() || !it->second->reservations.empty()) {
    return NotAllowed("Database {} is not empty", name);
  }
  SNAPLAKE_RETURN_UNEXPECTED(io_->DeleteFile(DatabaseLocation(name)));
  databases_.erase(it);
  Logger()->info("Dropped database {}", name);
  return {};
}

bool WarehouseCatalog::DatabaseExists(const std::string& name) const {
  std::shared_lock lock(mutex_);
  return databases_.contains(name);
}

std::vector<std::string> WarehouseCatalog::ListDatabases() const {
  std::shared_lock lock(mutex_);
  std::vector<std::string> names;
  names.reserve(databases_.size());
  for (const auto& [name, _] : databases_) {
    names.push_back(name);
  }
  return names;
}

Result<NameReservation> WarehouseCatalog::ReserveName(const TableIdentifier& identifier) {
  SNAPLAKE_RETURN_UNEXPECTED(identifier.Validate());
  std::unique_lock lock(mutex_);
  auto it = databases_.find(identifier.database);
  if (it == databases_.end()) {
    return NoSuchDatabase("Database {} does not exist", identifier.database);
  }
  if (it->second->InUse(identifier.name)) {
    return TableNameCollision("Table {} already exists", identifier.ToString());
  }
  it->second->reservations.insert(identifier.name);
  return NameReservation(this, identifier);
}

void WarehouseCatalog::ReleaseName(const TableIdentifier& identifier) {
  std::unique_lock lock(mutex_);
  auto it = databases_.find(identifier.database);
  if (it != databases_.end()) {
    it->second->reservations.erase(identifier.name);
  }
}

Result<std::shared_ptr<TableEntry>> WarehouseCatalog::CommitTable(
    NameReservation reservation, TableMetadata metadata) {
  if (!reservation.active() || reservation.catalog_ != this) {
    return InvalidArgument("Table {} was not reserved in this catalog",
                           metadata.identifier.ToString());
  }
  if (reservation.identifier() != metadata.identifier) {
    return InvalidArgument("Reservation of {} cannot commit table {}",
                           reservation.identifier().ToString(),
                           metadata.identifier.ToString());
  }

  SNAPLAKE_RETURN_UNEXPECTED(
      WriteRecord(MetadataLocation(metadata.table_id), SafeDumpJson(ToJson(metadata))));

  auto entry = std::make_shared<TableEntry>(std::move(metadata));
  const auto& identifier = entry->metadata.identifier;
  std::unique_lock lock(mutex_);
  auto& database = databases_.at(identifier.database);
  database->reservations.erase(identifier.name);
  database->tables.emplace(identifier.name, entry);
  // The name now belongs to the table.
  reservation.catalog_ = nullptr;
  Logger()->info("Committed table {} ({})", identifier.ToString(),
                 entry->metadata.table_id.ToString());
  return entry;
}

bool WarehouseCatalog::TableExists(const TableIdentifier& identifier) const {
  std::shared_lock lock(mutex_);
  auto it = databases_.find(identifier.database);
  return it != databases_.end() && it->second->tables.contains(identifier.name);
}

Result<std::vector<std::string>> WarehouseCatalog::ListTables(
    const std::string& database) const {
  std::shared_lock lock(mutex_);
  auto it = databases_.find(database);
  if (it == databases_.end()) {
    return NoSuchDatabase("Database {} does not exist", database);
  }
  std::vector<std::string> names;
  for (const auto& [name, _] : it->second->tables) {
    names.push_back(name);
  }
  return names;
}

Result<std::shared_ptr<TableEntry>> WarehouseCatalog::GetEntry(
    const TableIdentifier& identifier) const {
  std::shared_lock lock(mutex_);
  auto it = databases_.find(identifier.database);
  if (it == databases_.end()) {
    return NoSuchDatabase("Database {} does not exist", identifier.database);
  }
  auto table = it->second->tables.find(identifier.name);
  if (table == it->second->tables.end()) {
    return NoSuchTable("Table {} does not exist", identifier.ToString());
  }
  return table->second;
}

Result<std::shared_ptr<TableEntry>> WarehouseCatalog::UnregisterTable(
    const TableIdentifier& identifier) {
  std::unique_lock lock(mutex_);
  auto it = databases_.find(identifier.database);
  if (it == databases_.end()) {
    return NoSuchDatabase("Database {} does not exist", identifier.database);
  }
  auto& tables = it->second->tables;
  auto table = tables.find(identifier.name);
  if (table == tables.end()) {
    return NoSuchTable("Table {} does not exist", identifier.ToString());
  }
  auto entry = table->second;
  SNAPLAKE_RETURN_UNEXPECTED(io_->DeleteFile(MetadataLocation(entry->metadata.table_id)));
  tables.erase(table);
  entry->dropped = true;
  Logger()->info("Unregistered table {}", identifier.ToString());
  return entry;
}

Status WarehouseCatalog::WriteIntent(const TableIntent& intent) {
  return WriteRecord(IntentLocation(intent.table_id), SafeDumpJson(ToJson(intent)));
}

Status WarehouseCatalog::DeleteIntent(const TableId& table_id) {
  return io_->DeleteFile(IntentLocation(table_id));
}

}  // namespace snaplake
