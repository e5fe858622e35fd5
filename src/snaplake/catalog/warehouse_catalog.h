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

#pragma once

/// \file snaplake/catalog/warehouse_catalog.h
/// Process-wide registry of databases and tables, persisted in the warehouse.

#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

#include "snaplake/file_io.h"
#include "snaplake/history_index.h"
#include "snaplake/liveness_tracker.h"
#include "snaplake/result.h"
#include "snaplake/snaplake_export.h"
#include "snaplake/table_identifier.h"
#include "snaplake/table_metadata.h"

namespace snaplake {

class WarehouseCatalog;

/// \brief A registered table.
///
/// Entries are shared with open Table handles; an entry outlives its
/// registration, and a handle learns about a drop through `dropped`.
struct SNAPLAKE_EXPORT TableEntry {
  explicit TableEntry(TableMetadata metadata) : metadata(std::move(metadata)) {}

  const TableMetadata metadata;
  /// Serializes state changes of the table: appends and drop.
  std::mutex commit_mutex;
  std::atomic<bool> dropped{false};
};

/// \brief Exclusive claim on a table name while the table is being built.
///
/// Move-only. The claim is released when the reservation is destroyed unless
/// it was consumed by WarehouseCatalog::CommitTable.
class SNAPLAKE_EXPORT NameReservation {
 public:
  NameReservation(NameReservation&& other) noexcept;
  NameReservation& operator=(NameReservation&& other) noexcept;
  NameReservation(const NameReservation&) = delete;
  NameReservation& operator=(const NameReservation&) = delete;
  ~NameReservation();

  const TableIdentifier& identifier() const { return identifier_; }

  /// \brief Whether the reservation still holds its name.
  bool active() const { return catalog_ != nullptr; }

  /// \brief Give up the name now.
  void Release();

 private:
  friend class WarehouseCatalog;

  NameReservation(WarehouseCatalog* catalog, TableIdentifier identifier)
      : catalog_(catalog), identifier_(std::move(identifier)) {}

  WarehouseCatalog* catalog_;
  TableIdentifier identifier_;
};

/// \brief Registry of databases and tables.
///
/// Database records live in `<warehouse>/_db/<name>.json`, table metadata in
/// `<warehouse>/_meta/<table id>.json` and clone intents in
/// `<warehouse>/_intent/<table id>.json`. Each record is written to a temporary
/// file and renamed into place.
///
/// A table becomes visible when its metadata is committed; it never changes
/// afterwards. Its current snapshot is tracked by the HistoryIndex.
class SNAPLAKE_EXPORT WarehouseCatalog {
 public:
  static constexpr std::string_view kDefaultDatabase = "default";
  static constexpr std::string_view kDatabaseDir = "_db";
  static constexpr std::string_view kMetadataDir = "_meta";
  static constexpr std::string_view kIntentDir = "_intent";

  WarehouseCatalog(std::shared_ptr<FileIO> io, std::string warehouse,
                   std::shared_ptr<HistoryIndex> history,
                   std::shared_ptr<LivenessTracker> tracker);
  ~WarehouseCatalog();

  /// \brief Load the persisted state and recover from interrupted operations.
  ///
  /// Intents whose table was committed are removed. Intents without committed
  /// metadata, and history ledgers that belong to no table, are purged. Then
  /// every live table's ledger is loaded and its reference edges re-acquired.
  /// A referenced snapshot that no longer exists is logged as corruption.
  Status Open();

  Status CreateDatabase(const std::string& name);

  /// \brief Drop an empty database. NotAllowed for the default database or
  /// while tables or reservations exist in it.
  Status DropDatabase(const std::string& name);

  bool DatabaseExists(const std::string& name) const;

  /// \brief Names of all databases, sorted.
  std::vector<std::string> ListDatabases() const;

  /// \brief Claim a table name.
  ///
  /// \return NoSuchDatabase if the database does not exist, TableNameCollision
  /// if a table or another reservation already uses the name.
  Result<NameReservation> ReserveName(const TableIdentifier& identifier);

  /// \brief Persist the metadata and publish the table under the reserved name.
  ///
  /// The metadata file is renamed into place before the table is published;
  /// this is the commit point of table creation.
  Result<std::shared_ptr<TableEntry>> CommitTable(NameReservation reservation,
                                                  TableMetadata metadata);

  bool TableExists(const TableIdentifier& identifier) const;

  /// \brief Table names of a database, sorted.
  Result<std::vector<std::string>> ListTables(const std::string& database) const;

  /// \brief NoSuchTable if the table is not registered.
  Result<std::shared_ptr<TableEntry>> GetEntry(const TableIdentifier& identifier) const;

  /// \brief Delete the metadata file and remove the table from the registry.
  ///
  /// The returned entry is marked dropped.
  Result<std::shared_ptr<TableEntry>> UnregisterTable(const TableIdentifier& identifier);

  /// \brief Persist a clone intent.
  Status WriteIntent(const TableIntent& intent);

  /// \brief Remove a clone intent.
  Status DeleteIntent(const TableId& table_id);

  /// \brief Base location of a table's data files.
  std::string TableLocation(const TableId& table_id) const;

  const std::string& warehouse() const { return warehouse_; }

  const std::shared_ptr<FileIO>& io() const { return io_; }

 private:
  friend class NameReservation;

  struct Database;

  void ReleaseName(const TableIdentifier& identifier);

  Status LoadDatabases();
  Status LoadTables();
  Status RecoverIntents();
  Status PurgeOrphanLedgers();
  Status RestoreReferences();

  Status WriteRecord(const std::string& location, std::string_view content);
  Result<std::vector<std::string>> ListRecords(std::string_view dir);

  std::string DatabaseLocation(const std::string& name) const;
  std::string MetadataLocation(const TableId& table_id) const;
  std::string IntentLocation(const TableId& table_id) const;

  std::shared_ptr<FileIO> io_;
  std::string warehouse_;
  std::shared_ptr<HistoryIndex> history_;
  std::shared_ptr<LivenessTracker> tracker_;
  mutable std::shared_mutex mutex_;
  std::map<std::string, std::unique_ptr<Database>> databases_;
};

}  // namespace snaplake
