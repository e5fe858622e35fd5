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

#include <iostream>

#include <arrow/api.h>

#include "snaplake/arrow/arrow_fs_file_io.h"
#include "snaplake/engine.h"
#include "snaplake/engine_config.h"
#include "snaplake/table.h"

int main(int argc, char** argv) {
  if (argc != 3) {
    std::cerr << "Usage: " << argv[0] << " <warehouse_location> <table_name>"
              << std::endl;
    return 0;
  }

  const std::string warehouse_location = argv[1];
  const std::string table_name = argv[2];
  const std::string clone_name = table_name + "_clone";

  auto config = snaplake::EngineConfig::FromMap({{"warehouse", warehouse_location}});
  auto engine_result = snaplake::Engine::Open(config, snaplake::arrow::MakeLocalFileIO());
  if (!engine_result.has_value()) {
    std::cerr << "Failed to open warehouse: " << engine_result.error().message
              << std::endl;
    return 1;
  }
  auto engine = std::move(engine_result.value());

  snaplake::Schema schema({snaplake::Column{.name = "c",
                                            .type = snaplake::ColumnType::kInt32}});
  auto create_result =
      engine->CreateTable({.identifier = {.name = table_name}, .schema = schema});
  if (!create_result.has_value()) {
    std::cerr << "Failed to create table: " << create_result.error().message
              << std::endl;
    return 1;
  }

  auto load_result = engine->LoadTable({.name = table_name});
  if (!load_result.has_value()) {
    std::cerr << "Failed to load table: " << load_result.error().message << std::endl;
    return 1;
  }
  auto table = std::move(load_result.value());

  arrow::Int32Builder builder;
  std::shared_ptr<arrow::Array> values;
  if (!builder.Append(1).ok() || !builder.Finish(&values).ok()) {
    std::cerr << "Failed to build input rows" << std::endl;
    return 1;
  }
  auto rows = arrow::Table::Make(arrow::schema({arrow::field("c", arrow::int32())}),
                                 {values});
  auto append_result = table->Append(*rows);
  if (!append_result.has_value()) {
    std::cerr << "Failed to append rows: " << append_result.error().message
              << std::endl;
    return 1;
  }

  auto history_result = engine->History("", table_name);
  if (!history_result.has_value()) {
    std::cerr << "Failed to read history: " << history_result.error().message
              << std::endl;
    return 1;
  }
  std::cout << "History of " << table_name << ": " << std::endl;
  for (const auto& record : history_result.value()) {
    std::cout << " - " << record.sequence_number << " " << record.snapshot_location
              << " (" << record.row_count << " rows)" << std::endl;
  }

  const auto& locator = history_result.value().front().snapshot_location;
  auto clone_result =
      engine->CreateTable({.identifier = {.name = clone_name},
                           .schema = schema,
                           .options = {{"SNAPSHOT_LOC", locator}}});
  if (!clone_result.has_value()) {
    std::cerr << "Failed to clone table: " << clone_result.error().message
              << std::endl;
    return 1;
  }

  auto drop_status = engine->DropTable({.name = table_name});
  if (!drop_status.has_value()) {
    std::cerr << "Failed to drop table: " << drop_status.error().message << std::endl;
    return 1;
  }

  auto clone = engine->LoadTable({.name = clone_name});
  if (!clone.has_value()) {
    std::cerr << "Failed to load clone: " << clone.error().message << std::endl;
    return 1;
  }
  auto scan_result = clone.value()->Scan();
  if (!scan_result.has_value()) {
    std::cerr << "Failed to scan clone: " << scan_result.error().message << std::endl;
    return 1;
  }
  std::cout << "Rows of " << clone_name << ": " << std::endl
            << scan_result.value()->ToString() << std::endl;

  return 0;
}
