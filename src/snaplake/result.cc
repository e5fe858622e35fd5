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

#include "snaplake/result.h"

namespace snaplake {

std::string_view ErrorKindToString(ErrorKind kind) noexcept {
  switch (kind) {
    case ErrorKind::kAlreadyExists:
      return "AlreadyExists";
    case ErrorKind::kCorruptSnapshotReference:
      return "CorruptSnapshotReference";
    case ErrorKind::kHistoryAppendConflict:
      return "HistoryAppendConflict";
    case ErrorKind::kInvalidArgument:
      return "InvalidArgument";
    case ErrorKind::kInvalidHistory:
      return "InvalidHistory";
    case ErrorKind::kInvalidSchema:
      return "InvalidSchema";
    case ErrorKind::kIOError:
      return "IOError";
    case ErrorKind::kJsonParseError:
      return "JsonParseError";
    case ErrorKind::kMalformedLocator:
      return "MalformedLocator";
    case ErrorKind::kNoHistory:
      return "NoHistory";
    case ErrorKind::kNoSuchDatabase:
      return "NoSuchDatabase";
    case ErrorKind::kNoSuchTable:
      return "NoSuchTable";
    case ErrorKind::kNotAllowed:
      return "NotAllowed";
    case ErrorKind::kNotFound:
      return "NotFound";
    case ErrorKind::kNotImplemented:
      return "NotImplemented";
    case ErrorKind::kOperationCancelled:
      return "OperationCancelled";
    case ErrorKind::kReferenceNotHeld:
      return "ReferenceNotHeld";
    case ErrorKind::kSnapshotNotFound:
      return "SnapshotNotFound";
    case ErrorKind::kTableNameCollision:
      return "TableNameCollision";
    case ErrorKind::kUnknownError:
      return "UnknownError";
  }
  return "UnknownError";
}

}  // namespace snaplake
