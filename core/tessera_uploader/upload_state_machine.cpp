// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "upload_state_machine.hpp"

#include <map>

namespace tessera {
namespace uploader {

namespace {

const std::map<UploadStatus, std::vector<UploadStatus>>& transitionTable() {
  static const std::map<UploadStatus, std::vector<UploadStatus>> table = {
    {UploadStatus::UPLOADING,
     {UploadStatus::PAUSED, UploadStatus::COMPLETED, UploadStatus::FAILED,
      UploadStatus::CANCELLED}},
    {UploadStatus::PAUSED,
     {UploadStatus::UPLOADING, UploadStatus::COMPLETED, UploadStatus::FAILED,
      UploadStatus::CANCELLED}},
    {UploadStatus::COMPLETED, {}},
    {UploadStatus::FAILED, {}},
    {UploadStatus::CANCELLED, {}},
  };
  return table;
}

}  // namespace

bool UploadStateMachine::isValidTransition(UploadStatus from, UploadStatus to) {
  for (auto status : validTransitions(from)) {
    if (status == to) {
      return true;
    }
  }
  return false;
}

bool UploadStateMachine::isTerminal(UploadStatus status) {
  return validTransitions(status).empty();
}

std::vector<UploadStatus> UploadStateMachine::validTransitions(UploadStatus from) {
  auto it = transitionTable().find(from);
  if (it == transitionTable().end()) {
    return {};
  }
  return it->second;
}

bool UploadStateMachine::transition(
  UploadSession& session, UploadStatus to, std::string& error_msg
) {
  if (!isValidTransition(session.status, to)) {
    error_msg = "ERR_INVALID_STATE: Cannot transition from " +
                uploadStatusToString(session.status) + " to " + uploadStatusToString(to);
    return false;
  }
  session.status = to;
  session.touch();
  return true;
}

}  // namespace uploader
}  // namespace tessera
