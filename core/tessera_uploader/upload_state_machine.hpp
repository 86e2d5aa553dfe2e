// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef TESSERA_UPLOAD_STATE_MACHINE_HPP
#define TESSERA_UPLOAD_STATE_MACHINE_HPP

#include <string>
#include <vector>

#include "upload_session.hpp"

namespace tessera {
namespace uploader {

/**
 * Upload session state machine.
 *
 * State transitions:
 * - UPLOADING -> PAUSED:    pause command
 * - PAUSED -> UPLOADING:    resume / resume with file
 * - UPLOADING -> COMPLETED: every part recorded and finalized
 * - PAUSED -> COMPLETED:    interrupted resume finalizing from recorded parts
 * - UPLOADING/PAUSED -> FAILED
 * - UPLOADING/PAUSED -> CANCELLED
 *
 * COMPLETED, FAILED and CANCELLED are terminal. A failed upload is retried by
 * starting a new session for the same project.
 */
class UploadStateMachine {
public:
  static bool isValidTransition(UploadStatus from, UploadStatus to);

  static bool isTerminal(UploadStatus status);

  static std::vector<UploadStatus> validTransitions(UploadStatus from);

  /**
   * Move a session to a new status and bump its last_activity.
   *
   * @param session Session to update
   * @param to Target status
   * @param error_msg Output error message if the transition is invalid
   * @return true if the transition was applied
   */
  static bool transition(UploadSession& session, UploadStatus to, std::string& error_msg);
};

}  // namespace uploader
}  // namespace tessera

#endif  // TESSERA_UPLOAD_STATE_MACHINE_HPP
