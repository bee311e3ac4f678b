/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 *
 * The Lucenia project is free software: you can redistribute it
 * and/or modify it under the terms of the GNU Affero General
 * Public License as published by the Free Software Foundation,
 * either version 3 of the License, or (at your option) any later
 * version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
 * GNU Affero General Public License for more details.
 *
 * You should have received a copy of the GNU Affero General Public
 * License along with this program. If not, see:
 * https://www.gnu.org/licenses/agpl-3.0.html
 */

#include "errors.h"

namespace vstore {
namespace persist {

const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:                return "none";
        case ErrorKind::NotFound:            return "not_found";
        case ErrorKind::AlreadyExists:       return "already_exists";
        case ErrorKind::Integrity:           return "integrity";
        case ErrorKind::StorageUnavailable:  return "storage_unavailable";
        case ErrorKind::IncompatibleVersion: return "incompatible_version";
        case ErrorKind::UnrecoverableState:  return "unrecoverable_state";
        case ErrorKind::InvalidArgument:     return "invalid_argument";
        case ErrorKind::Internal:            return "internal";
    }
    return "unknown";
}

const char* to_string(OperationPhase phase) {
    switch (phase) {
        case OperationPhase::Pending:      return "pending";
        case OperationPhase::Checkpointed: return "checkpointed";
        case OperationPhase::Executing:    return "executing";
        case OperationPhase::Verifying:    return "verifying";
        case OperationPhase::Committed:    return "committed";
        case OperationPhase::RolledBack:   return "rolled_back";
        case OperationPhase::Failed:       return "failed";
    }
    return "unknown";
}

const char* to_string(RollbackOutcome outcome) {
    switch (outcome) {
        case RollbackOutcome::NotAttempted: return "not_attempted";
        case RollbackOutcome::Succeeded:    return "succeeded";
        case RollbackOutcome::Failed:       return "failed";
    }
    return "unknown";
}

} // namespace persist
} // namespace vstore
