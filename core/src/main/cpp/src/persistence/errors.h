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

#pragma once
#include <stdexcept>
#include <string>
#include <utility>

namespace vstore {
namespace persist {

enum class ErrorKind {
    None,
    NotFound,
    AlreadyExists,
    Integrity,            // post-op consistency failure or structural corruption
    StorageUnavailable,   // fail closed, nothing mutated
    IncompatibleVersion,  // mutations blocked until migration or override
    UnrecoverableState,   // rollback itself failed
    InvalidArgument,
    Internal
};

// Lifecycle of a transactional operation
enum class OperationPhase {
    Pending,
    Checkpointed,
    Executing,
    Verifying,
    Committed,
    RolledBack,
    Failed
};

enum class RollbackOutcome {
    NotAttempted,
    Succeeded,
    Failed
};

const char* to_string(ErrorKind kind);
const char* to_string(OperationPhase phase);
const char* to_string(RollbackOutcome outcome);

/**
 * Base of every error raised by the persistence layer.
 *
 * Carries the affected collection, how far the operation got and what
 * happened to its rollback so callers never see an opaque failure.
 */
class StoreError : public std::runtime_error {
public:
    StoreError(ErrorKind kind, const std::string& message,
               std::string collection_id = {},
               OperationPhase phase = OperationPhase::Pending,
               RollbackOutcome rollback = RollbackOutcome::NotAttempted)
        : std::runtime_error(message), kind_(kind),
          collection_id_(std::move(collection_id)),
          phase_(phase), rollback_(rollback) {}

    ErrorKind kind() const noexcept { return kind_; }
    const std::string& collection_id() const noexcept { return collection_id_; }
    OperationPhase phase() const noexcept { return phase_; }
    RollbackOutcome rollback() const noexcept { return rollback_; }

    void set_phase(OperationPhase phase) { phase_ = phase; }
    void set_rollback(RollbackOutcome rollback) { rollback_ = rollback; }

private:
    ErrorKind kind_;
    std::string collection_id_;
    OperationPhase phase_;
    RollbackOutcome rollback_;
};

class NotFoundError : public StoreError {
public:
    explicit NotFoundError(const std::string& message, std::string collection_id = {})
        : StoreError(ErrorKind::NotFound, message, std::move(collection_id)) {}
};

class AlreadyExistsError : public StoreError {
public:
    explicit AlreadyExistsError(const std::string& message, std::string collection_id = {})
        : StoreError(ErrorKind::AlreadyExists, message, std::move(collection_id)) {}
};

class IntegrityError : public StoreError {
public:
    explicit IntegrityError(const std::string& message, std::string collection_id = {})
        : StoreError(ErrorKind::Integrity, message, std::move(collection_id)) {}
};

class StorageUnavailableError : public StoreError {
public:
    explicit StorageUnavailableError(const std::string& message, std::string collection_id = {})
        : StoreError(ErrorKind::StorageUnavailable, message, std::move(collection_id)) {}
};

class IncompatibleVersionError : public StoreError {
public:
    explicit IncompatibleVersionError(const std::string& message, std::string collection_id = {})
        : StoreError(ErrorKind::IncompatibleVersion, message, std::move(collection_id)) {}
};

class UnrecoverableStateError : public StoreError {
public:
    UnrecoverableStateError(const std::string& message, std::string collection_id,
                            OperationPhase phase)
        : StoreError(ErrorKind::UnrecoverableState, message, std::move(collection_id),
                     phase, RollbackOutcome::Failed) {}
};

class InvalidArgumentError : public StoreError {
public:
    explicit InvalidArgumentError(const std::string& message, std::string collection_id = {})
        : StoreError(ErrorKind::InvalidArgument, message, std::move(collection_id)) {}
};

} // namespace persist
} // namespace vstore
