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
#include <cstdint>
#include <deque>
#include <functional>
#include <limits>
#include <map>
#include <mutex>
#include <string>
#include <vector>
#include "consistency_checker.h"
#include "../util/time_util.h"

namespace vstore {
namespace persist {

enum class SyncEventKind {
    Created,
    Deleted,
    Renamed,
    Recovered
};

const char* to_string(SyncEventKind kind);

struct SyncEvent {
    std::string event_id;
    uint64_t sequence = 0;
    SyncEventKind kind = SyncEventKind::Created;
    std::string collection_id;
    int64_t timestamp_unix_ms = 0;
    std::map<std::string, std::string> details;
};

enum class SyncState {
    Synced,
    PendingEvents,
    OutOfSync
};

const char* to_string(SyncState state);

struct SyncStatus {
    size_t   pending = 0;
    uint64_t dropped = 0;
    uint64_t published = 0;
    uint64_t last_sequence = 0;
    int64_t  last_event_unix_ms = 0;
    SyncState sync_status = SyncState::Synced;
    ConsistencyStatus last_consistency = ConsistencyStatus::Consistent;
    int64_t last_check_unix_ms = 0;
};

/**
 * Bounded, append-only queue of collection change events.
 *
 * Transports consume it by drain() (poll) or subscribe() (push). When the
 * queue is full the oldest pending event is discarded and counted in
 * SyncStatus::dropped. Listeners run on the publishing thread, in sequence
 * order, and must not publish themselves.
 */
class SyncEventQueue {
public:
    using Listener = std::function<void(const SyncEvent&)>;

    explicit SyncEventQueue(size_t capacity, Clock clock = system_clock());

    SyncEvent publish(SyncEventKind kind,
                      const std::string& collection_id,
                      std::map<std::string, std::string> details = {});

    std::vector<SyncEvent> drain(size_t max = std::numeric_limits<size_t>::max());
    std::vector<SyncEvent> peek(size_t max = std::numeric_limits<size_t>::max()) const;

    uint64_t subscribe(Listener listener);
    bool unsubscribe(uint64_t token);

    void note_consistency(const ConsistencyReport& report);
    SyncStatus status() const;

    size_t capacity() const { return capacity_; }

private:
    const size_t capacity_;
    Clock clock_;

    mutable std::mutex mu_;
    std::deque<SyncEvent> events_;
    uint64_t next_sequence_ = 1;
    uint64_t dropped_ = 0;
    uint64_t published_ = 0;
    int64_t last_event_unix_ms_ = 0;
    ConsistencyStatus last_consistency_ = ConsistencyStatus::Consistent;
    int64_t last_check_unix_ms_ = 0;

    // Held while listeners run so delivery order matches sequence order
    std::mutex dispatch_mu_;
    std::map<uint64_t, Listener> listeners_;
    uint64_t next_token_ = 1;
};

} // namespace persist
} // namespace vstore
