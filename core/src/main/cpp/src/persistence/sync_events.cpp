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

#include "sync_events.h"
#include "../util/log.h"
#include <algorithm>
#include <stdexcept>

namespace vstore {
namespace persist {

const char* to_string(SyncEventKind kind) {
    switch (kind) {
        case SyncEventKind::Created:   return "created";
        case SyncEventKind::Deleted:   return "deleted";
        case SyncEventKind::Renamed:   return "renamed";
        case SyncEventKind::Recovered: return "recovered";
    }
    return "unknown";
}

const char* to_string(SyncState state) {
    switch (state) {
        case SyncState::Synced:        return "synced";
        case SyncState::PendingEvents: return "pending_events";
        case SyncState::OutOfSync:     return "out_of_sync";
    }
    return "unknown";
}

SyncEventQueue::SyncEventQueue(size_t capacity, Clock clock)
    : capacity_(capacity), clock_(std::move(clock)) {
    if (capacity_ == 0) {
        throw std::invalid_argument("sync queue capacity must be at least 1");
    }
}

SyncEvent SyncEventQueue::publish(SyncEventKind kind,
                                  const std::string& collection_id,
                                  std::map<std::string, std::string> details) {
    std::lock_guard<std::mutex> dispatch(dispatch_mu_);

    SyncEvent ev;
    {
        std::lock_guard<std::mutex> lock(mu_);
        ev.sequence = next_sequence_++;
        ev.event_id = "evt_" + std::to_string(ev.sequence);
        ev.kind = kind;
        ev.collection_id = collection_id;
        ev.timestamp_unix_ms = clock_();
        ev.details = std::move(details);

        if (events_.size() >= capacity_) {
            warn() << "Sync queue full (" << capacity_ << "), dropping event "
                   << events_.front().event_id;
            events_.pop_front();
            dropped_++;
        }
        events_.push_back(ev);
        published_++;
        last_event_unix_ms_ = ev.timestamp_unix_ms;
    }

    for (const auto& kv : listeners_) {
        try {
            kv.second(ev);
        } catch (const std::exception& e) {
            error() << "Sync listener " << kv.first << " failed on " << ev.event_id << ": " << e.what();
        }
    }

    debug() << "Sync event " << ev.event_id << " " << to_string(kind) << " " << collection_id;
    return ev;
}

std::vector<SyncEvent> SyncEventQueue::drain(size_t max) {
    std::lock_guard<std::mutex> lock(mu_);
    size_t n = std::min(max, events_.size());
    std::vector<SyncEvent> out(std::make_move_iterator(events_.begin()),
                               std::make_move_iterator(events_.begin() + n));
    events_.erase(events_.begin(), events_.begin() + n);
    return out;
}

std::vector<SyncEvent> SyncEventQueue::peek(size_t max) const {
    std::lock_guard<std::mutex> lock(mu_);
    size_t n = std::min(max, events_.size());
    return std::vector<SyncEvent>(events_.begin(), events_.begin() + n);
}

uint64_t SyncEventQueue::subscribe(Listener listener) {
    std::lock_guard<std::mutex> dispatch(dispatch_mu_);
    uint64_t token = next_token_++;
    listeners_[token] = std::move(listener);
    return token;
}

bool SyncEventQueue::unsubscribe(uint64_t token) {
    std::lock_guard<std::mutex> dispatch(dispatch_mu_);
    return listeners_.erase(token) != 0;
}

void SyncEventQueue::note_consistency(const ConsistencyReport& report) {
    std::lock_guard<std::mutex> lock(mu_);
    // Scoped reports only speak for their ids
    if (!report.scoped_ids.empty() && report.consistent()) {
        return;
    }
    last_consistency_ = report.status;
    last_check_unix_ms_ = report.generated_unix_ms;
}

SyncStatus SyncEventQueue::status() const {
    std::lock_guard<std::mutex> lock(mu_);
    SyncStatus s;
    s.pending = events_.size();
    s.dropped = dropped_;
    s.published = published_;
    s.last_sequence = next_sequence_ - 1;
    s.last_event_unix_ms = last_event_unix_ms_;
    s.last_consistency = last_consistency_;
    s.last_check_unix_ms = last_check_unix_ms_;

    if (last_consistency_ != ConsistencyStatus::Consistent) {
        s.sync_status = SyncState::OutOfSync;
    } else if (!events_.empty()) {
        s.sync_status = SyncState::PendingEvents;
    } else {
        s.sync_status = SyncState::Synced;
    }
    return s;
}

} // namespace persist
} // namespace vstore
