// File: src/events/change_event.hpp
#pragma once

#include "core/types.hpp"
#include <optional>
#include <string>

namespace geochron {

// ChangeType: What happened to the record
enum class ChangeType : uint8_t {
    INSERT = 0,
    DELETE = 1,
};

// Convert ChangeType to string
const char* ToString(ChangeType type);

/// Notification published after an accepted write
///
/// Feature events carry the bounding box; time-series events carry the
/// series, timestamp and value. Provenance and metadata are copied from the
/// record so subscribers need not consult the journal.
struct ChangeEvent {
    std::string database;
    ChangeType change{ChangeType::INSERT};
    RecordKind kind{RecordKind::FEATURE};
    std::string record_id;

    // FEATURE events
    std::optional<BoundingBox> bbox;

    // TIME_SERIES events
    std::string series_id;
    Timestamp timestamp{0};
    std::optional<double> value;

    Properties metadata;
    Properties provenance;

    /// Per-database publish sequence, assigned by the registry (starts at 1)
    uint64_t sequence{0};
};

/// Predicate over change events; empty fields match everything
struct SubscriptionFilter {
    std::optional<RecordKind> record_kind;

    /// Applies to time-series events only
    std::optional<std::string> series_id;

    /// Applies to feature events only (inclusive intersection)
    std::optional<BoundingBox> bbox;

    bool Matches(const ChangeEvent& event) const;
};

} // namespace geochron
