// File: src/events/change_event.cpp
#include "events/change_event.hpp"

namespace geochron {

const char* ToString(ChangeType type) {
    switch (type) {
        case ChangeType::INSERT: return "INSERT";
        case ChangeType::DELETE: return "DELETE";
        default: return "UNKNOWN";
    }
}

bool SubscriptionFilter::Matches(const ChangeEvent& event) const {
    if (record_kind && *record_kind != event.kind) {
        return false;
    }

    if (event.kind == RecordKind::TIME_SERIES) {
        return !series_id || *series_id == event.series_id;
    }

    if (bbox) {
        return event.bbox && bbox->Intersects(*event.bbox);
    }

    return true;
}

} // namespace geochron
