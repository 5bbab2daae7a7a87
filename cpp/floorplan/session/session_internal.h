#pragma once

#include "floorplan/session/edit_session.h"

namespace floorplan {

// Marks the session busy for the lifetime of one edit. Edits issued while the flag is set
// (re-entrantly, from a persistence callback) are rejected with EditInProgress.
class EditSession::BusyScope {
public:
    explicit BusyScope(EditSession& session) : session_(session) { session_.busy_ = true; }
    ~BusyScope() { session_.busy_ = false; }

    BusyScope(const BusyScope&) = delete;
    BusyScope& operator=(const BusyScope&) = delete;

private:
    EditSession& session_;
};

inline std::pair<std::uint32_t, std::uint32_t> jointKey(std::uint32_t a, std::uint32_t b) {
    return a < b ? std::make_pair(a, b) : std::make_pair(b, a);
}

} // namespace floorplan
