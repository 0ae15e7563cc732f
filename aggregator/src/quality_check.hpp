#pragma once

#include "reconciler.hpp"
#include "reference_source.hpp"
#include "tick_store.hpp"

// End-of-day reconciliation of stored ticks against the reference snapshot.
// Borrows the store and source; the caller keeps ownership.
class QualityCheck {
public:
    QualityCheck(TickStore& store, ReferenceSource& reference,
                 MalformedPolicy policy = MalformedPolicy::DropRow);

    MismatchReport run(int64_t trade_date_ms) const;

private:
    TickStore& store_;
    ReferenceSource& reference_;
    MalformedPolicy policy_;
};
