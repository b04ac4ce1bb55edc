#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "model.hpp"
#include "registry.hpp"
#include "conflicts.hpp"


///////////////////////////
///     STATISTICS      ///
///////////////////////////
/**
 * @brief Computes registry-wide figures on demand.
 *
 * The conflict count comes from a fresh audit on every call.
 */
class StatisticsReporter {
public:
    explicit StatisticsReporter(const ConflictAuditor& auditor) : auditor_(auditor) {}

    Statistics compute(const RoomRegistry& registry) const;

private:
    const ConflictAuditor& auditor_;
};
