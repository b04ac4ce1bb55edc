#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "model.hpp"
#include "registry.hpp"
#include "conflicts.hpp"
#include <vector>


///////////////////////////
///       AUDITORS      ///
///////////////////////////
/**
 * @brief Conflict auditor that splits the rooms across worker threads.
 *
 * Rooms are independent, so the registry is cut into contiguous slices, one
 * std::async task per slice. Results are concatenated in slice order, which
 * gives exactly the same list as the sequential ConflictAuditor.
 *
 * The registry must not be modified while audit() runs; callers typically
 * hold AllocationService's shared lock via AllocationService::read().
 */
class ThreadedConflictAuditor {
public:
    /**
     * @param numThreads Number of worker tasks; values below 1 mean 1.
     */
    explicit ThreadedConflictAuditor(int numThreads);

    std::vector<Conflict> audit(const RoomRegistry& registry) const;

    int countConflicts(const RoomRegistry& registry) const;

    int numThreads() const { return numThreads_; }

private:
    int numThreads_;

    /// Per-room audit shared by all workers (stateless).
    ConflictAuditor auditor_;
};
