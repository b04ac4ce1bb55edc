///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include <gtest/gtest.h>
#include "threaded_auditor.hpp"
#include "engine.hpp"


///////////////////////////
///   THREADED AUDITS   ///
///////////////////////////
static bool sameConflicts(const std::vector<Conflict>& a, const std::vector<Conflict>& b) {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); ++i) {
        if (a[i].roomId != b[i].roomId) return false;
        if (a[i].first.bookingId != b[i].first.bookingId) return false;
        if (a[i].second.bookingId != b[i].second.bookingId) return false;
    }
    return true;
}

TEST(ThreadedConflictAuditor, MatchesSequentialOnCampus) {
    EngineConfig config;
    config.dataset = DemoSize::CAMPUS;
    config.idSeed = 77;
    AllocationService service(config);

    std::vector<Conflict> sequential = service.conflicts();
    ASSERT_FALSE(sequential.empty());

    for (int threads : {1, 3, 8, 1000}) {
        ThreadedConflictAuditor auditor(threads);
        std::vector<Conflict> parallel = service.read([&](const EngineState& s) {
            return auditor.audit(s.registry);
        });
        EXPECT_TRUE(sameConflicts(parallel, sequential)) << threads << " threads";
        EXPECT_EQ(service.read([&](const EngineState& s) { return auditor.countConflicts(s.registry); }),
                  (int)sequential.size());
    }
}

TEST(ThreadedConflictAuditor, EmptyRegistry) {
    EngineConfig config;
    config.dataset = DemoSize::EMPTY;
    AllocationService service(config);

    ThreadedConflictAuditor auditor(4);
    EXPECT_TRUE(service.read([&](const EngineState& s) { return auditor.audit(s.registry); }).empty());
}

TEST(ThreadedConflictAuditor, ClampsThreadCount) {
    EXPECT_EQ(ThreadedConflictAuditor(0).numThreads(), 1);
    EXPECT_EQ(ThreadedConflictAuditor(-5).numThreads(), 1);
    EXPECT_EQ(ThreadedConflictAuditor(6).numThreads(), 6);
}
