///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "threaded_auditor.hpp"
#include "engine.hpp"
#include "config.hpp"
#include "formatting.hpp"
#include <atomic>
#include <chrono>
#include <iostream>
#include <random>
#include <thread>
#include <vector>


///////////////////////////
///     ENTRY POINT     ///
///////////////////////////
/**
 * @brief Concurrent allocation workload plus a threaded conflict audit.
 *
 * Several client threads hammer the same service with overlapping requests.
 * Because the check-then-book sequence runs under the writer lock, the audit
 * afterwards must report no more conflicts than the dataset started with,
 * and the threaded audit must agree with the sequential one.
 */
int main(int argc, char** argv) {
    EngineConfig defaults;
    defaults.dataset = DemoSize::SAMPLE;
    defaults.threads = 4;

    Result<EngineConfig> parsed = parseConfigArgs(argc, argv, defaults);
    if (!parsed) {
        std::cerr << errorKindName(parsed.error().kind) << ": " << parsed.error().message << "\n";
        return 2;
    }
    const EngineConfig& config = parsed.value();

    AllocationService service(config);
    ThreadedConflictAuditor threadedAuditor(config.threads);

    int conflictsBefore = service.read([&](const EngineState& s) {
        return threadedAuditor.countConflicts(s.registry);
    });

    // Each client submits requestsPerClient requests over a small slot grid,
    // so many of them compete for the same rooms.
    const int clients = config.threads * 2;
    const int requestsPerClient = 50;
    std::atomic<int> granted{0};
    std::atomic<int> rejected{0};

    auto startAlloc = std::chrono::high_resolution_clock::now();
    std::vector<std::thread> workers;
    for (int c = 0; c < clients; ++c) {
        workers.emplace_back([&service, &granted, &rejected, c, requestsPerClient]() {
            std::mt19937 rng(1234u + (unsigned)c);
            std::uniform_int_distribution<int> dayPick(10, 12);
            std::uniform_int_distribution<int> hourPick(8, 17);
            std::uniform_int_distribution<int> capacityPick(10, 60);
            std::uniform_int_distribution<int> coin(0, 3);

            for (int i = 0; i < requestsPerClient; ++i) {
                AllocationRequest req;
                req.courseName = "Course-" + std::to_string(c) + "-" + std::to_string(i);
                req.date = "2024-01-" + std::to_string(dayPick(rng));
                req.startMinute = hourPick(rng) * 60;
                req.endMinute = req.startMinute + 60;
                req.capacity = capacityPick(rng);
                if (coin(rng) == 0) req.facilities.set(Facility::LAB);

                if (service.allocate(req)) granted++;
                else rejected++;
            }
        });
    }
    for (auto& w : workers) w.join();
    auto endAlloc = std::chrono::high_resolution_clock::now();
    double msAlloc = std::chrono::duration<double, std::milli>(endAlloc - startAlloc).count();

    // Audit the final state with both auditors under one shared lock.
    auto startAudit = std::chrono::high_resolution_clock::now();
    std::vector<Conflict> threaded = service.read([&](const EngineState& s) {
        return threadedAuditor.audit(s.registry);
    });
    auto endAudit = std::chrono::high_resolution_clock::now();
    double msAudit = std::chrono::duration<double, std::milli>(endAudit - startAudit).count();

    std::vector<Conflict> sequential = service.conflicts();

    std::cout << "========================================\n";
    std::cout << "ROOM ALLOCATION ENGINE (THREADED)\n";
    std::cout << "Dataset: " << demoSizeName(config.dataset) << "\n";
    std::cout << "Clients: " << clients << " x " << requestsPerClient << " requests\n";
    std::cout << "Granted: " << granted.load() << ", rejected: " << rejected.load() << "\n";
    std::cout << "Allocation time: " << msAlloc << " ms\n";
    std::cout << "Audit threads: " << threadedAuditor.numThreads() << ", audit time: " << msAudit << " ms\n";
    std::cout << "Conflicts before: " << conflictsBefore
              << ", after: " << threaded.size()
              << " (sequential audit: " << sequential.size() << ")\n";
    std::cout << "----------------------------------------\n";
    printStatistics(std::cout, service.statistics());
    std::cout << "========================================\n";

    bool consistent = (int)threaded.size() == conflictsBefore && threaded.size() == sequential.size();
    if (!consistent) {
        std::cerr << "Concurrent allocation produced overlapping bookings.\n";
        return 1;
    }
    return 0;
}
