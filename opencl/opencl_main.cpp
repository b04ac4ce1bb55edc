///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "opencl_auditor.hpp"
#include "engine.hpp"
#include "config.hpp"
#include "formatting.hpp"
#include <chrono>
#include <iostream>
#include <stdexcept>

///////////////////////////
///     ENTRY POINT     ///
///////////////////////////
/**
 * @brief Demo entry point for the OpenCL conflict audit.
 *
 * Builds the campus dataset, audits it on the device in room batches and
 * compares the result with the CPU auditor.
 */
int main(int argc, char** argv) {
    EngineConfig defaults;
    defaults.dataset = DemoSize::CAMPUS;

    Result<EngineConfig> parsed = parseConfigArgs(argc, argv, defaults);
    if (!parsed) {
        std::cerr << errorKindName(parsed.error().kind) << ": " << parsed.error().message << "\n";
        return 2;
    }
    const EngineConfig& config = parsed.value();

    AllocationService service(config);

    std::cout << "========================================\n";
    std::cout << "ROOM ALLOCATION ENGINE (OPENCL AUDIT)\n";
    std::cout << "Dataset: " << demoSizeName(config.dataset) << "\n";
    std::cout << "GPU batch size: " << config.batchSize << " rooms\n";
    std::cout << "========================================\n";

    try {
        OpenCLConflictAuditor auditor(config.batchSize);

        auto start = std::chrono::high_resolution_clock::now();
        std::vector<Conflict> device = service.read([&](const EngineState& s) {
            return auditor.audit(s.registry);
        });
        auto end = std::chrono::high_resolution_clock::now();
        double elapsedMs = std::chrono::duration<double, std::milli>(end - start).count();

        std::vector<Conflict> cpu = service.conflicts();

        printConflicts(std::cout, device);
        std::cout << "----------------------------------------\n";
        std::cout << "OpenCL audit time: " << elapsedMs << " ms\n";
        std::cout << "Device conflicts: " << device.size() << " (CPU audit: " << cpu.size() << ")\n";
        std::cout << "========================================\n";

        if (device.size() != cpu.size()) {
            std::cerr << "OpenCL audit disagrees with the CPU audit.\n";
            return 1;
        }
    } catch (const std::runtime_error& e) {
        std::cerr << e.what() << "\n";
        return 1;
    }
    return 0;
}
