#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "model.hpp"
#include "registry.hpp"
#include "opencl_context.hpp"
#include <vector>


///////////////////////////
///       AUDITORS      ///
///////////////////////////
/**
 * @brief Conflict auditor that offloads the overlap sweep to OpenCL.
 *
 * Rooms are packed into batches of batchSize rooms. Each batch is flattened
 * into per-booking arrays and handed to the device, which returns the
 * overlapping index pairs; the host maps them back to Conflict values.
 */
class OpenCLConflictAuditor {
public:
    /**
     * @param batchSize Rooms per device batch; values below 1 mean 1.
     */
    explicit OpenCLConflictAuditor(int batchSize);

    /// Same result and order as ConflictAuditor::audit.
    std::vector<Conflict> audit(const RoomRegistry& registry);

    int batchSize() const { return batchSize_; }

private:
    int batchSize_;

    /// OpenCL context and kernels used for batched overlap detection.
    ConflictOpenCLContext clctx_;

    /**
     * @brief Audit rooms [begin, end) of the registry on the device.
     */
    void flushBatchToGPU(const RoomRegistry& registry, int begin, int end, std::vector<Conflict>& out);
};
