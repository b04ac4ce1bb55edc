#pragma once
#define CL_TARGET_OPENCL_VERSION 120

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include <CL/cl.h>
#include <vector>


///////////////////////////
///       CONTEXT       ///
///////////////////////////
/**
 * @brief OpenCL helper context for batched overlap detection.
 *
 * Owns the OpenCL platform/device/context/queue and a compiled program with
 * two kernels: one counting overlaps per booking, one writing the pairs.
 */
class ConflictOpenCLContext {
public:
    /**
     * @brief Initialize OpenCL platform, device, context and command queue.
     *
     * Also builds the overlap program. Throws std::runtime_error if any
     * OpenCL call fails.
     */
    ConflictOpenCLContext();

    /**
     * @brief Release all OpenCL resources owned by this context.
     */
    ~ConflictOpenCLContext();

    ConflictOpenCLContext(const ConflictOpenCLContext&) = delete;
    ConflictOpenCLContext& operator=(const ConflictOpenCLContext&) = delete;

    /**
     * @brief Find overlapping booking pairs in a flattened batch of rooms.
     *
     * Bookings of every room are laid out contiguously and sorted by
     * (date, start). For booking i, roomEnds[i] is one past the last booking
     * of the same room.
     *
     * On return, (firsts[k], seconds[k]) are flat indices of an overlapping
     * pair with firsts[k] < seconds[k], grouped by first index in ascending
     * order.
     */
    void findOverlaps(
            const std::vector<int>& dateKeys,
            const std::vector<int>& starts,
            const std::vector<int>& ends,
            const std::vector<int>& roomEnds,
            std::vector<int>& firsts,
            std::vector<int>& seconds
    );

private:
    cl_platform_id platform = nullptr;
    cl_device_id device = nullptr;
    cl_context context = nullptr;
    cl_program program = nullptr;
    cl_command_queue queue = nullptr;

    cl_program buildProgram(const char* src);
};
