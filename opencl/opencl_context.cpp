///////////////////////////
///   IMPORTS SECTION   ///
///////////////////////////
#include "opencl_context.hpp"
#include <cstring>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <vector>

///////////////////////////
///   ERROR  CHECKING   ///
///////////////////////////
static inline void checkError(cl_int err, const char* operation) {
    if (err != CL_SUCCESS) {
        std::stringstream ss;
        ss << "OpenCL error during " << operation << ": " << err;
        throw std::runtime_error(ss.str());
    }
}

///////////////////////////
///   OPENCL KERNELS    ///
///////////////////////////
static const char* OVERLAP_KERNEL_SRC = R"(
// Bookings of one room are contiguous and sorted by (date, start), so the
// scan for booking i stops at the first later booking that changes date or
// starts at or after i ends.
__kernel void count_overlaps(
    __global const int* dateKeys,
    __global const int* starts,
    __global const int* ends,
    __global const int* roomEnds,
    const int numBookings,
    __global int* countOut
) {
    int i = get_global_id(0);
    if (i >= numBookings) return;

    int count = 0;
    int last = roomEnds[i];
    for (int j = i + 1; j < last; ++j) {
        if (dateKeys[j] != dateKeys[i]) break;
        if (starts[j] >= ends[i]) break;
        count++;
    }
    countOut[i] = count;
}

__kernel void write_overlaps(
    __global const int* dateKeys,
    __global const int* starts,
    __global const int* ends,
    __global const int* roomEnds,
    __global const int* offsets,
    const int numBookings,
    __global int* firstOut,
    __global int* secondOut
) {
    int i = get_global_id(0);
    if (i >= numBookings) return;

    int out = offsets[i];
    int last = roomEnds[i];
    for (int j = i + 1; j < last; ++j) {
        if (dateKeys[j] != dateKeys[i]) break;
        if (starts[j] >= ends[i]) break;
        firstOut[out] = i;
        secondOut[out] = j;
        out++;
    }
}
)";

///////////////////////////
///  CONTEXT CTOR/DTOR  ///
///////////////////////////
ConflictOpenCLContext::ConflictOpenCLContext() {
    cl_int err = CL_SUCCESS;

    cl_uint numPlatforms = 0;
    err = clGetPlatformIDs(0, nullptr, &numPlatforms);
    checkError(err, "getting platform count");
    if (numPlatforms == 0)
        throw std::runtime_error("No OpenCL platforms found.");

    std::vector<cl_platform_id> platforms(numPlatforms);
    err = clGetPlatformIDs(numPlatforms, platforms.data(), nullptr);
    checkError(err, "getting platform IDs");
    platform = platforms[0];

    err = clGetDeviceIDs(platform, CL_DEVICE_TYPE_GPU, 1, &device, nullptr);
    if (err != CL_SUCCESS) {
        std::cout << "No GPU found, trying CPU...\n";
        err = clGetDeviceIDs(platform, CL_DEVICE_TYPE_CPU, 1, &device, nullptr);
        checkError(err, "getting device ID");
    }

    char name[256] = {0};
    err = clGetDeviceInfo(device, CL_DEVICE_NAME, sizeof(name), name, nullptr);
    checkError(err, "getting device name");
    std::cout << "Using OpenCL device: " << name << "\n";

    context = clCreateContext(nullptr, 1, &device, nullptr, nullptr, &err);
    checkError(err, "creating context");

#if CL_TARGET_OPENCL_VERSION >= 200
    cl_queue_properties props[] = { CL_QUEUE_PROPERTIES, 0, 0 };
    queue = clCreateCommandQueueWithProperties(context, device, props, &err);
#else
    queue = clCreateCommandQueue(context, device, 0, &err);
#endif
    checkError(err, "creating command queue");

    program = buildProgram(OVERLAP_KERNEL_SRC);
}

ConflictOpenCLContext::~ConflictOpenCLContext() {
    if (queue)   clReleaseCommandQueue(queue);
    if (program) clReleaseProgram(program);
    if (context) clReleaseContext(context);
}

///////////////////////////
///   BUILD PROGRAM     ///
///////////////////////////
cl_program ConflictOpenCLContext::buildProgram(const char* src) {
    cl_int err = CL_SUCCESS;
    size_t len = std::strlen(src);
    const char* srcs[1] = { src };
    size_t lens[1] = { len };

    cl_program prog = clCreateProgramWithSource(context, 1, srcs, lens, &err);
    checkError(err, "creating program from source");

    err = clBuildProgram(prog, 1, &device, nullptr, nullptr, nullptr);
    if (err != CL_SUCCESS) {
        size_t logSize = 0;
        clGetProgramBuildInfo(prog, device, CL_PROGRAM_BUILD_LOG, 0, nullptr, &logSize);
        std::vector<char> log(logSize + 1, '\0');
        clGetProgramBuildInfo(prog, device, CL_PROGRAM_BUILD_LOG, logSize, log.data(), nullptr);
        std::cerr << "OpenCL build log:\n" << log.data() << "\n";
        clReleaseProgram(prog);
        throw std::runtime_error("Failed to build OpenCL program");
    }

    return prog;
}

///////////////////////////
///    FIND OVERLAPS    ///
///////////////////////////
void ConflictOpenCLContext::findOverlaps(
        const std::vector<int>& dateKeys,
        const std::vector<int>& starts,
        const std::vector<int>& ends,
        const std::vector<int>& roomEnds,
        std::vector<int>& firsts,
        std::vector<int>& seconds
) {
    cl_int err = CL_SUCCESS;
    firsts.clear();
    seconds.clear();

    int numBookings = (int)dateKeys.size();
    if (numBookings == 0) return;

    size_t bufSize = (size_t)numBookings * sizeof(int);

    cl_mem d_dates = clCreateBuffer(context, CL_MEM_READ_ONLY, bufSize, nullptr, &err);
    checkError(err, "creating d_dates");
    cl_mem d_starts = clCreateBuffer(context, CL_MEM_READ_ONLY, bufSize, nullptr, &err);
    checkError(err, "creating d_starts");
    cl_mem d_ends = clCreateBuffer(context, CL_MEM_READ_ONLY, bufSize, nullptr, &err);
    checkError(err, "creating d_ends");
    cl_mem d_roomEnds = clCreateBuffer(context, CL_MEM_READ_ONLY, bufSize, nullptr, &err);
    checkError(err, "creating d_roomEnds");
    cl_mem d_counts = clCreateBuffer(context, CL_MEM_READ_WRITE, bufSize, nullptr, &err);
    checkError(err, "creating d_counts");

    err = clEnqueueWriteBuffer(queue, d_dates, CL_TRUE, 0, bufSize, dateKeys.data(), 0, nullptr, nullptr);
    checkError(err, "writing d_dates");
    err = clEnqueueWriteBuffer(queue, d_starts, CL_TRUE, 0, bufSize, starts.data(), 0, nullptr, nullptr);
    checkError(err, "writing d_starts");
    err = clEnqueueWriteBuffer(queue, d_ends, CL_TRUE, 0, bufSize, ends.data(), 0, nullptr, nullptr);
    checkError(err, "writing d_ends");
    err = clEnqueueWriteBuffer(queue, d_roomEnds, CL_TRUE, 0, bufSize, roomEnds.data(), 0, nullptr, nullptr);
    checkError(err, "writing d_roomEnds");

    // Pass 1: overlaps per booking.
    cl_kernel countKernel = clCreateKernel(program, "count_overlaps", &err);
    checkError(err, "creating count_overlaps");

    int arg = 0;
    err = clSetKernelArg(countKernel, arg++, sizeof(cl_mem), &d_dates); checkError(err, "arg dateKeys");
    err = clSetKernelArg(countKernel, arg++, sizeof(cl_mem), &d_starts); checkError(err, "arg starts");
    err = clSetKernelArg(countKernel, arg++, sizeof(cl_mem), &d_ends); checkError(err, "arg ends");
    err = clSetKernelArg(countKernel, arg++, sizeof(cl_mem), &d_roomEnds); checkError(err, "arg roomEnds");
    err = clSetKernelArg(countKernel, arg++, sizeof(int), &numBookings); checkError(err, "arg numBookings");
    err = clSetKernelArg(countKernel, arg++, sizeof(cl_mem), &d_counts); checkError(err, "arg countOut");

    size_t global = (size_t)numBookings;
    err = clEnqueueNDRangeKernel(queue, countKernel, 1, nullptr, &global, nullptr, 0, nullptr, nullptr);
    checkError(err, "enqueuing count_overlaps");
    err = clFinish(queue);
    checkError(err, "finishing queue");

    std::vector<int> counts(numBookings);
    err = clEnqueueReadBuffer(queue, d_counts, CL_TRUE, 0, bufSize, counts.data(), 0, nullptr, nullptr);
    checkError(err, "reading counts");
    clReleaseKernel(countKernel);

    // Exclusive prefix sum on the host gives each booking its output slot.
    std::vector<int> offsets(numBookings);
    int total = 0;
    for (int i = 0; i < numBookings; ++i) {
        offsets[i] = total;
        total += counts[i];
    }

    if (total > 0) {
        size_t pairSize = (size_t)total * sizeof(int);

        // d_counts is reused to hold the offsets.
        err = clEnqueueWriteBuffer(queue, d_counts, CL_TRUE, 0, bufSize, offsets.data(), 0, nullptr, nullptr);
        checkError(err, "writing offsets");
        cl_mem d_first = clCreateBuffer(context, CL_MEM_WRITE_ONLY, pairSize, nullptr, &err);
        checkError(err, "creating d_first");
        cl_mem d_second = clCreateBuffer(context, CL_MEM_WRITE_ONLY, pairSize, nullptr, &err);
        checkError(err, "creating d_second");

        // Pass 2: emit pairs.
        cl_kernel writeKernel = clCreateKernel(program, "write_overlaps", &err);
        checkError(err, "creating write_overlaps");

        arg = 0;
        err = clSetKernelArg(writeKernel, arg++, sizeof(cl_mem), &d_dates); checkError(err, "arg dateKeys");
        err = clSetKernelArg(writeKernel, arg++, sizeof(cl_mem), &d_starts); checkError(err, "arg starts");
        err = clSetKernelArg(writeKernel, arg++, sizeof(cl_mem), &d_ends); checkError(err, "arg ends");
        err = clSetKernelArg(writeKernel, arg++, sizeof(cl_mem), &d_roomEnds); checkError(err, "arg roomEnds");
        err = clSetKernelArg(writeKernel, arg++, sizeof(cl_mem), &d_counts); checkError(err, "arg offsets");
        err = clSetKernelArg(writeKernel, arg++, sizeof(int), &numBookings); checkError(err, "arg numBookings");
        err = clSetKernelArg(writeKernel, arg++, sizeof(cl_mem), &d_first); checkError(err, "arg firstOut");
        err = clSetKernelArg(writeKernel, arg++, sizeof(cl_mem), &d_second); checkError(err, "arg secondOut");

        err = clEnqueueNDRangeKernel(queue, writeKernel, 1, nullptr, &global, nullptr, 0, nullptr, nullptr);
        checkError(err, "enqueuing write_overlaps");
        err = clFinish(queue);
        checkError(err, "finishing queue");

        firsts.resize(total);
        seconds.resize(total);
        err = clEnqueueReadBuffer(queue, d_first, CL_TRUE, 0, pairSize, firsts.data(), 0, nullptr, nullptr);
        checkError(err, "reading firsts");
        err = clEnqueueReadBuffer(queue, d_second, CL_TRUE, 0, pairSize, seconds.data(), 0, nullptr, nullptr);
        checkError(err, "reading seconds");

        clReleaseKernel(writeKernel);
        clReleaseMemObject(d_first);
        clReleaseMemObject(d_second);
    }

    clReleaseMemObject(d_dates);
    clReleaseMemObject(d_starts);
    clReleaseMemObject(d_ends);
    clReleaseMemObject(d_roomEnds);
    clReleaseMemObject(d_counts);
}
