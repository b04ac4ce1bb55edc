#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "config.hpp"

struct EngineState;


///////////////////////////
///    DEMO DATASETS    ///
///////////////////////////
/**
 * @brief Populate a fresh engine state with one of the demo datasets.
 *
 *  - EMPTY:  nothing.
 *  - SAMPLE: the seven reference rooms (Main, Science, Engineering, Arts).
 *  - CAMPUS: a deterministic synthetic campus with imported bookings, some
 *            of them overlapping, for exercising the audit drivers.
 */
void seedDemoInstance(EngineState& state, DemoSize size);

/// Number of days covered by the CAMPUS booking feed.
static constexpr int CAMPUS_DAYS = 5;

/// First date of the CAMPUS booking feed.
static constexpr const char* CAMPUS_FIRST_DATE = "2024-01-08";
