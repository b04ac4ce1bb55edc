#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "model.hpp"
#include "activity_log.hpp"
#include "result.hpp"
#include <ostream>
#include <string>
#include <utility>
#include <vector>


///////////////////////////
///       HELPERS       ///
///////////////////////////
/// Comma-separated names of the facilities in @p set, "-" when empty.
std::string formatFacilities(const FacilitySet& set);

void printRooms(std::ostream& out, const std::vector<RoomSummary>& rooms);
void printSchedule(std::ostream& out, const std::vector<ScheduleEntry>& entries);
void printConflicts(std::ostream& out, const std::vector<Conflict>& conflicts);
void printStatistics(std::ostream& out, const Statistics& stats);
void printLogs(std::ostream& out, const std::vector<LogEntry>& entries);
void printEdges(std::ostream& out, const std::vector<std::pair<std::string, std::string>>& edges);
void printAllocation(std::ostream& out, const AllocationRequest& request, const Result<Allocation>& result);
