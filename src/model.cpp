///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "model.hpp"
#include "result.hpp"


///////////////////////////
///     FACILITIES      ///
///////////////////////////
const char* facilityName(Facility f) {
    switch (f) {
        case Facility::PROJECTOR:  return "projector";
        case Facility::LAB:        return "lab";
        case Facility::ACCESSIBLE: return "accessible";
        case Facility::WHITEBOARD: return "whiteboard";
        case Facility::AUDIO:      return "audio";
        case Facility::SMARTBOARD: return "smartboard";
    }
    return "unknown";
}

std::optional<Facility> parseFacility(const std::string& name) {
    for (Facility f : allFacilities()) {
        if (name == facilityName(f)) return f;
    }
    return std::nullopt;
}

Result<FacilitySet> parseFacilityList(const std::string& csv) {
    FacilitySet set;
    size_t begin = 0;
    while (begin <= csv.size() && !csv.empty()) {
        size_t end = csv.find(',', begin);
        if (end == std::string::npos) end = csv.size();

        std::string name = csv.substr(begin, end - begin);
        std::optional<Facility> f = parseFacility(name);
        if (!f) return Result<FacilitySet>::failure(ErrorKind::INVALID_REQUEST, "Unknown facility: '" + name + "'");
        set.set(*f);

        begin = end + 1;
    }
    return Result<FacilitySet>::success(set);
}

const std::vector<Facility>& allFacilities() {
    static const std::vector<Facility> kAll = {
            Facility::PROJECTOR, Facility::LAB, Facility::ACCESSIBLE,
            Facility::WHITEBOARD, Facility::AUDIO, Facility::SMARTBOARD
    };
    return kAll;
}


///////////////////////////
///       ERRORS        ///
///////////////////////////
const char* errorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::DUPLICATE_ROOM:    return "DuplicateRoomError";
        case ErrorKind::ROOM_NOT_FOUND:    return "RoomNotFoundError";
        case ErrorKind::NO_AVAILABLE_ROOM: return "NoAvailableRoomError";
        case ErrorKind::INVALID_REQUEST:   return "InvalidRequestError";
    }
    return "UnknownError";
}
