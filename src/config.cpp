///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "config.hpp"
#include <cstdlib>
#include <cerrno>


///////////////////////////
///       HELPERS       ///
///////////////////////////
const char* demoSizeName(DemoSize size) {
    switch (size) {
        case DemoSize::EMPTY:  return "empty";
        case DemoSize::SAMPLE: return "sample";
        case DemoSize::CAMPUS: return "campus";
    }
    return "unknown";
}

/**
 * @brief Parse a whole string as a base-10 long; false on trailing garbage.
 */
static bool parseLong(const std::string& text, long& out) {
    if (text.empty()) return false;
    char* end = nullptr;
    errno = 0;
    long v = std::strtol(text.c_str(), &end, 10);
    if (errno != 0 || *end != '\0') return false;
    out = v;
    return true;
}

static bool parseBool(const std::string& text, bool& out) {
    if (text == "true" || text == "1" || text == "on") { out = true; return true; }
    if (text == "false" || text == "0" || text == "off") { out = false; return true; }
    return false;
}


///////////////////////////
///    CONFIGURATION    ///
///////////////////////////
Result<bool> applyConfigOption(EngineConfig& config, const std::string& key, const std::string& value) {
    auto bad = [&](const std::string& why) {
        return Result<bool>::failure(ErrorKind::INVALID_REQUEST, "--" + key + "=" + value + ": " + why);
    };

    long number = 0;
    if (key == "log-capacity") {
        if (!parseLong(value, number) || number <= 0) return bad("expected a positive integer");
        config.logCapacity = (size_t)number;
    } else if (key == "capacity-tolerance") {
        char* end = nullptr;
        double tolerance = std::strtod(value.c_str(), &end);
        if (value.empty() || *end != '\0' || tolerance < 0.0 || tolerance > 1.0)
            return bad("expected a number in [0, 1]");
        config.capacityTolerance = tolerance;
    } else if (key == "link-same-building") {
        if (!parseBool(value, config.linkSameBuilding)) return bad("expected true or false");
    } else if (key == "id-seed") {
        if (!parseLong(value, number) || number < 0) return bad("expected a non-negative integer");
        config.idSeed = (unsigned)number;
    } else if (key == "echo") {
        if (!parseBool(value, config.echoActivity)) return bad("expected true or false");
    } else if (key == "dataset") {
        if (value == "empty") config.dataset = DemoSize::EMPTY;
        else if (value == "sample") config.dataset = DemoSize::SAMPLE;
        else if (value == "campus") config.dataset = DemoSize::CAMPUS;
        else return bad("expected empty, sample or campus");
    } else if (key == "threads") {
        if (!parseLong(value, number) || number <= 0) return bad("expected a positive integer");
        config.threads = (int)number;
    } else if (key == "batch-size") {
        if (!parseLong(value, number) || number <= 0) return bad("expected a positive integer");
        config.batchSize = (int)number;
    } else {
        return Result<bool>::failure(ErrorKind::INVALID_REQUEST, "Unknown option --" + key);
    }
    return Result<bool>::success(true);
}

Result<EngineConfig> parseConfigArgs(int argc, char** argv, EngineConfig defaults) {
    EngineConfig config = defaults;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg.rfind("--", 0) != 0) {
            return Result<EngineConfig>::failure(ErrorKind::INVALID_REQUEST, "Unexpected argument: " + arg);
        }

        // A bare "--flag" means "--flag=true".
        std::string body = arg.substr(2);
        size_t eq = body.find('=');
        std::string key = body.substr(0, eq);
        std::string value = (eq == std::string::npos) ? "true" : body.substr(eq + 1);

        Result<bool> applied = applyConfigOption(config, key, value);
        if (!applied) return Result<EngineConfig>::failure(applied.error());
    }
    return Result<EngineConfig>::success(config);
}
