#pragma once
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "../core/CardMemory.hpp"
#include "../core/SetSchedule.hpp"

// JSON encode/decode for everything the repository persists. Dates travel as
// ISO-8601 UTC strings with milliseconds and come back as TimePoints.
//
// Decoding a collection never throws:
//   - text that is not a JSON array -> empty collection (error logged)
//   - a record with missing fields, an unparsable date or a value outside the
//     scheduler's bounds (interval, ease factor, counters, average quality)
//     -> record skipped (warning logged)
namespace StateCodec {

    nlohmann::json toJson(const CardMemoryState& s);
    nlohmann::json toJson(const StudyResult& r);
    nlohmann::json toJson(const StudySession& s);
    nlohmann::json toJson(const FlashcardSetSchedule& s);

    // These throw nlohmann::json::exception or std::invalid_argument on a malformed record
    CardMemoryState memoryStateFromJson(const nlohmann::json& j);
    StudyResult studyResultFromJson(const nlohmann::json& j);
    StudySession sessionFromJson(const nlohmann::json& j);
    FlashcardSetSchedule setScheduleFromJson(const nlohmann::json& j);

    std::string encodeMemoryStates(const MemorySnapshot& states);
    MemorySnapshot decodeMemoryStates(const std::string& text);

    std::string encodeSessions(const std::vector<StudySession>& sessions);
    std::vector<StudySession> decodeSessions(const std::string& text);

    std::string encodeSetSchedules(const std::vector<FlashcardSetSchedule>& sets);
    std::vector<FlashcardSetSchedule> decodeSetSchedules(const std::string& text);
}
