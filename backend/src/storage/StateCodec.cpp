#include "StateCodec.hpp"
#include "../core/SchedulerConfig.hpp"
#include <limits>
#include <stdexcept>
#include <string>
#include <spdlog/spdlog.h>

using nlohmann::json;

namespace {

    TimePoint requireDate(const json& j, const char* field) {
        const std::string text = j.at(field).get<std::string>();
        auto tp = TimeUtils::fromIso(text);
        if (!tp) throw std::invalid_argument(std::string("unparsable date in '") + field + "': " + text);
        return *tp;
    }

    std::optional<TimePoint> optionalDate(const json& j, const char* field) {
        auto it = j.find(field);
        if (it == j.end() || it->is_null()) return std::nullopt;
        return requireDate(j, field);
    }

    template <typename T>
    void requireRange(T value, T lo, T hi, const char* field) {
        if (!(value >= lo && value <= hi)) {
            throw std::invalid_argument(std::string("'") + field + "' out of range: " + std::to_string(value));
        }
    }

    template <typename T>
    std::optional<T> optionalValue(const json& j, const char* field) {
        auto it = j.find(field);
        if (it == j.end() || it->is_null()) return std::nullopt;
        return it->get<T>();
    }

    // Parses a JSON array and decodes each element, skipping the ones that fail.
    template <typename T, typename Decode>
    std::vector<T> decodeArray(const std::string& text, const char* what, Decode decode) {
        std::vector<T> out;

        json doc = json::parse(text, nullptr, false);
        if (doc.is_discarded() || !doc.is_array()) {
            spdlog::error("Stored {} is not a JSON array; loading as empty", what);
            return out;
        }

        out.reserve(doc.size());
        std::size_t index = 0;
        for (const auto& record : doc) {
            try {
                out.push_back(decode(record));
            }
            catch (const json::exception& e) {
                spdlog::warn("Skipping corrupt {} record #{}: {}", what, index, e.what());
            }
            catch (const std::invalid_argument& e) {
                spdlog::warn("Skipping corrupt {} record #{}: {}", what, index, e.what());
            }
            ++index;
        }

        if (out.size() != doc.size()) {
            spdlog::warn("Loaded {} of {} {} records", out.size(), doc.size(), what);
        }
        return out;
    }
}

namespace StateCodec {

    json toJson(const CardMemoryState& s) {
        return json{
            {"cardId", s.item_id},
            {"interval", s.interval},
            {"easeFactor", s.ease_factor},
            {"repetitions", s.repetitions},
            {"nextReviewDate", TimeUtils::toIso(s.next_review_date)},
            {"lastReviewDate", TimeUtils::toIso(s.last_review_date)},
            {"totalReviews", s.total_reviews},
            {"averageQuality", s.average_quality},
            {"streak", s.streak},
            {"created", TimeUtils::toIso(s.created)},
            {"updated", TimeUtils::toIso(s.updated)}
        };
    }

    json toJson(const StudyResult& r) {
        json j{
            {"cardId", r.item_id},
            {"quality", r.quality},
            {"studiedAt", TimeUtils::toIso(r.studied_at)}
        };
        if (r.response_time) j["responseTime"] = *r.response_time;
        return j;
    }

    json toJson(const StudySession& s) {
        json results = json::array();
        for (const auto& r : s.results) results.push_back(toJson(r));

        json j{
            {"sessionId", s.session_id},
            {"startTime", TimeUtils::toIso(s.start_time)},
            {"cardsStudied", s.cards_studied},
            {"results", results},
            {"totalCards", s.total_cards},
            {"correctCards", s.correct_cards}
        };
        if (s.end_time) j["endTime"] = TimeUtils::toIso(*s.end_time);
        if (s.average_response_time) j["averageResponseTime"] = *s.average_response_time;
        if (s.session_duration) j["sessionDuration"] = *s.session_duration;
        return j;
    }

    json toJson(const FlashcardSetSchedule& s) {
        json j{
            {"id", s.set_id},
            {"practice_frequency", frequencyToString(s.practice_frequency)},
            {"next_practice_date", TimeUtils::toIso(s.next_practice_date)},
            {"is_active", s.is_active},
            {"created_at", TimeUtils::toIso(s.created)},
            {"updated_at", TimeUtils::toIso(s.updated)}
        };
        if (s.custom_frequency_days) j["custom_frequency_days"] = *s.custom_frequency_days;
        if (s.last_practiced) j["last_practiced"] = TimeUtils::toIso(*s.last_practiced);
        return j;
    }

    CardMemoryState memoryStateFromJson(const json& j) {
        CardMemoryState s;
        s.item_id = j.at("cardId").get<std::string>();
        s.interval = j.at("interval").get<int>();
        s.ease_factor = j.at("easeFactor").get<double>();
        s.repetitions = j.at("repetitions").get<int>();
        s.next_review_date = requireDate(j, "nextReviewDate");
        s.last_review_date = requireDate(j, "lastReviewDate");
        s.total_reviews = j.value("totalReviews", 0);
        s.average_quality = j.value("averageQuality", 0.0);
        s.streak = j.value("streak", 0);
        s.created = optionalDate(j, "created").value_or(s.last_review_date);
        s.updated = optionalDate(j, "updated").value_or(s.last_review_date);

        const SchedulerConfig bounds;
        requireRange(s.interval, bounds.min_interval, bounds.max_interval, "interval");
        requireRange(s.ease_factor, bounds.min_ease_factor, bounds.max_ease_factor, "easeFactor");
        requireRange(s.repetitions, 0, std::numeric_limits<int>::max(), "repetitions");
        requireRange(s.total_reviews, 0, std::numeric_limits<int>::max(), "totalReviews");
        requireRange(s.streak, 0, std::numeric_limits<int>::max(), "streak");
        requireRange(s.average_quality, static_cast<double>(bounds.min_quality),
            static_cast<double>(bounds.max_quality), "averageQuality");
        return s;
    }

    StudyResult studyResultFromJson(const json& j) {
        StudyResult r;
        r.item_id = j.at("cardId").get<std::string>();
        r.quality = j.at("quality").get<int>();
        r.response_time = optionalValue<long long>(j, "responseTime");
        r.studied_at = requireDate(j, "studiedAt");
        return r;
    }

    StudySession sessionFromJson(const json& j) {
        StudySession s;
        s.session_id = j.at("sessionId").get<std::string>();
        s.start_time = requireDate(j, "startTime");
        s.end_time = optionalDate(j, "endTime");
        s.cards_studied = j.at("cardsStudied").get<std::vector<std::string>>();
        for (const auto& r : j.at("results")) {
            s.results.push_back(studyResultFromJson(r));
        }
        s.total_cards = j.value("totalCards", static_cast<int>(s.cards_studied.size()));
        s.correct_cards = j.value("correctCards", 0);
        s.average_response_time = optionalValue<double>(j, "averageResponseTime");
        s.session_duration = optionalValue<long long>(j, "sessionDuration");
        return s;
    }

    FlashcardSetSchedule setScheduleFromJson(const json& j) {
        FlashcardSetSchedule s;
        s.set_id = j.at("id").get<std::string>();
        s.practice_frequency = frequencyFromString(j.at("practice_frequency").get<std::string>());
        s.custom_frequency_days = optionalValue<int>(j, "custom_frequency_days");
        s.next_practice_date = requireDate(j, "next_practice_date");
        s.last_practiced = optionalDate(j, "last_practiced");
        s.is_active = j.value("is_active", true);
        s.created = optionalDate(j, "created_at").value_or(s.next_practice_date);
        s.updated = optionalDate(j, "updated_at").value_or(s.created);
        return s;
    }

    std::string encodeMemoryStates(const MemorySnapshot& states) {
        json doc = json::array();
        for (const auto& s : states) doc.push_back(toJson(s));
        return doc.dump();
    }

    MemorySnapshot decodeMemoryStates(const std::string& text) {
        return decodeArray<CardMemoryState>(text, "memory state", memoryStateFromJson);
    }

    std::string encodeSessions(const std::vector<StudySession>& sessions) {
        json doc = json::array();
        for (const auto& s : sessions) doc.push_back(toJson(s));
        return doc.dump();
    }

    std::vector<StudySession> decodeSessions(const std::string& text) {
        return decodeArray<StudySession>(text, "study session", sessionFromJson);
    }

    std::string encodeSetSchedules(const std::vector<FlashcardSetSchedule>& sets) {
        json doc = json::array();
        for (const auto& s : sets) doc.push_back(toJson(s));
        return doc.dump();
    }

    std::vector<FlashcardSetSchedule> decodeSetSchedules(const std::string& text) {
        return decodeArray<FlashcardSetSchedule>(text, "set schedule", setScheduleFromJson);
    }
}
