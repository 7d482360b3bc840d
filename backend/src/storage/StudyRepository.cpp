#include "StudyRepository.hpp"
#include "StateCodec.hpp"
#include <algorithm>
#include <spdlog/spdlog.h>

StudyRepository::StudyRepository(KeyValueStore& kv)
    : store(kv)
{
}

MemorySnapshot StudyRepository::loadMemoryStates() {
    auto stored = store.get(MEMORY_DATA_KEY);
    if (!stored) {
        spdlog::info("No memory data stored; starting empty");
        return {};
    }

    MemorySnapshot states = StateCodec::decodeMemoryStates(*stored);
    spdlog::info("Loaded {} memory states", states.size());
    return states;
}

bool StudyRepository::saveMemoryStates(const MemorySnapshot& states) {
    spdlog::info("Saving {} memory states", states.size());
    if (!store.set(MEMORY_DATA_KEY, StateCodec::encodeMemoryStates(states))) {
        spdlog::error("Error saving memory data");
        return false;
    }
    return true;
}

bool StudyRepository::clearMemoryStates() {
    if (!store.remove(MEMORY_DATA_KEY)) {
        spdlog::error("Error clearing memory data");
        return false;
    }
    return true;
}

std::vector<StudySession> StudyRepository::loadStudySessions() {
    auto stored = store.get(STUDY_SESSIONS_KEY);
    if (!stored) return {};

    auto sessions = StateCodec::decodeSessions(*stored);
    spdlog::debug("Loaded {} study sessions", sessions.size());
    return sessions;
}

bool StudyRepository::saveStudySession(const StudySession& session) {
    auto sessions = loadStudySessions();
    sessions.erase(std::remove_if(sessions.begin(), sessions.end(),
        [&](const StudySession& s) { return s.session_id == session.session_id; }),
        sessions.end());
    sessions.push_back(session);

    if (!store.set(STUDY_SESSIONS_KEY, StateCodec::encodeSessions(sessions))) {
        spdlog::error("Error saving study session {}", session.session_id);
        return false;
    }
    spdlog::info("Saved study session {} ({} stored)", session.session_id, sessions.size());
    return true;
}

bool StudyRepository::clearStudySessions() {
    if (!store.remove(STUDY_SESSIONS_KEY)) {
        spdlog::error("Error clearing study sessions");
        return false;
    }
    return true;
}

std::vector<FlashcardSetSchedule> StudyRepository::loadSetSchedules() {
    auto stored = store.get(FLASHCARD_SETS_KEY);
    if (!stored) return {};
    return StateCodec::decodeSetSchedules(*stored);
}

std::optional<FlashcardSetSchedule> StudyRepository::getSetSchedule(const std::string& setId) {
    for (auto& s : loadSetSchedules()) {
        if (s.set_id == setId) return s;
    }
    return std::nullopt;
}

bool StudyRepository::saveSetSchedule(const FlashcardSetSchedule& schedule) {
    auto sets = loadSetSchedules();
    sets.erase(std::remove_if(sets.begin(), sets.end(),
        [&](const FlashcardSetSchedule& s) { return s.set_id == schedule.set_id; }),
        sets.end());
    sets.push_back(schedule);

    if (!store.set(FLASHCARD_SETS_KEY, StateCodec::encodeSetSchedules(sets))) {
        spdlog::error("Error saving flashcard set {}", schedule.set_id);
        return false;
    }
    return true;
}

bool StudyRepository::deleteSetSchedule(const std::string& setId) {
    auto sets = loadSetSchedules();
    const auto before = sets.size();
    sets.erase(std::remove_if(sets.begin(), sets.end(),
        [&](const FlashcardSetSchedule& s) { return s.set_id == setId; }),
        sets.end());

    if (sets.size() == before) {
        spdlog::debug("deleteSetSchedule: set {} not found", setId);
        return true;
    }

    if (!store.set(FLASHCARD_SETS_KEY, StateCodec::encodeSetSchedules(sets))) {
        spdlog::error("Error deleting flashcard set {}", setId);
        return false;
    }
    return true;
}
