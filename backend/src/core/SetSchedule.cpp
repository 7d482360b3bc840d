#include "SetSchedule.hpp"
#include <spdlog/spdlog.h>

std::string frequencyToString(PracticeFrequency f) {
    switch (f) {
    case PracticeFrequency::DAILY: return "daily";
    case PracticeFrequency::EVERY_2_DAYS: return "every_2_days";
    case PracticeFrequency::WEEKLY: return "weekly";
    case PracticeFrequency::BI_WEEKLY: return "bi_weekly";
    case PracticeFrequency::MONTHLY: return "monthly";
    case PracticeFrequency::CUSTOM: return "custom";
    }
    return "weekly";
}

PracticeFrequency frequencyFromString(const std::string& name) {
    if (name == "daily") return PracticeFrequency::DAILY;
    if (name == "every_2_days") return PracticeFrequency::EVERY_2_DAYS;
    if (name == "weekly") return PracticeFrequency::WEEKLY;
    if (name == "bi_weekly") return PracticeFrequency::BI_WEEKLY;
    if (name == "monthly") return PracticeFrequency::MONTHLY;
    if (name == "custom") return PracticeFrequency::CUSTOM;

    spdlog::warn("Unknown practice frequency '{}'; using weekly", name);
    return PracticeFrequency::WEEKLY;
}
