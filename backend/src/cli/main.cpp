#include <cctype>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <limits>
#include <cstdint>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include "../utils/logging.hpp"
#include "../core/AnalyticsEngine.hpp"
#include "../core/Clock.hpp"
#include "../core/DueSelector.hpp"
#include "../core/MemoryModel.hpp"
#include "../core/SessionComposer.hpp"
#include "../core/SetScheduler.hpp"
#include "../storage/FileStore.hpp"
#include "../storage/StoreKey.hpp"
#include "../storage/StudyRepository.hpp"

struct CliConfig {
    std::string data_dir = "cadence-data";
    std::string deck_file = "deck.txt";
    std::string log_file = "cadence.log";
    std::string passphrase_env;   // empty: plain-text store
    std::optional<std::uint64_t> seed;
};

static void usage(const char* argv0) {
    std::cout << "Usage: " << argv0
        << " [--data-dir DIR] [--deck FILE] [--log FILE] [--seed N] [--passphrase-env VAR]\n";
}

static bool parseArgs(int argc, char** argv, CliConfig& cfg) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto next = [&](std::string& out) {
            if (i + 1 >= argc) return false;
            out = argv[++i];
            return true;
        };

        std::string value;
        if (arg == "--data-dir" && next(value)) cfg.data_dir = value;
        else if (arg == "--deck" && next(value)) cfg.deck_file = value;
        else if (arg == "--log" && next(value)) cfg.log_file = value;
        else if (arg == "--passphrase-env" && next(value)) cfg.passphrase_env = value;
        else if (arg == "--seed" && next(value)) {
            try {
                cfg.seed = std::stoull(value);
            }
            catch (const std::exception&) {
                std::cerr << "Invalid seed '" << value << "'\n";
                return false;
            }
        }
        else {
            usage(argv[0]);
            return false;
        }
    }
    return true;
}

// One item id per line; blank lines and '#' comments ignored
static std::vector<std::string> loadDeck(const std::string& path) {
    std::vector<std::string> ids;
    std::ifstream in(path);
    if (!in) {
        spdlog::warn("Deck file '{}' not found; no new items available", path);
        return ids;
    }

    std::string line;
    while (std::getline(in, line)) {
        while (!line.empty() && std::isspace((unsigned char)line.front())) line.erase(line.begin());
        while (!line.empty() && std::isspace((unsigned char)line.back())) line.pop_back();
        if (line.empty() || line[0] == '#') continue;
        ids.push_back(line);
    }
    spdlog::info("Loaded {} item ids from '{}'", ids.size(), path);
    return ids;
}

static int readInt() {
    int v;
    if (std::cin >> v) {
        std::cin.ignore(std::numeric_limits<std::streamsize>::max(), '\n');
        return v;
    }
    if (std::cin.eof()) return -1;
    std::cin.clear();
    std::cin.ignore(std::numeric_limits<std::streamsize>::max(), '\n');
    return -1;
}

static int askQuality() {
    while (true) {
        std::cout << "\nRate your recall:\n";
        for (int q = 0; q <= 5; ++q) {
            std::cout << " " << q << " = " << qualityDescription(q) << "\n";
        }
        std::cout << "> ";
        int q = readInt();
        if (q >= 0 && q <= 5) return q;
        if (std::cin.eof()) return 0;
        std::cout << "Invalid input.\n";
    }
}

static void printCards(const std::string& title, const std::vector<CardMemoryState>& cards) {
    std::cout << "\n===== " << title << " =====\n";
    if (cards.empty()) {
        std::cout << "(none)\n";
        return;
    }
    for (const auto& c : cards) {
        std::cout << "- " << c.item_id
            << " | interval=" << c.interval << "d"
            << " | ease=" << c.ease_factor
            << " | avg quality=" << c.average_quality
            << " | reviews=" << c.total_reviews << "\n";
    }
}

static PracticeFrequency askFrequency(std::optional<int>& customDays) {
    std::cout << "Frequency (daily, every_2_days, weekly, bi_weekly, monthly, custom): ";
    std::string name;
    std::getline(std::cin, name);
    PracticeFrequency f = frequencyFromString(name);
    if (f == PracticeFrequency::CUSTOM) {
        std::cout << "Days between practices: ";
        int d = readInt();
        if (d > 0) customDays = d;
    }
    return f;
}

int main(int argc, char** argv) {
    CliConfig cfg;
    if (!parseArgs(argc, argv, cfg)) return 1;

    Log::init(cfg.log_file);

    std::vector<unsigned char> key;
    if (!cfg.passphrase_env.empty()) {
        const char* pass = std::getenv(cfg.passphrase_env.c_str());
        if (!pass || !*pass) {
            std::cerr << "Environment variable " << cfg.passphrase_env << " is empty\n";
            return 1;
        }
        try {
            key = StoreKey::deriveForDirectory(pass, cfg.data_dir);
        }
        catch (const std::runtime_error& e) {
            std::cerr << "Key derivation failed: " << e.what() << "\n";
            return 1;
        }
        if (key.empty()) {
            std::cerr << "Could not derive store key\n";
            return 1;
        }
    }

    SystemClock clock;
    FileKeyValueStore fileStore(cfg.data_dir, key);
    CachedKeyValueStore store(fileStore);
    StudyRepository repo(store);

    MemoryModel model(clock);
    DueSelector selector(clock);
    SessionComposer composer = cfg.seed ? SessionComposer(model, selector, *cfg.seed)
                                        : SessionComposer(model, selector);
    SetScheduler sets(clock, repo);
    AnalyticsEngine analytics(clock, model.config());

    std::vector<std::string> deck = loadDeck(cfg.deck_file);
    MemorySnapshot states = repo.loadMemoryStates();

    // MAIN LOOP
    while (true) {
        std::cout << "\n===== MAIN MENU =====\n"
            "Deck: " << deck.size() << " items, " << states.size() << " studied\n"
            "1. Study Session\n"
            "2. Study Stats\n"
            "3. Analytics (30 days)\n"
            "4. Struggling & Mastered Items\n"
            "5. Set Schedules\n"
            "6. Save & Exit\n> ";

        int choice = readInt();
        if (std::cin.eof()) choice = 6;

        if (choice == 1) {
            SessionPlan plan = composer.createStudySession(deck, states);
            if (plan.session_cards.empty()) { std::cout << "Nothing due and no new items.\n"; continue; }

            StudySession session = composer.startSession(plan);
            for (const auto& id : plan.session_cards) {
                bool isNew = findCard(states, id) == nullptr;
                std::cout << "\nItem: " << id << (isNew ? " (new)" : "") << "\n";

                StudyResult result;
                result.item_id = id;
                result.quality = askQuality();
                result.studied_at = clock.now();

                states = composer.processStudyResult(result, states);
                session = composer.recordResult(session, result);

                const CardMemoryState* s = findCard(states, id);
                if (s) std::cout << "Next review in " << s->interval << " day(s).\n";
            }
            session = composer.finishSession(session);

            if (!repo.saveMemoryStates(states))
                std::cout << "Error saving progress.\n";
            if (!repo.saveStudySession(session))
                std::cout << "Error saving session.\n";

            std::cout << "Session complete: " << session.correct_cards << "/"
                << session.cards_studied.size() << " correct.\n";
        }

        else if (choice == 2) {
            StudyStats st = composer.getStudyStats(states);
            std::cout << "\n===== STATS =====\n"
                << "Total studied: " << st.total_cards << "\n"
                << "Due today: " << st.due_today << "\n"
                << "Never studied: " << selector.getNewCards(deck, states, static_cast<int>(deck.size())).size() << "\n"
                << "Learning: " << st.learning << "\n"
                << "Mature: " << st.mature << "\n"
                << "Average ease: " << st.average_ease_factor << "\n"
                << "Average interval: " << st.average_interval << " days\n"
                << "Longest streak: " << st.longest_streak << "\n";
        }

        else if (choice == 3) {
            StudyAnalytics a = analytics.getStudyAnalytics(repo.loadStudySessions());
            RecentPerformance p = analytics.getRecentPerformance(states);
            std::cout << "\n===== ANALYTICS =====\n"
                << "Sessions: " << a.sessions_count << "\n"
                << "Cards studied: " << a.total_cards_studied << "\n"
                << "Accuracy: " << a.average_accuracy << "%\n"
                << "Study time: " << a.total_study_time << " min\n"
                << "Day streak: " << a.streak_days << "\n"
                << "Last 7 days: " << p.cards_studied << " items, avg quality "
                << p.average_quality << ", trend " << trendToString(p.streak_trend) << "\n";
        }

        else if (choice == 4) {
            printCards("STRUGGLING", analytics.getStruggleCards(states));
            printCards("MASTERED", analytics.getMasteredCards(states));
        }

        else if (choice == 5) {
            // SET SCHEDULE SUBMENU
            while (true) {
                std::cout << "\n=== SET SCHEDULES ===\n"
                    "1. Create schedule\n"
                    "2. List all\n"
                    "3. List due for practice\n"
                    "4. Mark set practiced\n"
                    "5. Delete schedule\n"
                    "6. Back\n> ";

                int t = readInt();
                if (std::cin.eof() || t == 6) break;

                if (t == 1) {
                    std::cout << "Set id (blank to generate): ";
                    std::string id; std::getline(std::cin, id);
                    std::optional<int> customDays;
                    PracticeFrequency f = askFrequency(customDays);
                    auto created = sets.createSetSchedule(id, f, customDays);
                    if (created) std::cout << "Created " << created->set_id << ", next practice "
                        << TimeUtils::dateKey(created->next_practice_date) << "\n";
                    else std::cout << "Error saving schedule.\n";
                }

                else if (t == 2 || t == 3) {
                    auto list = t == 2 ? repo.loadSetSchedules() : sets.getFlashcardSetsDueForPractice();
                    if (list.empty()) { std::cout << "(none)\n"; continue; }
                    for (const auto& s : list) {
                        std::cout << "- " << s.set_id << " | " << frequencyToString(s.practice_frequency)
                            << " | next " << TimeUtils::dateKey(s.next_practice_date)
                            << (s.is_active ? "" : " | inactive") << "\n";
                    }
                }

                else if (t == 4) {
                    std::cout << "Set id: ";
                    std::string id; std::getline(std::cin, id);
                    if (!sets.markPracticed(id)) std::cout << "Not updated.\n";
                }

                else if (t == 5) {
                    std::cout << "Set id: ";
                    std::string id; std::getline(std::cin, id);
                    if (!repo.deleteSetSchedule(id)) std::cout << "Error deleting schedule.\n";
                }

                else std::cout << "Invalid.\n";
            }
        }

        else if (choice == 6) {
            if (!repo.saveMemoryStates(states))
                std::cout << "Error saving progress.\n";
            StoreKey::wipe(key);
            std::cout << "Goodbye!\n";
            break;
        }

        else std::cout << "Invalid.\n";
    }

    return 0;
}
