#pragma once

// Tuning constants for the memory model and the reporting thresholds.
struct SchedulerConfig {
    double min_ease_factor = 1.3;
    double max_ease_factor = 2.5;
    double initial_ease_factor = 2.5;

    int initial_interval = 1;   // days
    int min_interval = 1;
    int max_interval = 365;

    int success_quality = 3;    // quality >= this is a successful recall
    int min_quality = 0;
    int max_quality = 5;

    int mature_interval = 21;   // interval >= this is "mature", below is "learning"

    double struggle_quality = 3.0;
    int struggle_min_reviews = 3;
    double mastered_quality = 4.5;
    int mastered_interval = 30;
};

struct SessionOptions {
    int max_cards = 20;
    int new_card_limit = 5;
    int review_card_limit = 15;
    bool include_new_cards = true;
};
