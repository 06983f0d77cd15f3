#ifndef TIMING_DATA_H_
#define TIMING_DATA_H_

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace KUCHIPAKU {

    // One syllabic unit of the speech engine's timing output.
    struct Mora {
        std::string text;
        double start_ms = 0.0;
        double end_ms = 0.0;
    };

    // Moras inside a phrase are time-ordered and do not overlap. Phrases may
    // be separated by gaps (pauses).
    struct AccentPhrase {
        std::vector<Mora> moras;
    };

    struct TimingData {
        std::vector<AccentPhrase> accent_phrases;

        bool empty() const;
        // End time of the last mora, 0 when there is none.
        double DurationMs() const;
    };

    // Reads either payload shape:
    //   pre-timed:   {"accent_phrases":[{"moras":[{"text","start_time","end_time"}]}]}
    //                with times in milliseconds;
    //   audio query: {"accent_phrases":[{"moras":[{"text","consonant_length",
    //                "vowel_length"}], "pause_mora":{...}}], "prePhonemeLength",
    //                "speedScale"} with lengths in seconds.
    // Never throws. Phrases or moras that do not have the expected shape are
    // skipped; a payload without an accent_phrases array yields empty data.
    TimingData ParseTimingData(const nlohmann::json& j);

    // Parses text as JSON first. Returns false (and leaves *out empty) when the
    // text is not JSON.
    bool ParseTimingDataText(const std::string& text, TimingData* out);

    bool LoadTimingDataFromFile(const std::string& path, TimingData* out);

}  // namespace KUCHIPAKU

#endif
