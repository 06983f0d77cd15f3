#include "TimingData.hpp"

#include <algorithm>
#include <fstream>
#include <iostream>

namespace KUCHIPAKU {

    using json = nlohmann::json;

    namespace {

        // Returns the numeric field as a double, or fallback when the key is
        // missing or not a number (the engine sends null for vowel-only moras).
        double NumberOr(const json& obj, const char* key, double fallback) {
            auto it = obj.find(key);
            if (it == obj.end() || !it->is_number()) {
                return fallback;
            }
            return it->get<double>();
        }

        bool HasNumber(const json& obj, const char* key) {
            auto it = obj.find(key);
            return it != obj.end() && it->is_number();
        }

        // Seconds of audio covered by an audio-query mora.
        double QueryMoraLengthSec(const json& mora) {
            return NumberOr(mora, "consonant_length", 0.0) +
                NumberOr(mora, "vowel_length", 0.0);
        }

    }  // namespace

    bool TimingData::empty() const {
        for (const auto& phrase : accent_phrases) {
            if (!phrase.moras.empty())
                return false;
        }
        return true;
    }

    double TimingData::DurationMs() const {
        double duration = 0.0;
        for (const auto& phrase : accent_phrases) {
            if (!phrase.moras.empty()) {
                duration = std::max(duration, phrase.moras.back().end_ms);
            }
        }
        return duration;
    }

    TimingData ParseTimingData(const json& j) {
        TimingData data;
        if (!j.is_object()) {
            return data;
        }
        auto phrases_it = j.find("accent_phrases");
        if (phrases_it == j.end() || !phrases_it->is_array()) {
            return data;
        }

        // Audio-query payloads carry lengths instead of absolute times; walk a
        // cursor through them the same way the engine renders the audio.
        double speed = NumberOr(j, "speedScale", 1.0);
        if (speed <= 0.0) {
            speed = 1.0;
        }
        double cursor_sec = std::max(0.0, NumberOr(j, "prePhonemeLength", 0.0)) / speed;

        for (const auto& phrase_json : *phrases_it) {
            if (!phrase_json.is_object())
                continue;
            auto moras_it = phrase_json.find("moras");
            if (moras_it == phrase_json.end() || !moras_it->is_array())
                continue;

            AccentPhrase phrase;
            for (const auto& mora_json : *moras_it) {
                if (!mora_json.is_object())
                    continue;

                Mora mora;
                if (HasNumber(mora_json, "start_time") && HasNumber(mora_json, "end_time")) {
                    mora.start_ms = mora_json["start_time"].get<double>();
                    mora.end_ms = mora_json["end_time"].get<double>();
                }
                else if (HasNumber(mora_json, "vowel_length")) {
                    double length_sec = std::max(0.0, QueryMoraLengthSec(mora_json)) / speed;
                    mora.start_ms = cursor_sec * 1000.0;
                    mora.end_ms = (cursor_sec + length_sec) * 1000.0;
                    cursor_sec += length_sec;
                }
                else {
                    continue;
                }

                auto text_it = mora_json.find("text");
                if (text_it == mora_json.end() || !text_it->is_string())
                    continue;
                if (mora.end_ms < mora.start_ms)
                    continue;

                mora.text = text_it->get<std::string>();
                phrase.moras.push_back(std::move(mora));
            }

            auto pause_it = phrase_json.find("pause_mora");
            if (pause_it != phrase_json.end() && pause_it->is_object()) {
                cursor_sec += std::max(0.0, QueryMoraLengthSec(*pause_it)) / speed;
            }

            if (!phrase.moras.empty()) {
                data.accent_phrases.push_back(std::move(phrase));
            }
        }
        return data;
    }

    bool ParseTimingDataText(const std::string& text, TimingData* out) {
        *out = TimingData();
        json j = json::parse(text, nullptr, false);
        if (j.is_discarded()) {
            return false;
        }
        *out = ParseTimingData(j);
        return true;
    }

    bool LoadTimingDataFromFile(const std::string& path, TimingData* out) {
        *out = TimingData();
        std::ifstream f(path);
        if (!f.is_open()) {
            std::cerr << "Failed to open timing JSON: " << path << "\n";
            return false;
        }

        json j;
        try {
            f >> j;
        }
        catch (const std::exception& e) {
            std::cerr << "Failed to parse timing JSON (" << path << "): "
                << e.what() << "\n";
            return false;
        }

        *out = ParseTimingData(j);
        return true;
    }

}  // namespace KUCHIPAKU
