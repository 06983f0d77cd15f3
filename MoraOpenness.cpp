#include "MoraOpenness.hpp"

#include <cmath>
#include <vector>

#include "glm/glm.hpp"
#include "glm/gtc/constants.hpp"

namespace KUCHIPAKU {

    namespace {

        struct KanaEntry {
            char32_t kana;
            char consonant;
            Vowel vowel;
        };

        // Hiragana rows. Katakana is folded onto these before lookup.
        const KanaEntry kKanaTable[] = {
            { U'あ', 0, Vowel::A }, { U'い', 0, Vowel::I }, { U'う', 0, Vowel::U },
            { U'え', 0, Vowel::E }, { U'お', 0, Vowel::O },
            { U'ぁ', 0, Vowel::A }, { U'ぃ', 0, Vowel::I }, { U'ぅ', 0, Vowel::U },
            { U'ぇ', 0, Vowel::E }, { U'ぉ', 0, Vowel::O },
            { U'か', 'k', Vowel::A }, { U'き', 'k', Vowel::I }, { U'く', 'k', Vowel::U },
            { U'け', 'k', Vowel::E }, { U'こ', 'k', Vowel::O },
            { U'さ', 's', Vowel::A }, { U'し', 's', Vowel::I }, { U'す', 's', Vowel::U },
            { U'せ', 's', Vowel::E }, { U'そ', 's', Vowel::O },
            { U'た', 't', Vowel::A }, { U'ち', 't', Vowel::I }, { U'つ', 't', Vowel::U },
            { U'て', 't', Vowel::E }, { U'と', 't', Vowel::O },
            { U'な', 'n', Vowel::A }, { U'に', 'n', Vowel::I }, { U'ぬ', 'n', Vowel::U },
            { U'ね', 'n', Vowel::E }, { U'の', 'n', Vowel::O },
            { U'は', 'h', Vowel::A }, { U'ひ', 'h', Vowel::I }, { U'ふ', 'h', Vowel::U },
            { U'へ', 'h', Vowel::E }, { U'ほ', 'h', Vowel::O },
            { U'ま', 'm', Vowel::A }, { U'み', 'm', Vowel::I }, { U'む', 'm', Vowel::U },
            { U'め', 'm', Vowel::E }, { U'も', 'm', Vowel::O },
            { U'や', 'y', Vowel::A }, { U'ゆ', 'y', Vowel::U }, { U'よ', 'y', Vowel::O },
            { U'ら', 'r', Vowel::A }, { U'り', 'r', Vowel::I }, { U'る', 'r', Vowel::U },
            { U'れ', 'r', Vowel::E }, { U'ろ', 'r', Vowel::O },
            { U'わ', 'w', Vowel::A }, { U'を', 'w', Vowel::O },
            { U'が', 'g', Vowel::A }, { U'ぎ', 'g', Vowel::I }, { U'ぐ', 'g', Vowel::U },
            { U'げ', 'g', Vowel::E }, { U'ご', 'g', Vowel::O },
            { U'ざ', 'z', Vowel::A }, { U'じ', 'z', Vowel::I }, { U'ず', 'z', Vowel::U },
            { U'ぜ', 'z', Vowel::E }, { U'ぞ', 'z', Vowel::O },
            { U'だ', 'd', Vowel::A }, { U'ぢ', 'd', Vowel::I }, { U'づ', 'd', Vowel::U },
            { U'で', 'd', Vowel::E }, { U'ど', 'd', Vowel::O },
            { U'ば', 'b', Vowel::A }, { U'び', 'b', Vowel::I }, { U'ぶ', 'b', Vowel::U },
            { U'べ', 'b', Vowel::E }, { U'ぼ', 'b', Vowel::O },
            { U'ぱ', 'p', Vowel::A }, { U'ぴ', 'p', Vowel::I }, { U'ぷ', 'p', Vowel::U },
            { U'ぺ', 'p', Vowel::E }, { U'ぽ', 'p', Vowel::O },
        };

        struct ConsonantEntry {
            char consonant;
            float factor;
        };

        const ConsonantEntry kConsonantFactors[] = {
            { 'k', 0.5f }, { 's', 0.4f }, { 't', 0.4f }, { 'n', 0.6f },
            { 'h', 0.5f }, { 'm', 0.6f }, { 'y', 0.7f }, { 'r', 0.6f },
            { 'w', 0.7f }, { 'g', 0.5f }, { 'z', 0.4f }, { 'd', 0.4f },
            { 'b', 0.5f }, { 'p', 0.5f },
        };

        const float kNasalOpenness = 0.2f;
        const float kGeminateOpenness = 0.1f;
        const float kLongVowelOpenness = 0.3f;

        // Decodes UTF-8 into code points, stopping at the first malformed
        // sequence.
        std::vector<char32_t> DecodeUtf8(const std::string& text) {
            std::vector<char32_t> out;
            size_t i = 0;
            while (i < text.size()) {
                unsigned char c = static_cast<unsigned char>(text[i]);
                char32_t cp = 0;
                size_t extra = 0;
                if (c < 0x80) {
                    cp = c;
                }
                else if ((c & 0xE0) == 0xC0) {
                    cp = c & 0x1F;
                    extra = 1;
                }
                else if ((c & 0xF0) == 0xE0) {
                    cp = c & 0x0F;
                    extra = 2;
                }
                else if ((c & 0xF8) == 0xF0) {
                    cp = c & 0x07;
                    extra = 3;
                }
                else {
                    break;
                }
                if (i + extra >= text.size()) {
                    break;
                }
                bool valid = true;
                for (size_t k = 1; k <= extra; ++k) {
                    unsigned char cc = static_cast<unsigned char>(text[i + k]);
                    if ((cc & 0xC0) != 0x80) {
                        valid = false;
                        break;
                    }
                    cp = (cp << 6) | (cc & 0x3F);
                }
                if (!valid)
                    break;
                out.push_back(cp);
                i += extra + 1;
            }
            return out;
        }

        // Katakana U+30A1..U+30F6 sit exactly 0x60 above their hiragana.
        char32_t FoldToHiragana(char32_t cp) {
            if (cp >= 0x30A1 && cp <= 0x30F6) {
                return cp - 0x60;
            }
            return cp;
        }

        const KanaEntry* FindKana(char32_t cp) {
            for (const auto& entry : kKanaTable) {
                if (entry.kana == cp)
                    return &entry;
            }
            return nullptr;
        }

        // Small kana that replace the vowel of the preceding kana (kya, fa, ...).
        bool SmallKanaVowel(char32_t cp, Vowel* vowel) {
            switch (cp) {
            case U'ゃ': case U'ぁ': *vowel = Vowel::A; return true;
            case U'ぃ': *vowel = Vowel::I; return true;
            case U'ゅ': case U'ぅ': *vowel = Vowel::U; return true;
            case U'ぇ': *vowel = Vowel::E; return true;
            case U'ょ': case U'ぉ': *vowel = Vowel::O; return true;
            default: return false;
            }
        }

    }  // namespace

    MoraShape ClassifyMora(const std::string& text) {
        MoraShape shape;
        std::vector<char32_t> cps = DecodeUtf8(text);
        if (cps.empty()) {
            return shape;
        }
        for (char32_t& cp : cps) {
            cp = FoldToHiragana(cp);
        }

        switch (cps[0]) {
        case U'ん':
            shape.mora_class = MoraClass::Nasal;
            return shape;
        case U'っ':
            shape.mora_class = MoraClass::Geminate;
            return shape;
        case U'ー':
            shape.mora_class = MoraClass::LongVowel;
            return shape;
        default:
            break;
        }

        const KanaEntry* entry = FindKana(cps[0]);
        if (entry == nullptr) {
            return shape;
        }
        shape.vowel = entry->vowel;
        shape.consonant = entry->consonant;

        Vowel glide_vowel;
        if (cps.size() >= 2 && SmallKanaVowel(cps[1], &glide_vowel)) {
            shape.vowel = glide_vowel;
        }

        shape.mora_class = shape.consonant != 0 ? MoraClass::ConsonantVowel : MoraClass::Vowel;
        return shape;
    }

    float VowelOpenness(Vowel vowel) {
        switch (vowel) {
        case Vowel::A: return 1.0f;
        case Vowel::I: return 0.3f;
        case Vowel::U: return 0.3f;
        case Vowel::E: return 0.7f;
        case Vowel::O: return 0.7f;
        }
        return 1.0f;
    }

    float ConsonantFactor(char consonant) {
        for (const auto& entry : kConsonantFactors) {
            if (entry.consonant == consonant)
                return entry.factor;
        }
        return 1.0f;
    }

    float ShapeOpenness(const MoraShape& shape) {
        switch (shape.mora_class) {
        case MoraClass::Nasal: return kNasalOpenness;
        case MoraClass::Geminate: return kGeminateOpenness;
        case MoraClass::LongVowel: return kLongVowelOpenness;
        case MoraClass::ConsonantVowel:
            return VowelOpenness(shape.vowel) * ConsonantFactor(shape.consonant);
        case MoraClass::Vowel:
            break;
        }
        return VowelOpenness(shape.vowel);
    }

    float MoraBaseOpenness(const std::string& text) {
        return ShapeOpenness(ClassifyMora(text));
    }

    float ComputeMouthOpenness(const TimingData& timing, double t_ms) {
        if (!std::isfinite(t_ms)) {
            return 0.0f;
        }

        for (const auto& phrase : timing.accent_phrases) {
            const auto& moras = phrase.moras;
            for (size_t i = 0; i < moras.size(); ++i) {
                const Mora& mora = moras[i];

                // Smooth rise and fall inside the mora, peaking at its midpoint.
                if (mora.end_ms > mora.start_ms && t_ms >= mora.start_ms && t_ms < mora.end_ms) {
                    double phase = (t_ms - mora.start_ms) / (mora.end_ms - mora.start_ms);
                    double value = MoraBaseOpenness(mora.text) *
                        std::sin(phase * glm::pi<double>());
                    return glm::clamp(static_cast<float>(value), 0.0f, 1.0f);
                }

                // Silence between two moras of the same phrase.
                if (i + 1 < moras.size()) {
                    const Mora& next = moras[i + 1];
                    if (t_ms >= mora.end_ms && t_ms < next.start_ms) {
                        double u = (t_ms - mora.end_ms) / (next.start_ms - mora.end_ms);
                        float from = MoraBaseOpenness(mora.text);
                        float to = MoraBaseOpenness(next.text);
                        return glm::clamp(glm::mix(from, to, static_cast<float>(u)), 0.0f, 1.0f);
                    }
                }
            }
        }

        return 0.0f;
    }

}  // namespace KUCHIPAKU
