#ifndef MORA_OPENNESS_H_
#define MORA_OPENNESS_H_

#include <string>

#include "TimingData.hpp"

namespace KUCHIPAKU {

    enum class Vowel {
        A,
        I,
        U,
        E,
        O
    };

    enum class MoraClass {
        Vowel,           // bare vowel
        ConsonantVowel,  // vowel scaled by the consonant family
        Nasal,           // moraic n
        Geminate,        // small tsu
        LongVowel        // prolonged sound mark
    };

    struct MoraShape {
        MoraClass mora_class = MoraClass::Vowel;
        Vowel vowel = Vowel::A;
        // Romaji initial of the consonant row ('k', 's', ...), 0 for none.
        char consonant = 0;
    };

    // Classifies one kana mora (UTF-8, hiragana or katakana). Anything that is
    // not recognized is treated as the fully open vowel.
    MoraShape ClassifyMora(const std::string& text);

    float VowelOpenness(Vowel vowel);
    // Returns 1.0 for consonants without a scaling factor.
    float ConsonantFactor(char consonant);
    float ShapeOpenness(const MoraShape& shape);

    // Peak openness of a mora, in [0, 1].
    float MoraBaseOpenness(const std::string& text);

    // Mouth openness in [0, 1] at t_ms on the timing's clock:
    //  - inside a mora window [start, end): base * sin(phase * pi);
    //  - between two moras of the same phrase: linear blend of their bases;
    //  - anywhere else, or with no data: 0.
    float ComputeMouthOpenness(const TimingData& timing, double t_ms);

}  // namespace KUCHIPAKU

#endif
