#ifndef MOUTH_TARGET_H_
#define MOUTH_TARGET_H_

namespace KUCHIPAKU {

    // Receives the single mouth-aperture parameter of one character.
    class MouthTarget {
    public:
        virtual ~MouthTarget() = default;
        // openness is in [0, 1]; 0 is closed.
        virtual void SetMouthOpenness(float openness) = 0;
    };

}  // namespace KUCHIPAKU

#endif
