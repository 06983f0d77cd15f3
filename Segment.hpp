#ifndef SEGMENT_H_
#define SEGMENT_H_

#include <memory>
#include <string>

#include "Transport.hpp"

namespace KUCHIPAKU {

    // LEAD is the straight man (tsukkomi), FOIL the funny one (boke).
    enum class Role {
        Lead,
        Foil
    };

    const char* RoleName(Role role);

    // Accepts "lead"/"foil" and the script generator's "tsukkomi"/"boke".
    bool ParseRole(const std::string& name, Role* role);

    // One line of dialogue. Owns its audio handle, so reordering or replacing
    // the list can never pair a line with another line's audio.
    struct Segment {
        Role role = Role::Lead;
        std::string text;
        int speaker_id = 1;
        // Pre-rendered timing data for this line, empty when it must be fetched.
        std::string timing_path;
        std::unique_ptr<Transport> transport;
    };

}  // namespace KUCHIPAKU

#endif
