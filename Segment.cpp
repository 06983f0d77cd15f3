#include "Segment.hpp"

namespace KUCHIPAKU {

    const char* RoleName(Role role) {
        switch (role) {
        case Role::Lead: return "lead";
        case Role::Foil: return "foil";
        }
        return "lead";
    }

    bool ParseRole(const std::string& name, Role* role) {
        if (name == "lead" || name == "tsukkomi") {
            *role = Role::Lead;
            return true;
        }
        if (name == "foil" || name == "boke") {
            *role = Role::Foil;
            return true;
        }
        return false;
    }

}  // namespace KUCHIPAKU
