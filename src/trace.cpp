#include "trace.hpp"

const char* phase_name(Phase p) {
    switch (p) {
        case Phase::Fetch:   return "FET";
        case Phase::Resolve: return "RES";
        case Phase::Execute: return "EXE";
    }
    return "?";
}
