#pragma once

namespace youwee {

inline const char* appVersion() {
#ifdef YOUWEE_APP_VERSION
    return YOUWEE_APP_VERSION;
#else
    return "0.0.0";
#endif
}

} // namespace youwee
