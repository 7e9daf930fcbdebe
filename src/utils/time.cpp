#include "receptionist/utils/time.hpp"

#include <absl/time/time.h>

namespace receptionist::utils {

std::string format_timestamp(std::chrono::system_clock::time_point at) {
    return absl::FormatTime("%Y-%m-%dT%H:%M:%E3SZ", absl::FromChrono(at), absl::UTCTimeZone());
}

}
