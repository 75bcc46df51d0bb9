#include "cache/expiry.h"

#include <cmath>
#include <limits>

#include <absl/strings/str_cat.h>

#include "common/error.h"

namespace rcache::cache {

absl::StatusOr<std::chrono::milliseconds> ExpiryToMillis(double seconds) {
    if (!std::isfinite(seconds)) {
        return MakeError(ErrorCode::kInvalidArgument, "Expiry time must be finite");
    }

    const double millis = std::trunc(seconds * 1000.0);
    if (millis <= 0.0) {
        return MakeError(ErrorCode::kInvalidArgument,
                         absl::StrCat("Expiry time must be at least 1ms, got ", seconds, "s"));
    }
    if (millis >= static_cast<double>(std::numeric_limits<int64_t>::max())) {
        return MakeError(ErrorCode::kInvalidArgument,
                         absl::StrCat("Expiry time out of range: ", seconds, "s"));
    }
    return std::chrono::milliseconds(static_cast<int64_t>(millis));
}

int64_t RemainingSeconds(int64_t pttl_millis) {
    if (pttl_millis <= 0) {
        return 0;
    }
    return pttl_millis / 1000;
}

}  // namespace rcache::cache
