#include "storage/redis/server_address.h"

#include <cstdlib>

#include <absl/strings/numbers.h>
#include <absl/strings/str_cat.h>

#include "common/config.h"
#include "common/error.h"

namespace rcache::storage {

std::string ServerAddress::ToString() const {
    return absl::StrCat(host, ":", port);
}

absl::StatusOr<ServerAddress> ParseServerAddress(std::string_view text) {
    ServerAddress address;
    if (text.empty()) {
        return address;
    }

    std::string_view host = text;
    std::string_view port;
    const auto colon = text.rfind(':');
    if (colon != std::string_view::npos) {
        host = text.substr(0, colon);
        port = text.substr(colon + 1);
    }

    if (!host.empty()) {
        address.host = std::string(host);
    }
    if (!port.empty()) {
        uint32_t parsed = 0;
        if (!absl::SimpleAtoi(absl::string_view(port.data(), port.size()), &parsed) || parsed == 0 || parsed > 65535) {
            return MakeError(ErrorCode::kConfigurationError,
                             absl::StrCat("Invalid port in cache server address '",
                                          absl::string_view(text.data(), text.size()), "'"));
        }
        address.port = static_cast<uint16_t>(parsed);
    }
    return address;
}

absl::StatusOr<ServerAddress> ResolveServerAddress() {
    const char* value = std::getenv(kServerEnvVar);
    return ParseServerAddress(value != nullptr ? std::string_view(value)
                                               : std::string_view());
}

}  // namespace rcache::storage
