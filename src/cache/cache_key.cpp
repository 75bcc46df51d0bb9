#include "cache/cache_key.h"

#include <absl/strings/str_cat.h>

namespace rcache::cache {

std::string CacheKey(std::string_view ns, std::string_view key) {
    return absl::StrCat(absl::string_view(ns.data(), ns.size()),
                        absl::string_view(kKeySeparator.data(), kKeySeparator.size()),
                        absl::string_view(key.data(), key.size()));
}

std::string NamespacePrefix(std::string_view ns) {
    return CacheKey(ns, {});
}

std::string EscapeGlob(std::string_view literal) {
    std::string escaped;
    escaped.reserve(literal.size());
    for (char c : literal) {
        switch (c) {
            case '*':
            case '?':
            case '[':
            case ']':
            case '\\':
                escaped.push_back('\\');
                break;
            default:
                break;
        }
        escaped.push_back(c);
    }
    return escaped;
}

}  // namespace rcache::cache
