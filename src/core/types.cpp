#include <date_mcp/core/types.hpp>

#include <algorithm>

namespace date_mcp {

namespace {

bool IsZoneChar(char c) {
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
           (c >= '0' && c <= '9') || c == '_' || c == '-' || c == '+' ||
           c == '/';
}

} // anonymous namespace

bool IsValidUtf8(std::string_view s) {
    size_t i = 0;
    while (i < s.size()) {
        auto c = static_cast<unsigned char>(s[i]);
        if (c < 0x80) {
            ++i;
            continue;
        }

        size_t len = 0;
        unsigned char lo = 0x80;
        unsigned char hi = 0xBF;
        if (c >= 0xC2 && c <= 0xDF) {
            len = 2;
        } else if (c >= 0xE0 && c <= 0xEF) {
            len = 3;
            if (c == 0xE0) lo = 0xA0;       // overlong
            if (c == 0xED) hi = 0x9F;       // surrogates
        } else if (c >= 0xF0 && c <= 0xF4) {
            len = 4;
            if (c == 0xF0) lo = 0x90;       // overlong
            if (c == 0xF4) hi = 0x8F;       // > U+10FFFF
        } else {
            return false;
        }

        if (i + len > s.size()) return false;
        auto second = static_cast<unsigned char>(s[i + 1]);
        if (second < lo || second > hi) return false;
        for (size_t k = 2; k < len; ++k) {
            auto cont = static_cast<unsigned char>(s[i + k]);
            if (cont < 0x80 || cont > 0xBF) return false;
        }
        i += len;
    }
    return true;
}

Result<TimezoneId, std::string> TimezoneId::Create(std::string_view id) {
    if (id.empty()) {
        return Result<TimezoneId, std::string>::Err(
            "Timezone identifier must not be empty");
    }
    if (id.size() > 255) {
        return Result<TimezoneId, std::string>::Err(
            "Timezone identifier must be at most 255 characters, got " +
            std::to_string(id.size()));
    }
    if (!std::all_of(id.begin(), id.end(), IsZoneChar)) {
        return Result<TimezoneId, std::string>::Err(
            "Timezone identifier '" + std::string(id) +
            "' contains invalid characters");
    }
    if (id.front() == '/' || id.back() == '/') {
        return Result<TimezoneId, std::string>::Err(
            "Timezone identifier '" + std::string(id) +
            "' must not start or end with '/'");
    }

    size_t start = 0;
    while (start <= id.size()) {
        auto slash = id.find('/', start);
        auto segment = id.substr(start, slash == std::string_view::npos
                                            ? std::string_view::npos
                                            : slash - start);
        if (segment.empty()) {
            return Result<TimezoneId, std::string>::Err(
                "Timezone identifier '" + std::string(id) +
                "' has an empty segment");
        }
        if (slash == std::string_view::npos) break;
        start = slash + 1;
    }

    return Result<TimezoneId, std::string>::Ok(TimezoneId(std::string(id)));
}

} // namespace date_mcp
