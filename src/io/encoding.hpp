#pragma once
#include <iconv.h>
#include <algorithm>
#include <cerrno>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "../util/log.hpp"
#include "../util/strings.hpp"

namespace dsprof {

// Owns one iconv conversion descriptor.
class iconv_handle {
public:
    iconv_handle(const std::string& to, const std::string& from)
        : cd_(::iconv_open(to.c_str(), from.c_str())) {}
    ~iconv_handle() { if (valid()) ::iconv_close(cd_); }
    iconv_handle(const iconv_handle&) = delete;
    iconv_handle& operator=(const iconv_handle&) = delete;

    bool valid() const { return cd_ != reinterpret_cast<iconv_t>(-1); }
    iconv_t get() const { return cd_; }

private:
    iconv_t cd_;
};

enum class decode_mode { strict, lossy };

// Converts `bytes` from `encoding` to UTF-8.
// strict: nullopt on any invalid or truncated sequence, or when the result holds NUL.
// lossy: invalid bytes are dropped.
inline std::optional<std::string> decode_to_utf8(std::string_view bytes,
                                                 const std::string& encoding,
                                                 decode_mode mode = decode_mode::strict)
{
    iconv_handle h("UTF-8", encoding);
    if (!h.valid()) {
        log_warn("encoding '{}' is not supported by iconv", encoding);
        return std::nullopt;
    }

    std::string out;
    out.resize(bytes.size() + bytes.size() / 2 + 16);
    char* in_ptr = const_cast<char*>(bytes.data());
    std::size_t in_left = bytes.size();
    std::size_t produced = 0;

    while (in_left > 0) {
        char* out_ptr = out.data() + produced;
        std::size_t out_left = out.size() - produced;
        const std::size_t rc = ::iconv(h.get(), &in_ptr, &in_left, &out_ptr, &out_left);
        produced = out.size() - out_left;
        if (rc != static_cast<std::size_t>(-1)) break;

        if (errno == E2BIG) {
            out.resize(out.size() * 2 + 64);
        } else if (errno == EILSEQ || errno == EINVAL) {
            if (mode == decode_mode::strict) return std::nullopt;
            ++in_ptr;
            --in_left;
            ::iconv(h.get(), nullptr, nullptr, nullptr, nullptr); // reset shift state
        } else {
            return std::nullopt;
        }
    }
    out.resize(produced);

    if (mode == decode_mode::strict && out.find('\0') != std::string::npos) return std::nullopt;
    if (mode == decode_mode::lossy) out.erase(std::remove(out.begin(), out.end(), '\0'), out.end());
    return out;
}

inline bool has_utf16_bom(std::string_view bytes) {
    return bytes.size() >= 2 &&
           ((static_cast<unsigned char>(bytes[0]) == 0xFF && static_cast<unsigned char>(bytes[1]) == 0xFE) ||
            (static_cast<unsigned char>(bytes[0]) == 0xFE && static_cast<unsigned char>(bytes[1]) == 0xFF));
}

inline void strip_utf8_bom(std::string& s) {
    if (s.size() >= 3 && static_cast<unsigned char>(s[0]) == 0xEF &&
        static_cast<unsigned char>(s[1]) == 0xBB && static_cast<unsigned char>(s[2]) == 0xBF)
        s.erase(0, 3);
}

struct DecodedText {
    std::string text;
    std::string encoding; // candidate that succeeded, or "UTF-8 (lossy)"
    bool lossy = false;
};

// Tries each candidate in order, then lossy UTF-8. A UTF-16 BOM promotes UTF-16 to the front.
inline DecodedText decode_with_fallback(std::string_view bytes, std::vector<std::string> candidates) {
    if (has_utf16_bom(bytes)) {
        auto it = std::find_if(candidates.begin(), candidates.end(),
                               [](const std::string& c) { return iequals(c, "UTF-16"); });
        if (it != candidates.end()) std::rotate(candidates.begin(), it, it + 1);
        else candidates.insert(candidates.begin(), "UTF-16");
    }

    for (const auto& enc : candidates) {
        if (auto text = decode_to_utf8(bytes, enc, decode_mode::strict)) {
            strip_utf8_bom(*text);
            log_debug("decoded input as {}", enc);
            return DecodedText{std::move(*text), enc, false};
        }
        log_debug("decode as {} failed", enc);
    }

    log_warn("no candidate encoding decoded cleanly; falling back to lossy UTF-8");
    auto text = decode_to_utf8(bytes, "UTF-8", decode_mode::lossy);
    DecodedText out{text ? std::move(*text) : std::string{}, "UTF-8 (lossy)", true};
    strip_utf8_bom(out.text);
    return out;
}

}
