#pragma once
#include <filesystem>
#include <fstream>
#include <cctype>
#include <cstdint>
#include <sstream>
#include <string>
#include <string_view>
#include <system_error>

#include "../core/errors.hpp"

namespace dsprof {

inline std::uintmax_t file_size_bytes(const std::filesystem::path& p) {
    std::error_code ec;
    auto sz = std::filesystem::file_size(p, ec);
    return ec ? 0u : static_cast<std::uintmax_t>(sz);
}

inline std::string read_file_bytes(const std::filesystem::path& p) {
    std::ifstream f(p, std::ios::binary);
    if (!f) throw Error("failed to open: " + p.string());
    std::ostringstream oss;
    oss << f.rdbuf();
    return oss.str();
}

inline void write_file_bytes(const std::filesystem::path& p, std::string_view bytes) {
    std::ofstream f(p, std::ios::binary | std::ios::trunc);
    if (!f) throw Error("failed to open for write: " + p.string());
    f.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    if (!f) throw Error("failed to write: " + p.string());
}

// Lower-cased extension including the dot; "" when there is none.
inline std::string lower_extension(std::string_view filename) {
    std::string ext = std::filesystem::path(std::string(filename)).extension().string();
    for (auto& c : ext) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return ext;
}

}
