#pragma once
#include <cctype>
#include <cstdint>
#include <iomanip>
#include <random>
#include <sstream>
#include <string>

namespace warden::core::config {

    constexpr std::size_t kMaxSessionIdLength = 64;

    // "sess-" followed by a random 32-bit value as 8 lowercase hex digits.
    inline std::string generate_session_id() {
        static thread_local std::mt19937 gen{std::random_device{}()};
        std::uniform_int_distribution<std::uint32_t> dis;

        std::ostringstream ss;
        ss << "sess-" << std::hex << std::setw(8) << std::setfill('0') << dis(gen);
        return ss.str();
    }

    // Session ids are written verbatim into log lines and audit records.
    inline bool is_valid_session_id(const std::string& id) {
        if (id.empty() || id.size() > kMaxSessionIdLength) {
            return false;
        }
        for (const char c : id) {
            const auto u = static_cast<unsigned char>(c);
            if (!std::isalnum(u) && c != '-' && c != '_' && c != '.') {
                return false;
            }
        }
        return true;
    }

} // namespace warden::core::config
