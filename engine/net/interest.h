#pragma once

#include <cstdint>
#include <string>

namespace iomux {

/**
 * @brief Operations a channel can be registered for
 *
 * kAccept rides on input readiness of a listening socket, kConnect on output
 * readiness of a socket with a connect in progress.
 */
using InterestSet = uint32_t;

namespace interest {
constexpr InterestSet kNone = 0;
constexpr InterestSet kRead = 1u << 0;
constexpr InterestSet kWrite = 1u << 1;
constexpr InterestSet kAccept = 1u << 2;
constexpr InterestSet kConnect = 1u << 3;

constexpr InterestSet kInput = kRead | kAccept;
constexpr InterestSet kOutput = kWrite | kConnect;
constexpr InterestSet kAll = kInput | kOutput;
} // namespace interest

inline std::string interestToString(InterestSet set) {
    if (set == interest::kNone) {
        return "none";
    }
    std::string s;
    auto add = [&s](const char* name) {
        if (!s.empty()) s += "|";
        s += name;
    };
    if (set & interest::kRead) add("read");
    if (set & interest::kWrite) add("write");
    if (set & interest::kAccept) add("accept");
    if (set & interest::kConnect) add("connect");
    return s;
}

} // namespace iomux
