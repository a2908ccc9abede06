#ifndef REPLIBENCH_VERSION_H_
#define REPLIBENCH_VERSION_H_

#include <cstdint>
#include <ostream>
#include <string>
#include <tuple>

namespace Replibench {

/**
 * Version tag of a replicated register value.
 *
 * Versions are ordered by timestamp, then by the random tag, then by the
 * writing server and finally by its thread. Quorum reads use this order to
 * pick one maximal version among the replies of different replicas.
 */
struct Version {
    int32_t server_id = 0;
    int32_t thread_id = 0;
    int64_t ts = 0;
    int32_t r = 0;  // random tag, breaks timestamp collisions

    // Precedence of the fields in the order above. Keep in sync with LargerThan.
    std::tuple<int64_t, int32_t, int32_t, int32_t> OrderKey() const {
        return std::make_tuple(ts, r, server_id, thread_id);
    }

    /// Strictly larger; a version is never larger than itself.
    bool LargerThan(const Version& rhs) const { return OrderKey() > rhs.OrderKey(); }

    bool Equal(const Version& rhs) const { return OrderKey() == rhs.OrderKey(); }

    std::string ToString() const;
};

/// The minimum version, held by a register nobody has written yet.
inline constexpr Version kMinVersion{};

inline bool operator==(const Version& lhs, const Version& rhs) { return lhs.Equal(rhs); }
inline bool operator!=(const Version& lhs, const Version& rhs) { return !lhs.Equal(rhs); }

std::ostream& operator<<(std::ostream& os, const Version& v);

/// Returns the largest version of [first, last), or kMinVersion for an empty range.
template <typename It>
Version MaxVersion(It first, It last) {
    Version max = kMinVersion;
    for (; first != last; ++first) {
        if (first->LargerThan(max)) {
            max = *first;
        }
    }
    return max;
}

} // namespace Replibench

#endif // REPLIBENCH_VERSION_H_
