#ifndef REPLIBENCH_KV_TYPES_H_
#define REPLIBENCH_KV_TYPES_H_

#include <chrono>
#include <cstdint>
#include <string>

namespace Replibench {

typedef int64_t Key;
typedef int64_t Value;

// Note: if you change this enum, change the enum in kvproto.proto as well!
enum Operation : uint8_t {
    NONE = 0,
    GET = 1,
    PUT = 2,
};

struct Command {
    Operation op = NONE;
    Key key = 0;
    Value value = 0;
};

inline const char* OperationName(Operation op) {
    switch (op) {
        case GET: return "GET";
        case PUT: return "PUT";
        default: return "NONE";
    }
}

/// Wall-clock milliseconds since the Unix epoch. Replicas echo this value
/// back, so both ends must agree on the unit.
inline int64_t MakeTimestamp(int64_t offset_ms = 0) {
    auto now = std::chrono::system_clock::now().time_since_epoch();
    return std::chrono::duration_cast<std::chrono::milliseconds>(now).count() + offset_ms;
}

} // namespace Replibench

#endif // REPLIBENCH_KV_TYPES_H_
