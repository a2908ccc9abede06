#include "version.h"

#include <sstream>

namespace Replibench {

std::string Version::ToString() const {
    std::ostringstream oss;
    oss << *this;
    return oss.str();
}

std::ostream& operator<<(std::ostream& os, const Version& v) {
    return os << "sId: " << v.server_id << ", tId: " << v.thread_id
              << ", ts: " << v.ts << ", R: " << v.r;
}

} // namespace Replibench
