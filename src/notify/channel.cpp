#include "notify/channel.h"

namespace notify {

std::string Snapshot::filename() const {
    const auto pos = path.find_last_of('/');
    std::string base = (pos == std::string::npos) ? path : path.substr(pos + 1);
    if (base.empty()) {
        return "snapshot.jpg";
    }
    return base;
}

const char* to_string(DeliveryStatus s) {
    switch (s) {
        case DeliveryStatus::Delivered: return "delivered";
        case DeliveryStatus::Failed:    return "failed";
        case DeliveryStatus::Skipped:   return "skipped";
    }
    return "unknown";
}

} // namespace notify
