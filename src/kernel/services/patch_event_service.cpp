#include "kernel/services/patch_event_service.hpp"

namespace oxp {

void PatchEventService::push(size_t index,
                             const std::string& kind,
                             const std::string& target,
                             const std::string& source,
                             double ms) {
    std::lock_guard<std::mutex> lock(mutex_);
    buffer_.push_back(PatchEvent{ index, kind, target, source, ms });
}

std::vector<PatchEventService::PatchEvent> PatchEventService::drain() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<PatchEvent> out;
    out.swap(buffer_);
    return out;
}

void to_json(nlohmann::json& j, const PatchEventService::PatchEvent& event) {
    j = nlohmann::json{
        {"index", event.index},
        {"kind", event.kind},
        {"target", event.target},
        {"source", event.source},
        {"elapsed_ms", event.elapsed_ms},
    };
}

} // namespace oxp
