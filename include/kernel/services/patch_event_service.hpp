#pragma once

#include <cstddef>
#include <mutex>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "oxp_types.hpp"

namespace oxp {

class OOXPATCH_API PatchEventService {
 public:
  struct PatchEvent {
    size_t index;        // submission index
    std::string kind;
    std::string target;
    std::string source;  // handler | cache | recovery | failed
    double elapsed_ms;
  };

  void push(size_t index, const std::string& kind, const std::string& target,
            const std::string& source, double ms);
  std::vector<PatchEvent> drain();

 private:
  std::mutex mutex_;
  std::vector<PatchEvent> buffer_;
};

OOXPATCH_API void to_json(nlohmann::json& j, const PatchEventService::PatchEvent& event);

}  // namespace oxp
