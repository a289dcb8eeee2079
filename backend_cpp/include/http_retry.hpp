#pragma once
#include <chrono>
#include <memory>
#include <thread>
#include <cpr/cpr.h>
#include <spdlog/spdlog.h>
#include "KeyManager.hpp"

namespace code_intelligence {

// Retries quota (429) and overload (503) answers, rotating the API key
// between attempts. `request_factory` must rebuild the URL each call so
// the rotated key is picked up.
template<typename Func>
cpr::Response perform_request_with_retry(Func request_factory, const std::shared_ptr<KeyManager>& km,
                                         int max_retries = 4) {
    cpr::Response r;
    for (int i = 0; i < max_retries; ++i) {
        r = request_factory();
        if (r.status_code == 200) return r;
        if ((r.status_code == 429 || r.status_code == 503) && km) {
            spdlog::warn("⚠️ API {} ({}). Rotating key and cooling down (Attempt {}/{})...",
                         r.status_code, (r.status_code == 429 ? "Quota" : "Overload"), i + 1, max_retries);
            km->report_rate_limit();
            // Backoff grows each attempt (2s, 3s, 4s...)
            std::this_thread::sleep_for(std::chrono::milliseconds(2000 + (i * 1000)));
            continue;
        }
        break;
    }
    return r;
}

} // namespace code_intelligence
