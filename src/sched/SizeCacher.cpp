#include "sched/SizeCacher.hpp"
#include "util/files.hpp"
#include "util/timestamp.hpp"
#include "log/Registry.hpp"

#include <algorithm>
#include <chrono>

namespace fs = std::filesystem;

using namespace ovdm::sched;
using namespace ovdm::types;
using namespace ovdm::log;

SizeCacher::SizeCacher(std::shared_ptr<tasks::Context> ctx) : AsyncService("SizeCacher"), ctx_(std::move(ctx)) {}

SizeCacher::~SizeCacher() {
    stop();
}

SizeSnapshot SizeCacher::refresh() const {
    SizeSnapshot sizes;
    sizes.updated_at = util::now();

    const auto voyage = ctx_->store->voyageContext();
    if (voyage.cruiseActive()) {
        const auto cruiseDir = ctx_->filter->cruiseDir(voyage);
        if (fs::is_directory(cruiseDir)) sizes.cruise_bytes = util::directorySize(cruiseDir);

        if (voyage.loweringActive()) {
            const auto loweringDir = ctx_->filter->loweringDir(voyage);
            if (fs::is_directory(loweringDir)) sizes.lowering_bytes = util::directorySize(loweringDir);
        }
    }

    ctx_->tracker->updateSizes(sizes);
    Registry::sched()->trace("[SizeCacher] cruise={} lowering={}", sizes.cruise_bytes.value_or(0), sizes.lowering_bytes.value_or(0));
    return sizes;
}

void SizeCacher::runLoop() {
    const auto interval = std::chrono::seconds(std::max(1u, ctx_->config.size_cacher.interval_seconds));
    while (!interruptFlag_.load()) {
        try {
            refresh();
        } catch (const std::exception& e) {
            Registry::sched()->warn("[SizeCacher] Refresh failed: {}", e.what());
        }
        if (!waitFor(interval)) break;
    }
}
