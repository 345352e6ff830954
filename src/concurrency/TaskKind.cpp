#include "concurrency/TaskKind.hpp"

#include <stdexcept>

using namespace ovdm::concurrency;
using ovdm::types::Category;

std::string ovdm::concurrency::to_string(const TaskKind kind) {
    switch (kind) {
        case TaskKind::RunCollectionSystemTransfer: return "runCollectionSystemTransfer";
        case TaskKind::RunCruiseDataTransfer: return "runCruiseDataTransfer";
        case TaskKind::RunShipToShoreTransfer: return "runShipToShoreTransfer";
        case TaskKind::TestCollectionSystemTransfer: return "testCollectionSystemTransfer";
        case TaskKind::TestCruiseDataTransfer: return "testCruiseDataTransfer";
        case TaskKind::StopJob: return "stopJob";
        case TaskKind::UpdateDataDashboard: return "updateDataDashboard";
        case TaskKind::UpdateMD5Summary: return "updateMD5Summary";
        case TaskKind::RebuildCruiseDirectory: return "rebuildCruiseDirectory";
        case TaskKind::PostCollectionSystemTransfer: return "postCollectionSystemTransfer";
        case TaskKind::PostDataDashboard: return "postDataDashboard";
        default: throw std::invalid_argument("Unknown task kind");
    }
}

TaskKind ovdm::concurrency::taskKindFromString(const std::string& str) {
    for (const auto kind : kAllTaskKinds)
        if (to_string(kind) == str) return kind;
    throw std::invalid_argument("Unknown task name: " + str);
}

unsigned int ovdm::concurrency::defaultPoolSize(const TaskKind kind) {
    switch (kind) {
        case TaskKind::RunCollectionSystemTransfer:
        case TaskKind::RunCruiseDataTransfer:
        case TaskKind::RunShipToShoreTransfer:
            return 2;
        default:
            return 1;
    }
}

TaskKind ovdm::concurrency::runTaskFor(const Category category) {
    switch (category) {
        case Category::CollectionSystem: return TaskKind::RunCollectionSystemTransfer;
        case Category::CruiseData: return TaskKind::RunCruiseDataTransfer;
        case Category::ShipToShore: return TaskKind::RunShipToShoreTransfer;
        default: throw std::invalid_argument("Unknown transfer category");
    }
}

TaskKind ovdm::concurrency::testTaskFor(const Category category) {
    return category == Category::CollectionSystem ? TaskKind::TestCollectionSystemTransfer
                                                  : TaskKind::TestCruiseDataTransfer;
}
