#pragma once

#include "types/TransferDefinition.hpp"

#include <array>
#include <string>

namespace ovdm::concurrency {

enum class TaskKind {
    RunCollectionSystemTransfer,
    RunCruiseDataTransfer,
    RunShipToShoreTransfer,
    TestCollectionSystemTransfer,
    TestCruiseDataTransfer,
    StopJob,
    UpdateDataDashboard,
    UpdateMD5Summary,
    RebuildCruiseDirectory,
    PostCollectionSystemTransfer,
    PostDataDashboard
};

inline constexpr std::array kAllTaskKinds = {
    TaskKind::RunCollectionSystemTransfer,
    TaskKind::RunCruiseDataTransfer,
    TaskKind::RunShipToShoreTransfer,
    TaskKind::TestCollectionSystemTransfer,
    TaskKind::TestCruiseDataTransfer,
    TaskKind::StopJob,
    TaskKind::UpdateDataDashboard,
    TaskKind::UpdateMD5Summary,
    TaskKind::RebuildCruiseDirectory,
    TaskKind::PostCollectionSystemTransfer,
    TaskKind::PostDataDashboard
};

std::string to_string(TaskKind kind);
TaskKind taskKindFromString(const std::string& str);

// Pool size used when the configuration does not name one.
unsigned int defaultPoolSize(TaskKind kind);

TaskKind runTaskFor(types::Category category);
TaskKind testTaskFor(types::Category category);

}
