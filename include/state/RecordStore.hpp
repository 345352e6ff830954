#pragma once

#include "types/TransferDefinition.hpp"
#include "types/VoyageContext.hpp"

#include <optional>
#include <vector>

namespace ovdm::state {

// Persisted records the engine reads (definitions, voyage) and the few fields it writes back.
class RecordStore {
public:
    virtual ~RecordStore() = default;

    virtual std::optional<types::TransferDefinition> definition(unsigned int id) = 0;
    virtual std::vector<types::TransferDefinition> definitions() = 0;
    virtual std::optional<types::ExtraDirectory> extraDirectory(unsigned int id) = 0;
    virtual types::VoyageContext voyageContext() = 0;

    virtual void saveLiveState(unsigned int id, const types::LiveState& state) = 0;
    virtual void saveSizes(const types::SizeSnapshot& sizes) = 0;
};

}
