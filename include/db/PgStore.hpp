#pragma once

#include "state/RecordStore.hpp"

namespace ovdm::db {

// RecordStore over the PostgreSQL tables. Every call runs in its own transaction.
class PgStore final : public state::RecordStore {
public:
    std::optional<types::TransferDefinition> definition(unsigned int id) override;
    std::vector<types::TransferDefinition> definitions() override;
    std::optional<types::ExtraDirectory> extraDirectory(unsigned int id) override;
    types::VoyageContext voyageContext() override;

    void saveLiveState(unsigned int id, const types::LiveState& state) override;
    void saveSizes(const types::SizeSnapshot& sizes) override;
};

}
