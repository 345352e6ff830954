#pragma once

#include "runtime/Engine.hpp"
#include "support/FakeAdapter.hpp"
#include "support/FakeProcess.hpp"
#include "support/MemoryStore.hpp"
#include "util/TempDir.hpp"
#include "util/timestamp.hpp"

#include <gtest/gtest.h>

namespace ovdm::test {

// An engine wired to in-memory records, a scripted adapter and a recording process runner.
class EngineFixture : public ::testing::Test {
protected:
    static constexpr unsigned int kScsId = 1;

    util::TempDir tmp{"ovdm-engine"};
    std::shared_ptr<MemoryStore> store = std::make_shared<MemoryStore>();
    std::shared_ptr<RecordingRunner> runner = std::make_shared<RecordingRunner>();
    std::shared_ptr<AdapterScript> script = std::make_shared<AdapterScript>();
    std::shared_ptr<runtime::Engine> engine;

    static types::TransferDefinition scs() {
        types::TransferDefinition def;
        def.id = kScsId;
        def.name = "SCS";
        def.category = types::Category::CollectionSystem;
        def.transfer_type = types::TransferType::LocalDirectory;
        def.source_dir = "/instrument";
        def.dest_dir = "SCS";
        def.enable = true;
        return def;
    }

    [[nodiscard]] config::Config baseConfig() const {
        config::Config cfg;
        cfg.warehouse.base_dir = tmp.path();
        cfg.hooks.clear();
        return cfg;
    }

    void boot(config::Config cfg) {
        engine = std::make_shared<runtime::Engine>(std::move(cfg), store, runner,
                                                   std::make_shared<FakeAdapterFactory>(script));
        engine->start();
    }

    void SetUp() override {
        store->put(scs());

        types::VoyageContext voyage;
        voyage.cruise_id = "FK001";
        voyage.system_on = true;
        store->setVoyage(voyage);

        script->report.pass("Source directory");
        script->candidates = {{"a.raw", 10, util::now() - 3600, false}};
        script->copy.new_files = {"a.raw"};
        script->copy.file_count = 1;
        script->copy.bytes_moved = 10;
    }

    void TearDown() override {
        if (engine) engine->shutdown();
    }

    [[nodiscard]] types::Status status(const unsigned int id = kScsId) const {
        return engine->snapshot(id).status;
    }
};

}
