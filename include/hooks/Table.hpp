#pragma once

#include "concurrency/TaskKind.hpp"

#include <map>
#include <string>
#include <vector>

namespace ovdm::hooks {

// Static fan-out: which task kinds follow a successful job of a given kind.
class Table {
public:
    using Edges = std::map<concurrency::TaskKind, std::vector<concurrency::TaskKind>>;

    Table() = default;

    // Throws std::invalid_argument if the edges contain a cycle.
    explicit Table(Edges edges);

    // Throws std::invalid_argument for unknown task names or cycles.
    static Table fromConfig(const std::map<std::string, std::vector<std::string>>& config);

    [[nodiscard]] const std::vector<concurrency::TaskKind>& followOns(concurrency::TaskKind kind) const;

    // Every task kind named anywhere in the table.
    [[nodiscard]] std::vector<concurrency::TaskKind> kinds() const;

    [[nodiscard]] const Edges& edges() const { return edges_; }

private:
    Edges edges_;

    void checkAcyclic() const;
};

}
