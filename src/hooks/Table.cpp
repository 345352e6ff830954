#include "hooks/Table.hpp"

#include <fmt/format.h>
#include <set>
#include <stdexcept>

using namespace ovdm::hooks;
using namespace ovdm::concurrency;

Table::Table(Edges edges) : edges_(std::move(edges)) {
    checkAcyclic();
}

Table Table::fromConfig(const std::map<std::string, std::vector<std::string>>& config) {
    Edges edges;
    for (const auto& [name, followers] : config) {
        auto& out = edges[taskKindFromString(name)];
        for (const auto& follower : followers) out.push_back(taskKindFromString(follower));
    }
    return Table(std::move(edges));
}

const std::vector<TaskKind>& Table::followOns(const TaskKind kind) const {
    static const std::vector<TaskKind> none;
    const auto it = edges_.find(kind);
    return it == edges_.end() ? none : it->second;
}

std::vector<TaskKind> Table::kinds() const {
    std::set<TaskKind> seen;
    for (const auto& [kind, followers] : edges_) {
        seen.insert(kind);
        seen.insert(followers.begin(), followers.end());
    }
    return {seen.begin(), seen.end()};
}

void Table::checkAcyclic() const {
    enum class Mark { Unseen, Visiting, Done };
    std::map<TaskKind, Mark> marks;

    auto visit = [&](const auto& self, const TaskKind kind) -> void {
        auto& mark = marks[kind];
        if (mark == Mark::Done) return;
        if (mark == Mark::Visiting)
            throw std::invalid_argument(fmt::format("Hook table contains a cycle through {}", to_string(kind)));

        mark = Mark::Visiting;
        for (const auto next : followOns(kind)) self(self, next);
        marks[kind] = Mark::Done;
    };

    for (const auto& [kind, _] : edges_) visit(visit, kind);
}
