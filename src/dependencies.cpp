#include "dependencies.hpp"
#include <set>
#include <utility>

std::vector<Dependency> foreign_key_dependencies(const std::vector<Operation>& ops) {
    std::set<std::string> created;
    for (const auto& op : ops) {
        if (op.kind == OpKind::CreateModel) created.insert(op.type_identifier);
    }

    std::vector<Dependency> deps;
    std::set<std::pair<std::string, std::string>> seen;
    const auto add = [&](const FieldDescriptor& f) {
        if (!f.foreign_key || created.count(f.foreign_key->model_type)) return;
        auto key = std::make_pair(f.foreign_key->group, f.foreign_key->table_name);
        if (!seen.insert(key).second) return;
        deps.push_back(Dependency::on_model(key.first, key.second));
    };

    for (const auto& op : ops) {
        switch (op.kind) {
            case OpKind::CreateModel:
                for (const auto& f : op.fields) add(f);
                break;
            case OpKind::AddField:
                add(op.field);
                break;
            case OpKind::RemoveField:
            case OpKind::RemoveModel:
                break;
        }
    }
    return deps;
}

std::vector<Dependency> resolve_dependencies(const std::vector<Operation>& ops, const Migration* previous) {
    std::vector<Dependency> deps;
    // one link is enough: previous migrations of a group already form a chain
    if (previous) deps.push_back(Dependency::on_migration(previous->group(), previous->name()));
    auto fks = foreign_key_dependencies(ops);
    deps.insert(deps.end(), fks.begin(), fks.end());
    return deps;
}
