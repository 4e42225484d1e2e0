#pragma once
#include <vector>
#include "migration.hpp"
#include "operation.hpp"

// OnModel dependencies for every foreign key (CreateModel fields, AddField
// field) whose target is not created by a CreateModel in ops.
// Deduplicated by (group, table), first occurrence order.
std::vector<Dependency> foreign_key_dependencies(const std::vector<Operation>& ops);

// Full dependency list of a new migration: the previous migration of the
// same group (if any) first, then foreign_key_dependencies(ops).
std::vector<Dependency> resolve_dependencies(const std::vector<Operation>& ops, const Migration* previous);
