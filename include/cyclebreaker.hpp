#pragma once
#include <cstddef>
#include <vector>
#include "operation.hpp"

/**
 * Removes foreign key cycles between CreateModel operations.
 *
 * Runs the greedy feedback arc set over build_dependency_graph(ops). Each
 * selected edge p -> q is dropped by stripping from the CreateModel at q
 * the fields that point at the model created by p; every stripped field is
 * appended back as an AddField, which runs once both tables exist.
 *
 * ops is modified in place. Returns the number of fields moved, equal to
 * the size of the feedback arc set. The graph is not rebuilt here.
 * Throws InvariantError if an arc touches anything but CreateModel operations.
 */
std::size_t remove_cycles(std::vector<Operation>& ops);
