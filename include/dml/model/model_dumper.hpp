// dml/model/model_dumper.hpp - JSON serialization of a resolved model
//
// Writes the compact JSON notation back out, with inferred elements,
// generated foreign keys, rewritten ON conditions, merged annotations and
// autoexposed entities in place. Used by `dmlc --dump` and by tests.
//
#pragma once

#include <nlohmann/json.hpp>
#include <string>

#include "dml/model/model.hpp"

namespace dml
{

/**
 * Serialize all definitions of a model, in definition order.
 *
 * @param model The (usually resolved) model
 * @return `{ "definitions": { ... }, "$autoexposed": [ ... ] }`
 */
[[nodiscard]] nlohmann::ordered_json to_json(const Model & model);

/**
 * Serialize one definition or member.
 *
 * @param model The model owning the node
 * @param id Main artifact or member
 * @return JSON object for the node
 */
[[nodiscard]] nlohmann::ordered_json to_json(const Model & model, NodeId id);

/// Serialize an expression (`{ "ref": [...] }`, `{ "val": ... }`, ...).
[[nodiscard]] nlohmann::ordered_json to_json(const Model & model, const Expr * expr);

}  // namespace dml
