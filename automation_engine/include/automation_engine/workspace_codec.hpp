#pragma once

#include <automation_engine/graph_types.hpp>
#include <automation_engine/rule_types.hpp>
#include <automation_engine/spatial_region_store.hpp>

#include <yaml-cpp/yaml.h>

#include <string>
#include <vector>

namespace automation_engine
{

// Decoders below throw std::runtime_error (or YAML::Exception) on malformed input. The
// load/save entry points catch and report through their result structs instead.

bool isRuleNode(const GraphNode & node);

Trigger decodeTrigger(const YAML::Node & node);
Condition decodeCondition(const YAML::Node & node);
ActionStep decodeStep(const YAML::Node & node);

/**
 * @brief Decodes the rule embedded in a rule node's data.
 *
 * Expected keys: `enabled` (default false), `trigger` (required), `conditions`,
 * `actions`, and the run statistics `runCount`, `errorCount`, `lastRun`, `lastError`.
 */
Rule decodeRule(const std::string & nodeId, const YAML::Node & data);

GraphSnapshot decodeSnapshot(const YAML::Node & root);
std::vector<SpatialRegion> decodeRegions(const YAML::Node & node);
YAML::Node encodeRegions(const std::vector<SpatialRegion> & regions);

struct WorkspaceLoadResult
{
  bool ok{false};
  GraphSnapshot graph;
  std::vector<SpatialRegion> regions;
  std::string error;
};

struct WorkspaceSaveResult
{
  bool ok{false};
  std::string error;
};

/// Parses a workspace document with top-level `nodes`, `edges` and `regions`.
WorkspaceLoadResult parseWorkspace(const std::string & yamlText);
WorkspaceLoadResult loadWorkspace(const std::string & path);

/// Writes `regions:` as a standalone document. Runtime state is never written.
WorkspaceSaveResult saveRegions(const std::string & path, const std::vector<SpatialRegion> & regions);

}  // namespace automation_engine
