#include <automation_engine/workspace_codec.hpp>

#include <fstream>
#include <iterator>
#include <stdexcept>

namespace automation_engine
{
namespace
{

std::string requireString(const YAML::Node & node, const char * key, const char * context)
{
  const auto value = node[key];
  if (!value || !value.IsScalar() || value.Scalar().empty()) {
    throw std::runtime_error(std::string(context) + " is missing '" + key + "'");
  }
  return value.Scalar();
}

ConnectionDirection parseDirection(const YAML::Node & node)
{
  const auto text = node.as<std::string>("any");
  if (text == "any") {
    return ConnectionDirection::Any;
  }
  if (text == "incoming") {
    return ConnectionDirection::Incoming;
  }
  if (text == "outgoing") {
    return ConnectionDirection::Outgoing;
  }
  throw std::runtime_error("unknown connection direction '" + text + "'");
}

Comparison parseComparison(const YAML::Node & node)
{
  const auto text = node.as<std::string>("");
  if (text == "gte") {
    return Comparison::Gte;
  }
  if (text == "lte") {
    return Comparison::Lte;
  }
  if (text == "eq") {
    return Comparison::Eq;
  }
  throw std::runtime_error("unknown comparison '" + text + "'");
}

ProximityDirection parseProximityDirection(const YAML::Node & node)
{
  const auto text = node.as<std::string>("entering");
  if (text == "entering") {
    return ProximityDirection::Entering;
  }
  if (text == "exiting" || text == "leaving") {
    return ProximityDirection::Exiting;
  }
  throw std::runtime_error("unknown proximity direction '" + text + "'");
}

ConditionOperator parseOperator(const std::string & text)
{
  if (text == "equals") {
    return ConditionOperator::Equals;
  }
  if (text == "not-equals") {
    return ConditionOperator::NotEquals;
  }
  if (text == "contains") {
    return ConditionOperator::Contains;
  }
  if (text == "not-contains") {
    return ConditionOperator::NotContains;
  }
  if (text == "greater-than") {
    return ConditionOperator::GreaterThan;
  }
  if (text == "less-than") {
    return ConditionOperator::LessThan;
  }
  if (text == "is-empty") {
    return ConditionOperator::IsEmpty;
  }
  if (text == "is-not-empty") {
    return ConditionOperator::IsNotEmpty;
  }
  if (text == "matches-regex") {
    return ConditionOperator::MatchesRegex;
  }
  return ConditionOperator::Unknown;
}

StepErrorBehavior parseErrorBehavior(const YAML::Node & node)
{
  const auto text = node.as<std::string>("stop");
  if (text == "continue") {
    return StepErrorBehavior::Continue;
  }
  if (text == "retry") {
    return StepErrorBehavior::Retry;
  }
  return StepErrorBehavior::Stop;
}

std::optional<double> optionalDouble(const YAML::Node & node)
{
  if (!node || node.IsNull()) {
    return std::nullopt;
  }
  return node.as<double>();
}

Rect decodeRect(const YAML::Node & node)
{
  Rect rect;
  rect.x = node["x"].as<double>(0.0);
  rect.y = node["y"].as<double>(0.0);
  rect.width = node["width"].as<double>(0.0);
  rect.height = node["height"].as<double>(0.0);
  return rect;
}

YAML::Node cloneOrUndefined(const YAML::Node & node)
{
  return node ? YAML::Clone(node) : YAML::Node(YAML::NodeType::Undefined);
}

}  // namespace

bool isRuleNode(const GraphNode & node)
{
  return node.type == kRuleNodeType;
}

Trigger decodeTrigger(const YAML::Node & node)
{
  if (!node || !node.IsMap()) {
    throw std::runtime_error("trigger must be a map");
  }
  const auto type = requireString(node, "type", "trigger");

  if (type == "manual") {
    return ManualTrigger{};
  }
  if (type == "schedule") {
    ScheduleTrigger trigger;
    trigger.cron = node["cron"].as<std::string>("");
    return trigger;
  }
  if (type == "property-change") {
    PropertyChangeTrigger trigger;
    trigger.property = node["property"].as<std::string>("");
    if (node["fromValue"]) {
      trigger.fromValue = YAML::Clone(node["fromValue"]);
    }
    if (node["toValue"]) {
      trigger.toValue = YAML::Clone(node["toValue"]);
    }
    trigger.nodeFilter = node["nodeFilter"].as<std::string>("");
    return trigger;
  }
  if (type == "node-created") {
    NodeCreatedTrigger trigger;
    trigger.nodeTypeFilter = node["nodeTypeFilter"].as<std::string>("");
    return trigger;
  }
  if (type == "connection-made") {
    ConnectionMadeTrigger trigger;
    trigger.direction = parseDirection(node["direction"]);
    trigger.nodeTypeFilter = node["nodeTypeFilter"].as<std::string>("");
    return trigger;
  }
  if (type == "connection-count") {
    ConnectionCountTrigger trigger;
    trigger.threshold = node["threshold"].as<int>();
    trigger.comparison = parseComparison(node["comparison"]);
    trigger.direction = parseDirection(node["direction"]);
    return trigger;
  }
  if (type == "isolation") {
    return IsolationTrigger{};
  }
  if (type == "children-complete") {
    ChildrenCompleteTrigger trigger;
    trigger.property = requireString(node, "property", "children-complete trigger");
    trigger.targetValue.reset(cloneOrUndefined(node["targetValue"]));
    trigger.requireAll = node["requireAll"].as<bool>(true);
    return trigger;
  }
  if (type == "ancestor-change") {
    AncestorChangeTrigger trigger;
    trigger.property = node["property"].as<std::string>("");
    return trigger;
  }
  if (type == "region-enter") {
    return RegionEnterTrigger{requireString(node, "regionId", "region-enter trigger")};
  }
  if (type == "region-exit") {
    return RegionExitTrigger{requireString(node, "regionId", "region-exit trigger")};
  }
  if (type == "cluster-size") {
    ClusterSizeTrigger trigger;
    trigger.regionId = requireString(node, "regionId", "cluster-size trigger");
    trigger.threshold = node["threshold"].as<int>();
    trigger.comparison = parseComparison(node["comparison"]);
    return trigger;
  }
  if (type == "proximity") {
    ProximityTrigger trigger;
    trigger.targetNodeId = node["targetNodeId"].as<std::string>("");
    trigger.distance = node["distance"].as<double>();
    trigger.direction = parseProximityDirection(node["direction"]);
    return trigger;
  }
  throw std::runtime_error("unknown trigger type '" + type + "'");
}

Condition decodeCondition(const YAML::Node & node)
{
  if (!node || !node.IsMap()) {
    throw std::runtime_error("condition must be a map");
  }
  Condition condition;
  condition.id = node["id"].as<std::string>("");
  condition.field = requireString(node, "field", "condition");
  condition.op = parseOperator(node["operator"].as<std::string>(""));
  condition.value.reset(cloneOrUndefined(node["value"]));

  const auto target = node["target"].as<std::string>("trigger-node");
  if (target == "trigger-node") {
    condition.target = ConditionTarget::TriggerNode;
  } else if (target == "rule-node" || target == "action-node") {
    condition.target = ConditionTarget::RuleNode;
  } else if (target == "specific-node") {
    condition.target = ConditionTarget::SpecificNode;
    condition.targetNodeId = node["targetNodeId"].as<std::string>("");
  } else {
    throw std::runtime_error("unknown condition target '" + target + "'");
  }
  return condition;
}

ActionStep decodeStep(const YAML::Node & node)
{
  if (!node || !node.IsMap()) {
    throw std::runtime_error("action step must be a map");
  }
  ActionStep step;
  step.id = node["id"].as<std::string>("");
  step.type = requireString(node, "type", "action step");
  step.label = node["label"].as<std::string>("");
  step.onError = parseErrorBehavior(node["onError"]);
  step.disabled = node["disabled"].as<bool>(false);
  if (node["config"]) {
    step.config.reset(YAML::Clone(node["config"]));
  }
  return step;
}

Rule decodeRule(const std::string & nodeId, const YAML::Node & data)
{
  if (!data || !data.IsMap()) {
    throw std::runtime_error("rule node '" + nodeId + "' has no data map");
  }

  Rule rule;
  rule.id = nodeId;
  rule.enabled = data["enabled"].as<bool>(false);
  rule.trigger = decodeTrigger(data["trigger"]);

  const auto conditions = data["conditions"];
  if (conditions && conditions.IsSequence()) {
    for (const auto & c : conditions) {
      rule.conditions.push_back(decodeCondition(c));
    }
  }
  const auto actions = data["actions"];
  if (actions && actions.IsSequence()) {
    for (const auto & a : actions) {
      rule.actionSteps.push_back(decodeStep(a));
    }
  }

  rule.stats.runCount = data["runCount"].as<int>(0);
  rule.stats.errorCount = data["errorCount"].as<int>(0);
  if (data["lastRun"] && !data["lastRun"].IsNull()) {
    rule.stats.lastRun = data["lastRun"].as<int64_t>();
  }
  if (data["lastError"] && !data["lastError"].IsNull()) {
    rule.stats.lastError = data["lastError"].as<std::string>();
  }
  return rule;
}

GraphSnapshot decodeSnapshot(const YAML::Node & root)
{
  GraphSnapshot graph;

  const auto nodes = root["nodes"];
  if (nodes && nodes.IsSequence()) {
    for (const auto & n : nodes) {
      GraphNode node;
      node.id = requireString(n, "id", "node");
      node.type = n["type"].as<std::string>("note");
      if (n["position"]) {
        node.position.x = n["position"]["x"].as<double>(0.0);
        node.position.y = n["position"]["y"].as<double>(0.0);
      }
      node.width = optionalDouble(n["width"]);
      node.height = optionalDouble(n["height"]);
      if (n["measured"]) {
        node.measuredWidth = optionalDouble(n["measured"]["width"]);
        node.measuredHeight = optionalDouble(n["measured"]["height"]);
      }
      if (n["data"] && n["data"].IsMap()) {
        node.data.reset(YAML::Clone(n["data"]));
      }
      if (graph.findNode(node.id) != nullptr) {
        throw std::runtime_error("duplicate node id '" + node.id + "'");
      }
      graph.nodes.push_back(std::move(node));
    }
  }

  const auto edges = root["edges"];
  if (edges && edges.IsSequence()) {
    for (const auto & e : edges) {
      GraphEdge edge;
      edge.source = requireString(e, "source", "edge");
      edge.target = requireString(e, "target", "edge");
      edge.id = e["id"].as<std::string>(edge.source + "->" + edge.target);
      graph.edges.push_back(std::move(edge));
    }
  }
  return graph;
}

std::vector<SpatialRegion> decodeRegions(const YAML::Node & node)
{
  std::vector<SpatialRegion> regions;
  if (!node || !node.IsSequence()) {
    return regions;
  }
  for (const auto & r : node) {
    SpatialRegion region;
    region.id = requireString(r, "id", "region");
    region.name = r["name"].as<std::string>("");
    region.bounds = decodeRect(r["bounds"]);
    region.isDistrict = r["isDistrict"].as<bool>(false);
    const auto linked = r["linkedActionIds"];
    if (linked && linked.IsSequence()) {
      for (const auto & id : linked) {
        region.linkedActionIds.push_back(id.as<std::string>());
      }
    }
    if (r["presentationOrder"] && !r["presentationOrder"].IsNull()) {
      region.presentationOrder = r["presentationOrder"].as<int>();
    }
    regions.push_back(std::move(region));
  }
  return regions;
}

YAML::Node encodeRegions(const std::vector<SpatialRegion> & regions)
{
  YAML::Node out(YAML::NodeType::Sequence);
  for (const auto & region : regions) {
    YAML::Node r;
    r["id"] = region.id;
    r["name"] = region.name;
    r["bounds"]["x"] = region.bounds.x;
    r["bounds"]["y"] = region.bounds.y;
    r["bounds"]["width"] = region.bounds.width;
    r["bounds"]["height"] = region.bounds.height;
    if (region.isDistrict) {
      r["isDistrict"] = true;
    }
    r["linkedActionIds"] = YAML::Node(YAML::NodeType::Sequence);
    for (const auto & id : region.linkedActionIds) {
      r["linkedActionIds"].push_back(id);
    }
    if (region.presentationOrder) {
      r["presentationOrder"] = *region.presentationOrder;
    }
    out.push_back(r);
  }
  return out;
}

WorkspaceLoadResult parseWorkspace(const std::string & yamlText)
{
  WorkspaceLoadResult result;
  try {
    const YAML::Node root = YAML::Load(yamlText);
    if (root && !root.IsNull() && !root.IsMap()) {
      result.error = "workspace root must be a map";
      return result;
    }
    result.graph = decodeSnapshot(root);
    result.regions = decodeRegions(root["regions"]);
    result.ok = true;
  } catch (const YAML::Exception & e) {
    result.error = e.what();
  } catch (const std::exception & e) {
    result.error = e.what();
  }
  return result;
}

WorkspaceLoadResult loadWorkspace(const std::string & path)
{
  std::ifstream in(path);
  if (!in) {
    WorkspaceLoadResult result;
    result.error = "cannot open workspace file '" + path + "'";
    return result;
  }
  const std::string text(
    (std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  auto result = parseWorkspace(text);
  if (!result.ok) {
    result.error = path + ": " + result.error;
  }
  return result;
}

WorkspaceSaveResult saveRegions(
  const std::string & path,
  const std::vector<SpatialRegion> & regions)
{
  WorkspaceSaveResult result;
  try {
    YAML::Node root;
    root["regions"] = encodeRegions(regions);

    std::ofstream out(path, std::ios::trunc);
    if (!out) {
      result.error = "cannot open '" + path + "' for writing";
      return result;
    }
    YAML::Emitter emitter;
    emitter << root;
    out << emitter.c_str() << "\n";
    if (!out) {
      result.error = "write to '" + path + "' failed";
      return result;
    }
    result.ok = true;
  } catch (const YAML::Exception & e) {
    result.error = e.what();
  }
  return result;
}

}  // namespace automation_engine
