#include <automation_manager/automation_manager_node.hpp>

#include <automation_engine/workspace_codec.hpp>

#include <lifecycle_msgs/msg/state.hpp>
#include <lifecycle_msgs/msg/transition.hpp>
#include <rclcpp_components/register_node_macro.hpp>

#include <chrono>
#include <functional>
#include <string>
#include <utility>

namespace automation_manager
{
namespace
{

constexpr char kNodeName[] = "automation_manager";

diagnostic_msgs::msg::KeyValue keyValue(const std::string & key, const std::string & value)
{
  diagnostic_msgs::msg::KeyValue kv;
  kv.key = key;
  kv.value = value;
  return kv;
}

}  // namespace

AutomationManagerNode::AutomationManagerNode(const rclcpp::NodeOptions & options)
: rclcpp_lifecycle::LifecycleNode(kNodeName, options)
{
  workspaceFile_ = this->declare_parameter<std::string>("workspace_file", "");
  debounceMs_ = this->declare_parameter<int>("debounce_ms", 300);
  maxStackDepth_ = this->declare_parameter<int>("max_stack_depth", 5);
  statusRateHz_ = this->declare_parameter<double>("status_rate_hz", 1.0);
  recentEventCapacity_ = this->declare_parameter<int>("recent_event_capacity", 50);
  manualTriggerTopic_ =
    this->declare_parameter<std::string>("manual_trigger_topic", "manual_trigger");
  statusTopic_ = this->declare_parameter<std::string>("status_topic", "automation_status");
  autoStart_ = this->declare_parameter<bool>("auto_start", true);

  if (autoStart_) {
    startupTimer_ = this->create_wall_timer(
      std::chrono::milliseconds(200),
      [this]() {
        startupTimer_->cancel();
        RCLCPP_INFO(get_logger(), "Auto-start: triggering configure");
        auto configResult = this->trigger_transition(
          lifecycle_msgs::msg::Transition::TRANSITION_CONFIGURE);
        if (configResult.id() != lifecycle_msgs::msg::State::PRIMARY_STATE_INACTIVE) {
          RCLCPP_ERROR(get_logger(), "Auto-configure failed (state=%s)",
            configResult.label().c_str());
          return;
        }
        auto activateResult = this->trigger_transition(
          lifecycle_msgs::msg::Transition::TRANSITION_ACTIVATE);
        if (activateResult.id() != lifecycle_msgs::msg::State::PRIMARY_STATE_ACTIVE) {
          RCLCPP_ERROR(get_logger(), "Auto-activate failed (state=%s)",
            activateResult.label().c_str());
          return;
        }
        RCLCPP_INFO(get_logger(), "Auto-start complete: ACTIVE");
      });
  }
}

AutomationManagerNode::CallbackReturn AutomationManagerNode::on_configure(
  const rclcpp_lifecycle::State &)
{
  if (debounceMs_ < 0) {
    RCLCPP_ERROR(get_logger(), "debounce_ms must be >= 0");
    return CallbackReturn::FAILURE;
  }
  if (maxStackDepth_ < 1) {
    RCLCPP_ERROR(get_logger(), "max_stack_depth must be >= 1");
    return CallbackReturn::FAILURE;
  }
  if (statusRateHz_ <= 0.0) {
    RCLCPP_ERROR(get_logger(), "status_rate_hz must be > 0");
    return CallbackReturn::FAILURE;
  }
  if (recentEventCapacity_ < 1) {
    RCLCPP_ERROR(get_logger(), "recent_event_capacity must be >= 1");
    return CallbackReturn::FAILURE;
  }

  // Workspace
  automation_engine::WorkspaceLoadResult workspace;
  if (workspaceFile_.empty()) {
    RCLCPP_WARN(get_logger(), "workspace_file is empty, starting with an empty graph");
    workspace.ok = true;
  } else {
    workspace = automation_engine::loadWorkspace(workspaceFile_);
  }
  if (!workspace.ok) {
    RCLCPP_ERROR(get_logger(), "Failed to load workspace: %s", workspace.error.c_str());
    return CallbackReturn::FAILURE;
  }

  // Engine
  graph_ = std::make_unique<automation_engine::InMemoryGraphStore>(std::move(workspace.graph));
  regions_ = std::make_unique<automation_engine::SpatialRegionStore>();
  regions_->loadRegions(std::move(workspace.regions));
  rules_ = std::make_unique<automation_engine::RuleStore>();
  timers_ = std::make_unique<RosTimerService>(
    this->get_node_base_interface(), this->get_node_timers_interface());
  stepExecutor_ = std::make_unique<automation_engine::GraphStepExecutor>(
    *graph_, get_logger().get_child("steps"));

  automation_engine::SchedulerConfig schedulerConfig;
  schedulerConfig.debounce = std::chrono::milliseconds(debounceMs_);
  schedulerConfig.maxStackDepth = static_cast<std::size_t>(maxStackDepth_);
  schedulerConfig.recentEventCapacity = static_cast<std::size_t>(recentEventCapacity_);
  scheduler_ = std::make_unique<automation_engine::ExecutionScheduler>(
    *graph_, *stepExecutor_, *rules_, *regions_, *timers_, schedulerConfig, get_logger());

  observer_ = std::make_unique<automation_engine::GraphChangeObserver>(
    *scheduler_, *regions_, *timers_, get_logger());
  observer_->prime(graph_->snapshot());

  schedules_ = std::make_unique<automation_engine::ScheduleService>(
    *timers_,
    [this](const automation_engine::Event & event) {onScheduleTick(event);},
    get_logger().get_child("schedule"));

  const auto sync = scheduler_->syncRules();
  graphSubscription_ = graph_->subscribe(
    [this](const automation_engine::GraphSnapshot & snapshot) {onGraphCommit(snapshot);});

  // Subscription
  manualTriggerSub_ = this->create_subscription<std_msgs::msg::String>(
    manualTriggerTopic_, rclcpp::QoS(10).reliable(),
    std::bind(&AutomationManagerNode::onManualTrigger, this, std::placeholders::_1));

  // Publisher
  statusPub_ = this->create_publisher<diagnostic_msgs::msg::DiagnosticArray>(
    statusTopic_, rclcpp::QoS(10).reliable());

  // Status timer (created but not started until activate)
  const auto period = std::chrono::duration<double>(1.0 / statusRateHz_);
  statusTimer_ = this->create_wall_timer(
    std::chrono::duration_cast<std::chrono::nanoseconds>(period),
    std::bind(&AutomationManagerNode::publishStatus, this));
  statusTimer_->cancel();

  RCLCPP_INFO(
    get_logger(),
    "Configured automation_manager (workspace=%s, nodes=%zu, edges=%zu, regions=%zu, "
    "rules=%zu, skipped=%zu, debounce=%dms, max_depth=%d)",
    workspaceFile_.empty() ? "<none>" : workspaceFile_.c_str(),
    graph_->snapshot().nodes.size(), graph_->snapshot().edges.size(),
    regions_->regions().size(), sync.registered.size(), sync.errors.size(),
    debounceMs_, maxStackDepth_);
  return CallbackReturn::SUCCESS;
}

AutomationManagerNode::CallbackReturn AutomationManagerNode::on_activate(
  const rclcpp_lifecycle::State &)
{
  if (!statusPub_ || !statusTimer_ || !scheduler_) {
    return CallbackReturn::FAILURE;
  }
  statusPub_->on_activate();
  statusTimer_->reset();
  schedules_->sync(*rules_);
  active_ = true;
  RCLCPP_INFO(get_logger(), "Activated automation_manager (%zu scheduled rule(s))",
    schedules_->activeCount());
  return CallbackReturn::SUCCESS;
}

AutomationManagerNode::CallbackReturn AutomationManagerNode::on_deactivate(
  const rclcpp_lifecycle::State &)
{
  active_ = false;
  if (statusTimer_) {
    statusTimer_->cancel();
  }
  if (schedules_) {
    schedules_->clear();
  }
  if (scheduler_) {
    scheduler_->cancelAll();
  }
  if (statusPub_) {
    statusPub_->on_deactivate();
  }
  RCLCPP_INFO(get_logger(), "Deactivated automation_manager");
  return CallbackReturn::SUCCESS;
}

AutomationManagerNode::CallbackReturn AutomationManagerNode::on_cleanup(
  const rclcpp_lifecycle::State &)
{
  active_ = false;
  statusTimer_.reset();
  manualTriggerSub_.reset();
  statusPub_.reset();
  releaseEngine();

  RCLCPP_INFO(get_logger(), "Cleaned up automation_manager");
  return CallbackReturn::SUCCESS;
}

AutomationManagerNode::CallbackReturn AutomationManagerNode::on_shutdown(
  const rclcpp_lifecycle::State &)
{
  (void)on_cleanup(this->get_current_state());
  return CallbackReturn::SUCCESS;
}

AutomationManagerNode::CallbackReturn AutomationManagerNode::on_error(
  const rclcpp_lifecycle::State &)
{
  active_ = false;
  if (statusTimer_) {
    statusTimer_->cancel();
  }
  if (schedules_) {
    schedules_->clear();
  }
  if (scheduler_) {
    scheduler_->cancelAll();
  }
  if (statusPub_ && statusPub_->is_activated()) {
    statusPub_->on_deactivate();
  }
  return CallbackReturn::SUCCESS;
}

void AutomationManagerNode::onManualTrigger(const std_msgs::msg::String::SharedPtr msg)
{
  if (!active_ || !scheduler_) {
    RCLCPP_WARN(get_logger(), "Ignoring manual trigger for '%s': node is not active",
      msg->data.c_str());
    return;
  }
  const auto outcome = scheduler_->triggerManual(msg->data);
  RCLCPP_INFO(get_logger(), "Manual trigger '%s': %s%s%s", msg->data.c_str(),
    std::string(automation_engine::executionCodeToString(outcome.code)).c_str(),
    outcome.detail.empty() ? "" : " ", outcome.detail.c_str());
}

void AutomationManagerNode::onGraphCommit(const automation_engine::GraphSnapshot & snapshot)
{
  if (!observer_) {
    return;
  }
  observer_->onSnapshot(snapshot);
  if (active_) {
    schedules_->sync(*rules_);
  }
}

void AutomationManagerNode::onScheduleTick(const automation_engine::Event & event)
{
  if (!active_ || !scheduler_) {
    return;
  }
  scheduler_->handleEvent(event);
}

void AutomationManagerNode::publishStatus()
{
  if (!scheduler_ || !statusPub_ || !statusPub_->is_activated()) {
    return;
  }

  const auto snapshot = graph_->snapshot();
  diagnostic_msgs::msg::DiagnosticArray msg;
  msg.header.stamp = this->now();

  for (const auto & rule : rules_->rules()) {
    diagnostic_msgs::msg::DiagnosticStatus status;
    status.name = std::string(kNodeName) + "/" + rule.id;
    status.hardware_id = rule.id;

    const auto * node = snapshot.findNode(rule.id);
    const YAML::Node data = node != nullptr ? node->data : YAML::Node(YAML::NodeType::Map);
    const int runCount = data["runCount"].as<int>(0);
    const int errorCount = data["errorCount"].as<int>(0);
    const std::string lastError = data["lastError"].as<std::string>("");
    const std::string lastRun = data["lastRun"].as<std::string>("");
    const bool executing = scheduler_->isExecuting(rule.id);

    if (!lastError.empty()) {
      status.level = diagnostic_msgs::msg::DiagnosticStatus::WARN;
      status.message = lastError;
    } else {
      status.level = diagnostic_msgs::msg::DiagnosticStatus::OK;
      status.message = executing ? "executing" : "idle";
    }

    status.values.push_back(keyValue("trigger", automation_engine::triggerTypeName(rule.trigger)));
    status.values.push_back(keyValue("run_count", std::to_string(runCount)));
    status.values.push_back(keyValue("error_count", std::to_string(errorCount)));
    status.values.push_back(keyValue("last_run_ms", lastRun));
    status.values.push_back(keyValue("executing", executing ? "true" : "false"));
    msg.status.push_back(std::move(status));
  }

  statusPub_->publish(msg);
}

void AutomationManagerNode::releaseEngine()
{
  if (graph_ && graphSubscription_ != 0) {
    graph_->unsubscribe(graphSubscription_);
    graphSubscription_ = 0;
  }
  schedules_.reset();
  observer_.reset();
  scheduler_.reset();
  stepExecutor_.reset();
  timers_.reset();
  rules_.reset();
  regions_.reset();
  graph_.reset();
}

}  // namespace automation_manager

RCLCPP_COMPONENTS_REGISTER_NODE(automation_manager::AutomationManagerNode)
