#include "../include/triggerevaluator.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <chrono>
#include <future>

#include "../include/updatestrategy.hpp"
#include "../include/workloadadapters.hpp"
#include "rld/MetricsCollector.hpp"
#include "testsupport.hpp"

using namespace testsupport;
using ::testing::_;
using ::testing::DoAll;
using ::testing::NiceMock;
using ::testing::Return;
using ::testing::SaveArg;
using ::testing::Throw;

namespace {

const char *kDeploymentPath = "/apis/apps/v1/namespaces/prod/deployments/web";

nlohmann::json mountingContainer(const std::string &volume) {
  auto app = container("app");
  app["volumeMounts"] = nlohmann::json::array({volumeMount(volume)});
  return app;
}

std::string envValue(const nlohmann::json &object, const std::string &name) {
  for (const auto &c : object["spec"]["template"]["spec"]["containers"]) {
    if (!c.contains("env")) continue;
    for (const auto &var : c["env"]) {
      if (var["name"] == name) return var["value"].get<std::string>();
    }
  }
  return {};
}

}  // namespace

class TriggerEvaluatorTest : public ::testing::Test {
 protected:
  void SetUp() override {
    rld::MetricsCollector::instance().reset();
    OutcomeReporter::registerMetrics();
    client_ = std::make_shared<NiceMock<MockKubeClient>>();
    recorder_ = std::make_shared<NiceMock<MockEventRecorder>>();
    adapter_ = std::make_shared<DeploymentAdapter>();
  }

  std::unique_ptr<TriggerEvaluator> makeEvaluator(
      std::shared_ptr<UpdateStrategy> strategy =
          std::make_shared<EnvVarStrategy>(),
      TriggerEvaluator::Options options = TriggerEvaluator::Options()) {
    return std::make_unique<TriggerEvaluator>(
        client_, std::vector<std::shared_ptr<ResourceAdapter>>{adapter_},
        std::move(strategy),
        std::make_shared<OutcomeReporter>(recorder_, nullptr), keys_,
        options);
  }

  ChangeConfig change(const std::string &name, const std::string &hash,
                      ResourceKind kind = ResourceKind::ConfigMap,
                      const Annotations &annotations = {}) {
    return ChangeConfig::create(keys_, kind, name, "prod", hash, annotations);
  }

  AnnotationKeys keys_;
  std::shared_ptr<NiceMock<MockKubeClient>> client_;
  std::shared_ptr<NiceMock<MockEventRecorder>> recorder_;
  std::shared_ptr<DeploymentAdapter> adapter_;
};

// Сценарий A: ручная аннотация, env-vars, хеш abc123 -> def456
TEST_F(TriggerEvaluatorTest, ManualAnnotationUpdatesEnvVar) {
  auto app = container("app");
  app["env"] = {{{"name", "STAKATER_APP_CONFIG_CONFIGMAP"}, {"value", "abc123"}}};
  WorkloadItem item{deployment(
      "web", "prod", {{"configmap.reloader.stakater.com/reload", "app-config"}},
      {app})};

  nlohmann::json sent;
  EXPECT_CALL(*client_, replace(kDeploymentPath, _))
      .WillOnce(DoAll(SaveArg<1>(&sent), Return(nlohmann::json::object())));
  EXPECT_CALL(*recorder_,
              recordEvent("Deployment", _, "Normal", "Reloaded", _));

  auto evaluator = makeEvaluator();
  EXPECT_EQ(evaluator->performActionOnSingleItem(
                adapter_, item, {change("app-config", "def456")}),
            EvaluationResult::Updated);
  EXPECT_EQ(envValue(sent, "STAKATER_APP_CONFIG_CONFIGMAP"), "def456");

  auto &metrics = rld::MetricsCollector::instance();
  EXPECT_DOUBLE_EQ(
      metrics.counterValue(kReloadedTotalMetric, {{"success", "true"}}), 1.0);
  EXPECT_DOUBLE_EQ(
      metrics.counterValue(kReloadedByNamespaceMetric,
                           {{"success", "true"}, {"namespace", "prod"}}),
      1.0);
}

// Сценарий B: тот же хеш повторно не вызывает обновления
TEST_F(TriggerEvaluatorTest, SameHashIsNotUpdatedAndNotSent) {
  auto app = container("app");
  app["env"] = {{{"name", "STAKATER_APP_CONFIG_CONFIGMAP"}, {"value", "def456"}}};
  WorkloadItem item{deployment(
      "web", "prod", {{"configmap.reloader.stakater.com/reload", "app-config"}},
      {app})};

  EXPECT_CALL(*client_, replace(_, _)).Times(0);
  EXPECT_CALL(*recorder_, recordEvent(_, _, _, _, _)).Times(0);

  auto evaluator = makeEvaluator();
  EXPECT_EQ(evaluator->performActionOnSingleItem(
                adapter_, item, {change("app-config", "def456")}),
            EvaluationResult::NotUpdated);
}

// Сценарий C: без аннотаций и без auto_reload_all ничего не происходит
TEST_F(TriggerEvaluatorTest, UnannotatedWorkloadIsIgnored) {
  EXPECT_CALL(*client_, replace(_, _)).Times(0);

  for (std::shared_ptr<UpdateStrategy> strategy :
       {std::shared_ptr<UpdateStrategy>(std::make_shared<EnvVarStrategy>()),
        std::shared_ptr<UpdateStrategy>(
            std::make_shared<PodAnnotationStrategy>())}) {
    WorkloadItem item{deployment("web", "prod", nlohmann::json::object(),
                                 {mountingContainer("cfg")},
                                 {configMapVolume("cfg", "app-config")})};
    const auto before = item.object;
    auto evaluator = makeEvaluator(strategy);
    EXPECT_EQ(evaluator->performActionOnSingleItem(
                  adapter_, item, {change("app-config", "h1")}),
              EvaluationResult::NotUpdated);
    EXPECT_EQ(item.object, before);
  }
}

TEST_F(TriggerEvaluatorTest, AutoReloadAllAppliesToUnannotatedWorkload) {
  WorkloadItem item{deployment("web", "prod", nlohmann::json::object(),
                               {mountingContainer("cfg")},
                               {configMapVolume("cfg", "app-config")})};
  EXPECT_CALL(*client_, replace(kDeploymentPath, _))
      .WillOnce(Return(nlohmann::json::object()));

  TriggerEvaluator::Options options;
  options.autoReloadAll = true;
  auto evaluator = makeEvaluator(std::make_shared<EnvVarStrategy>(), options);
  EXPECT_EQ(evaluator->performActionOnSingleItem(adapter_, item,
                                                 {change("app-config", "h1")}),
            EvaluationResult::Updated);
}

TEST_F(TriggerEvaluatorTest, ExplicitAutoFalseOverridesReloadAll) {
  WorkloadItem item{deployment("web", "prod",
                               {{"reloader.stakater.com/auto", "false"}},
                               {mountingContainer("cfg")},
                               {configMapVolume("cfg", "app-config")})};
  EXPECT_CALL(*client_, replace(_, _)).Times(0);

  TriggerEvaluator::Options options;
  options.autoReloadAll = true;
  auto evaluator = makeEvaluator(std::make_shared<EnvVarStrategy>(), options);
  EXPECT_EQ(evaluator->performActionOnSingleItem(adapter_, item,
                                                 {change("app-config", "h1")}),
            EvaluationResult::NotUpdated);
}

TEST_F(TriggerEvaluatorTest, ExclusionTakesPrecedenceOverAutoAndManual) {
  WorkloadItem item{deployment(
      "web", "prod",
      {{"reloader.stakater.com/auto", "true"},
       {"configmap.reloader.stakater.com/reload", "app-config"},
       {"configmaps.exclude.reloader.stakater.com/reload",
        "other, app-config "}},
      {mountingContainer("cfg")}, {configMapVolume("cfg", "app-config")})};
  EXPECT_CALL(*client_, replace(_, _)).Times(0);

  auto evaluator = makeEvaluator();
  EXPECT_EQ(evaluator->performActionOnSingleItem(adapter_, item,
                                                 {change("app-config", "h1")}),
            EvaluationResult::NotUpdated);
}

TEST_F(TriggerEvaluatorTest, TypedAutoAnnotationOnlyMatchesItsKind) {
  auto app = container("app");
  app["volumeMounts"] = {volumeMount("cfg"), volumeMount("creds")};
  auto object = deployment(
      "web", "prod", {{"secret.reloader.stakater.com/auto", "true"}}, {app},
      {configMapVolume("cfg", "app-config"), secretVolume("creds", "db")});

  WorkloadItem configMapItem{object};
  EXPECT_EQ(makeEvaluator()->performActionOnSingleItem(
                adapter_, configMapItem, {change("app-config", "h1")}),
            EvaluationResult::NotUpdated);

  EXPECT_CALL(*client_, replace(kDeploymentPath, _))
      .WillOnce(Return(nlohmann::json::object()));
  WorkloadItem secretItem{object};
  EXPECT_EQ(makeEvaluator()->performActionOnSingleItem(
                adapter_, secretItem,
                {change("db", "h1", ResourceKind::Secret)}),
            EvaluationResult::Updated);
}

TEST_F(TriggerEvaluatorTest, SearchRequiresMatchAnnotationOnResource) {
  auto object =
      deployment("web", "prod", {{"reloader.stakater.com/search", "true"}},
                 {mountingContainer("cfg")},
                 {configMapVolume("cfg", "app-config")});

  WorkloadItem unmatched{object};
  EXPECT_EQ(makeEvaluator()->performActionOnSingleItem(
                adapter_, unmatched, {change("app-config", "h1")}),
            EvaluationResult::NotUpdated);

  EXPECT_CALL(*client_, replace(kDeploymentPath, _))
      .WillOnce(Return(nlohmann::json::object()));
  WorkloadItem matched{object};
  EXPECT_EQ(makeEvaluator()->performActionOnSingleItem(
                adapter_, matched,
                {change("app-config", "h1", ResourceKind::ConfigMap,
                        {{"reloader.stakater.com/match", "true"}})}),
            EvaluationResult::Updated);
}

TEST_F(TriggerEvaluatorTest, PodTemplateAnnotationsAreUsedAsFallback) {
  WorkloadItem item{deployment("web", "prod", nlohmann::json::object(),
                               {mountingContainer("cfg")},
                               {configMapVolume("cfg", "app-config")},
                               {{"reloader.stakater.com/auto", "true"}})};
  EXPECT_CALL(*client_, replace(kDeploymentPath, _))
      .WillOnce(Return(nlohmann::json::object()));

  EXPECT_EQ(makeEvaluator()->performActionOnSingleItem(
                adapter_, item, {change("app-config", "h1")}),
            EvaluationResult::Updated);
}

TEST_F(TriggerEvaluatorTest, OneUpdatedConfigTriggersSingleApply) {
  WorkloadItem item{deployment(
      "web", "prod",
      {{"configmap.reloader.stakater.com/reload", "app-config,unused"}},
      {mountingContainer("cfg")}, {configMapVolume("cfg", "app-config")})};
  EXPECT_CALL(*client_, replace(kDeploymentPath, _))
      .Times(1)
      .WillOnce(Return(nlohmann::json::object()));

  auto evaluator = makeEvaluator();
  // Второе изменение не указано в аннотации и даёт NotUpdated
  EXPECT_EQ(evaluator->performActionOnSingleItem(
                adapter_, item,
                {change("app-config", "h1"), change("not-listed", "h2")}),
            EvaluationResult::Updated);
}

TEST_F(TriggerEvaluatorTest, FailedUpdateIsReportedAndPropagated) {
  WorkloadItem item{deployment(
      "web", "prod", {{"configmap.reloader.stakater.com/reload", "app-config"}})};
  EXPECT_CALL(*client_, replace(kDeploymentPath, _))
      .WillOnce(Throw(ApiError(409, "the object has been modified")));
  EXPECT_CALL(*recorder_,
              recordEvent("Deployment", _, "Warning", "ReloadFail", _));

  auto evaluator = makeEvaluator();
  EXPECT_THROW(evaluator->performActionOnSingleItem(
                   adapter_, item, {change("app-config", "h1")}),
               UpdateError);
  EXPECT_DOUBLE_EQ(rld::MetricsCollector::instance().counterValue(
                       kReloadedTotalMetric, {{"success", "false"}}),
                   1.0);
}

TEST_F(TriggerEvaluatorTest, RollingUpgradeStopsAtFirstFailingKind) {
  auto daemonSets = std::make_shared<DaemonSetAdapter>();
  TriggerEvaluator evaluator(
      client_, {adapter_, daemonSets}, std::make_shared<EnvVarStrategy>(),
      std::make_shared<OutcomeReporter>(recorder_, nullptr), keys_,
      TriggerEvaluator::Options());

  EXPECT_CALL(*client_, get("/apis/apps/v1/namespaces/prod/deployments"))
      .WillOnce(Return(itemList({deployment(
          "web", "prod",
          {{"configmap.reloader.stakater.com/reload", "app-config"}})})));
  EXPECT_CALL(*client_, replace(kDeploymentPath, _))
      .WillOnce(Throw(ApiError(500, "internal error")));
  EXPECT_CALL(*client_, get("/apis/apps/v1/namespaces/prod/daemonsets"))
      .Times(0);

  EXPECT_THROW(evaluator.performRollingUpgrade(change("app-config", "h1")),
               UpdateError);
}

TEST_F(TriggerEvaluatorTest, DelayedWorkloadIsFlushedOnceWithAllChanges) {
  auto object = deployment(
      "web", "prod",
      {{"reloader.stakater.com/delayed-upgrade", "true"},
       {"reloader.stakater.com/auto", "true"}},
      {mountingContainer("cfg")},
      {configMapVolume("cfg", "app-config")});
  object["spec"]["template"]["spec"]["containers"][0]["envFrom"] = {
      {{"configMapRef", {{"name", "extra"}}}}};

  std::promise<nlohmann::json> sent;
  auto flushed = sent.get_future();
  EXPECT_CALL(*client_, get("/apis/apps/v1/namespaces/prod/deployments"))
      .WillOnce(Return(itemList({object})));
  EXPECT_CALL(*client_, replace(kDeploymentPath, _))
      .WillOnce(::testing::Invoke(
          [&sent](const std::string &, const nlohmann::json &body) {
            sent.set_value(body);
            return nlohmann::json::object();
          }));

  TriggerEvaluator::Options options;
  options.delayWindow = std::chrono::milliseconds(200);
  auto evaluator = makeEvaluator(std::make_shared<EnvVarStrategy>(), options);

  WorkloadItem first{object};
  EXPECT_EQ(evaluator->performActionOnSingleItem(adapter_, first,
                                                 {change("app-config", "h1")}),
            EvaluationResult::NotUpdated);
  WorkloadItem second{object};
  evaluator->performActionOnSingleItem(adapter_, second,
                                       {change("extra", "h2")});
  EXPECT_EQ(evaluator->coalescer().batchCount(), 1u);

  ASSERT_EQ(flushed.wait_for(std::chrono::seconds(5)),
            std::future_status::ready);
  auto body = flushed.get();
  EXPECT_EQ(envValue(body, "STAKATER_APP_CONFIG_CONFIGMAP"), "h1");
  EXPECT_EQ(envValue(body, "STAKATER_EXTRA_CONFIGMAP"), "h2");

  evaluator->shutdown();
  EXPECT_EQ(evaluator->coalescer().batchCount(), 0u);
}

TEST(TriggerEvaluatorRulesTest, AnnotationListIsAnchored) {
  EXPECT_TRUE(TriggerEvaluator::matchesAnnotationList("foo", "foo"));
  EXPECT_FALSE(TriggerEvaluator::matchesAnnotationList("foobar", "foo"));
  EXPECT_FALSE(TriggerEvaluator::matchesAnnotationList("xfoo", "foo"));
  EXPECT_TRUE(TriggerEvaluator::matchesAnnotationList("app-config", "app-.*"));
  EXPECT_TRUE(TriggerEvaluator::matchesAnnotationList("foo", "bar, foo "));
}

TEST(TriggerEvaluatorRulesTest, InvalidPatternIsSkipped) {
  EXPECT_FALSE(TriggerEvaluator::matchesAnnotationList("foo", "(foo"));
  EXPECT_TRUE(TriggerEvaluator::matchesAnnotationList("foo", "(foo,foo"));
}

TEST(TriggerEvaluatorRulesTest, ExclusionListIsExactAfterTrim) {
  EXPECT_TRUE(TriggerEvaluator::isResourceExcluded("a", " a ,b"));
  EXPECT_TRUE(TriggerEvaluator::isResourceExcluded("b", "a, b"));
  EXPECT_FALSE(TriggerEvaluator::isResourceExcluded("a", "ab,ba"));
  EXPECT_FALSE(TriggerEvaluator::isResourceExcluded("a", ""));
}

TEST(TriggerEvaluatorRulesTest, BooleanParsing) {
  for (const char *value : {"1", "t", "T", "TRUE", "true", "True"}) {
    EXPECT_TRUE(TriggerEvaluator::parseBool(value)) << value;
  }
  for (const char *value : {"0", "false", "yes", "", "tRuE"}) {
    EXPECT_FALSE(TriggerEvaluator::parseBool(value)) << value;
  }
}

int main(int argc, char **argv) {
  ::testing::InitGoogleMock(&argc, argv);
  return RUN_ALL_TESTS();
}
