#include "../include/usagescanner.hpp"

#include <gtest/gtest.h>

#include "../include/workloadadapters.hpp"
#include "testsupport.hpp"

using namespace testsupport;

class UsageScannerTest : public ::testing::Test {
 protected:
  ChangeConfig configMapChange(const std::string &name) {
    return ChangeConfig::create(keys_, ResourceKind::ConfigMap, name, "prod",
                                "abc");
  }
  ChangeConfig secretChange(const std::string &name) {
    return ChangeConfig::create(keys_, ResourceKind::Secret, name, "prod",
                                "abc");
  }

  AnnotationKeys keys_;
  DeploymentAdapter adapter_;
};

TEST_F(UsageScannerTest, FindsContainerMountingConfigMapVolume) {
  auto sidecar = container("sidecar");
  auto app = container("app");
  app["volumeMounts"] = nlohmann::json::array({volumeMount("cfg")});
  WorkloadItem item{deployment("web", "prod", nlohmann::json::object(),
                               {sidecar, app},
                               {configMapVolume("cfg", "app-config")})};

  auto index = ResourceUsageScanner::findConsumingContainer(
      adapter_, item, configMapChange("app-config"), true);
  ASSERT_TRUE(index.has_value());
  EXPECT_EQ(*index, 1u);
}

TEST_F(UsageScannerTest, SecretVolumeMatchesBySecretName) {
  auto app = container("app");
  app["volumeMounts"] = nlohmann::json::array({volumeMount("creds")});
  WorkloadItem item{deployment("web", "prod", nlohmann::json::object(), {app},
                               {secretVolume("creds", "db-secret")})};

  EXPECT_TRUE(ResourceUsageScanner::findConsumingContainer(
                  adapter_, item, secretChange("db-secret"), true)
                  .has_value());
  // ConfigMap с тем же именем не совпадает с Secret-томом
  EXPECT_FALSE(ResourceUsageScanner::findConsumingContainer(
                   adapter_, item, configMapChange("db-secret"), true)
                   .has_value());
}

TEST_F(UsageScannerTest, ProjectedVolumeSourcesAreScanned) {
  nlohmann::json volumes = nlohmann::json::array(
      {{{"name", "bundle"},
        {"projected",
         {{"sources",
           {{{"secret", {{"name", "tls"}}}},
            {{"configMap", {{"name", "ca-bundle"}}}}}}}}}});

  auto name = ResourceUsageScanner::mountedVolumeName(
      volumes, ResourceKind::ConfigMap, "ca-bundle");
  ASSERT_TRUE(name.has_value());
  EXPECT_EQ(*name, "bundle");
  EXPECT_EQ(*ResourceUsageScanner::mountedVolumeName(
                volumes, ResourceKind::Secret, "tls"),
            "bundle");
  EXPECT_FALSE(ResourceUsageScanner::mountedVolumeName(
                   volumes, ResourceKind::Secret, "ca-bundle")
                   .has_value());
}

TEST_F(UsageScannerTest, VolumeMountedOnlyByInitContainerResolvesToFirst) {
  auto item = deployment("web", "prod", nlohmann::json::object(),
                         {container("main"), container("other")},
                         {configMapVolume("cfg", "app-config")});
  auto init = container("init");
  init["volumeMounts"] = nlohmann::json::array({volumeMount("cfg")});
  item["spec"]["template"]["spec"]["initContainers"] =
      nlohmann::json::array({init});
  WorkloadItem workload{item};

  auto index = ResourceUsageScanner::findConsumingContainer(
      adapter_, workload, configMapChange("app-config"), true);
  ASSERT_TRUE(index.has_value());
  EXPECT_EQ(*index, 0u);
}

TEST_F(UsageScannerTest, EnvFromAndKeyRefAreRecognised) {
  auto first = container("first");
  auto second = container("second");
  second["envFrom"] = nlohmann::json::array(
      {{{"configMapRef", {{"name", "env-config"}}}}});
  auto third = container("third");
  third["env"] = nlohmann::json::array(
      {{{"name", "PASSWORD"},
        {"valueFrom",
         {{"secretKeyRef", {{"name", "db-secret"}, {"key", "password"}}}}}}});
  WorkloadItem item{deployment("web", "prod", nlohmann::json::object(),
                               {first, second, third})};

  EXPECT_EQ(*ResourceUsageScanner::findConsumingContainer(
                adapter_, item, configMapChange("env-config"), true),
            1u);
  EXPECT_EQ(*ResourceUsageScanner::findConsumingContainer(
                adapter_, item, secretChange("db-secret"), true),
            2u);
}

TEST_F(UsageScannerTest, ConfigMapKeyRefAndSecretRefAreRecognised) {
  auto first = container("first");
  first["env"] = nlohmann::json::array(
      {{{"name", "MODE"},
        {"valueFrom",
         {{"configMapKeyRef", {{"name", "settings"}, {"key", "mode"}}}}}}});
  auto second = container("second");
  second["envFrom"] =
      nlohmann::json::array({{{"secretRef", {{"name", "api-token"}}}}});
  WorkloadItem item{deployment("web", "prod", nlohmann::json::object(),
                               {first, second})};

  EXPECT_EQ(*ResourceUsageScanner::findConsumingContainer(
                adapter_, item, configMapChange("settings"), true),
            0u);
  EXPECT_EQ(*ResourceUsageScanner::findConsumingContainer(
                adapter_, item, secretChange("api-token"), true),
            1u);
  // Ссылка на Secret не совпадает с ConfigMap того же имени
  EXPECT_FALSE(ResourceUsageScanner::findConsumingContainer(
                   adapter_, item, configMapChange("api-token"), true)
                   .has_value());
}

TEST_F(UsageScannerTest, EnvReferenceOnlyInInitContainerResolvesToFirst) {
  auto item = deployment("web", "prod", nlohmann::json::object(),
                         {container("main"), container("other")});
  auto keyRefInit = container("migrate");
  keyRefInit["env"] = nlohmann::json::array(
      {{{"name", "DB_URL"},
        {"valueFrom",
         {{"configMapKeyRef", {{"name", "db-config"}, {"key", "url"}}}}}}});
  auto secretInit = container("fetch");
  secretInit["env"] = nlohmann::json::array(
      {{{"name", "TOKEN"},
        {"valueFrom",
         {{"secretKeyRef", {{"name", "fetch-token"}, {"key", "token"}}}}}}});
  auto envFromInit = container("seed");
  envFromInit["envFrom"] =
      nlohmann::json::array({{{"secretRef", {{"name", "seed-secret"}}}}});
  item["spec"]["template"]["spec"]["initContainers"] =
      nlohmann::json::array({keyRefInit, secretInit, envFromInit});
  WorkloadItem workload{item};

  for (const auto &change :
       {configMapChange("db-config"), secretChange("fetch-token"),
        secretChange("seed-secret")}) {
    auto index = ResourceUsageScanner::findConsumingContainer(
        adapter_, workload, change, true);
    ASSERT_TRUE(index.has_value()) << change.resourceName;
    EXPECT_EQ(*index, 0u) << change.resourceName;
  }
}

TEST_F(UsageScannerTest, UnmountedVolumeFallsThroughToEnvScan) {
  // Том объявлен, но его не монтирует ни один контейнер
  auto first = container("first");
  auto second = container("second");
  second["envFrom"] =
      nlohmann::json::array({{{"configMapRef", {{"name", "app-config"}}}}});
  WorkloadItem item{deployment("web", "prod", nlohmann::json::object(),
                               {first, second},
                               {configMapVolume("cfg", "app-config")})};

  auto index = ResourceUsageScanner::findConsumingContainer(
      adapter_, item, configMapChange("app-config"), true);
  ASSERT_TRUE(index.has_value());
  EXPECT_EQ(*index, 1u);

  // Без ссылок в env при auto контейнер не найден
  WorkloadItem unused{deployment("web", "prod", nlohmann::json::object(),
                                 {container("app")},
                                 {configMapVolume("cfg", "app-config")})};
  EXPECT_FALSE(ResourceUsageScanner::findConsumingContainer(
                   adapter_, unused, configMapChange("app-config"), true)
                   .has_value());
}

TEST_F(UsageScannerTest, UnreferencedResourceDependsOnAutoReload) {
  WorkloadItem item{deployment("web", "prod")};

  // auto: контейнер не найден
  EXPECT_FALSE(ResourceUsageScanner::findConsumingContainer(
                   adapter_, item, configMapChange("unused"), true)
                   .has_value());
  // ручная аннотация: первый контейнер
  auto index = ResourceUsageScanner::findConsumingContainer(
      adapter_, item, configMapChange("unused"), false);
  ASSERT_TRUE(index.has_value());
  EXPECT_EQ(*index, 0u);
}

TEST_F(UsageScannerTest, WorkloadWithoutContainersHasNoMatch) {
  WorkloadItem item{deployment("web", "prod", nlohmann::json::object(),
                               {})};
  EXPECT_FALSE(ResourceUsageScanner::findConsumingContainer(
                   adapter_, item, configMapChange("app-config"), false)
                   .has_value());
}

int main(int argc, char **argv) {
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
