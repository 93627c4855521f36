#include <gtest/gtest.h>

#include <atomic>
#include <thread>

#include "my_error_codes.hpp"
#include "provision/kinds.hpp"
#include "provision/readiness_conditions.hpp"
#include "provision/readiness_poller.hpp"
#include "store/memory_resource_store.hpp"

namespace clusterboot {
namespace {

using namespace std::chrono_literals;
using Clock = std::chrono::steady_clock;

PollOptions fast(std::chrono::milliseconds deadline) {
  return PollOptions{.interval = 10ms,
                     .deadline = deadline,
                     .backoff_multiplier = 1.0,
                     .max_interval = 10ms};
}

ReadinessCondition after_n_probes(const std::string &name, int n,
                                  std::shared_ptr<std::atomic<int>> calls) {
  return ReadinessCondition{
      name, [n, calls]() {
        int seen = ++*calls;
        return monad::MyResult<ConditionState>::Ok(
            seen >= n ? ConditionState::Satisfied : ConditionState::Pending);
      }};
}

ReadinessCondition never(const std::string &name) {
  return ReadinessCondition{name, [] {
                              return monad::MyResult<ConditionState>::Ok(
                                  ConditionState::NotFound);
                            }};
}

TEST(ReadinessPollerTest, ReadyWhenAllConditionsHold) {
  auto a = std::make_shared<std::atomic<int>>(0);
  auto b = std::make_shared<std::atomic<int>>(0);
  auto r = wait_until_ready(
      {after_n_probes("a", 1, a), after_n_probes("b", 3, b)}, fast(5s));
  ASSERT_TRUE(r.is_ok());
  EXPECT_TRUE(r.value().ready());
  EXPECT_TRUE(r.value().unmet.empty());
  // Satisfied conditions are not probed again.
  EXPECT_EQ(a->load(), 1);
  EXPECT_EQ(b->load(), 3);
}

TEST(ReadinessPollerTest, TimesOutOnlyAfterDeadlineNamingUnmet) {
  auto a = std::make_shared<std::atomic<int>>(0);
  auto start = Clock::now();
  auto r = wait_until_ready({after_n_probes("a", 1, a), never("secret tls.crt"),
                             never("service address")},
                            fast(200ms));
  auto elapsed = Clock::now() - start;
  ASSERT_TRUE(r.is_ok());
  EXPECT_EQ(r.value().status, WaitStatus::TimedOut);
  EXPECT_EQ(r.value().unmet, (std::vector<std::string>{"secret tls.crt",
                                                       "service address"}));
  EXPECT_GE(elapsed, 200ms);
  EXPECT_LT(elapsed, 5s);
}

TEST(ReadinessPollerTest, ZeroDeadlineProbesOnce) {
  auto calls = std::make_shared<std::atomic<int>>(0);
  auto r = wait_until_ready({after_n_probes("x", 2, calls)}, fast(0ms));
  ASSERT_TRUE(r.is_ok());
  EXPECT_EQ(r.value().status, WaitStatus::TimedOut);
  EXPECT_EQ(calls->load(), 1);
}

TEST(ReadinessPollerTest, CancellationEndsWaitPromptly) {
  CancellationSignal cancel;
  std::thread canceller([&cancel] {
    std::this_thread::sleep_for(50ms);
    cancel.cancel();
  });
  auto start = Clock::now();
  auto r = wait_until_ready({never("forever")}, fast(30s), &cancel);
  auto elapsed = Clock::now() - start;
  canceller.join();
  ASSERT_TRUE(r.is_ok());
  EXPECT_EQ(r.value().status, WaitStatus::Cancelled);
  EXPECT_LT(elapsed, 5s);
}

TEST(ReadinessPollerTest, ProbeErrorAbortsWait) {
  ReadinessCondition broken{"broken", [] {
                              return monad::MyResult<ConditionState>::Err(
                                  monad::Error{
                                      .code = my_errors::STORE::BACKEND_ERROR,
                                      .what = "db locked"});
                            }};
  auto r = wait_until_ready({broken}, fast(5s));
  ASSERT_TRUE(r.is_err());
  EXPECT_EQ(r.error().code, my_errors::STORE::BACKEND_ERROR);
  EXPECT_NE(r.error().what.find("broken"), std::string::npos);
}

TEST(ReadinessPollerTest, BackoffStillHonoursDeadline) {
  PollOptions options{.interval = 10ms,
                      .deadline = 300ms,
                      .backoff_multiplier = 2.0,
                      .max_interval = 80ms};
  auto start = Clock::now();
  auto r = wait_until_ready({never("slow")}, options);
  auto elapsed = Clock::now() - start;
  ASSERT_TRUE(r.is_ok());
  EXPECT_EQ(r.value().status, WaitStatus::TimedOut);
  EXPECT_GE(elapsed, 300ms);
  EXPECT_LT(elapsed, 5s);
}

TEST(ReadinessPollerTest, RequireReadyMapsStatuses) {
  auto timed_out = require_ready(
      "acme-dns", monad::MyResult<WaitResult>::Ok(
                      WaitResult{WaitStatus::TimedOut, {"deployment ready"}}));
  ASSERT_TRUE(timed_out.is_err());
  EXPECT_EQ(timed_out.error().code, my_errors::PROVISION::DEADLINE_EXCEEDED);
  EXPECT_NE(timed_out.error().what.find("deployment ready"), std::string::npos);

  auto cancelled = require_ready(
      "acme-dns",
      monad::MyResult<WaitResult>::Ok(WaitResult{WaitStatus::Cancelled, {}}));
  ASSERT_TRUE(cancelled.is_err());
  EXPECT_EQ(cancelled.error().code, my_errors::PROVISION::CANCELLED);

  EXPECT_TRUE(require_ready("x", monad::MyResult<WaitResult>::Ok(WaitResult{}))
                  .is_ok());
}

class ReadinessConditionsTest : public ::testing::Test {
protected:
  void put(const std::string &kind, const std::string &ns,
           const std::string &name, const json::object &status,
           const json::object &spec = {}) {
    auto r = make_resource("v1", kind, ns, name);
    if (!spec.empty()) {
      r.object["spec"] = spec;
    }
    if (!status.empty()) {
      r.object["status"] = status;
    }
    ASSERT_TRUE(store_.create(r).is_ok());
  }

  ConditionState state(const ReadinessCondition &c) {
    auto r = c.probe();
    EXPECT_TRUE(r.is_ok());
    return r.is_ok() ? r.value() : ConditionState::NotFound;
  }

  InMemoryResourceStore store_;
};

TEST_F(ReadinessConditionsTest, NamespaceExists) {
  auto c = namespace_exists(store_, "registry");
  EXPECT_EQ(state(c), ConditionState::NotFound);
  put(kinds::kNamespace, "", "registry", {});
  EXPECT_EQ(state(c), ConditionState::Satisfied);
}

TEST_F(ReadinessConditionsTest, SecretHasKey) {
  auto c = secret_has_key(store_, "kibaship", "cert", "tls.crt");
  EXPECT_EQ(state(c), ConditionState::NotFound);
  auto secret = make_resource("v1", kinds::kSecret, "kibaship", "cert");
  set_secret_value(secret, "tls.key", "k");
  ASSERT_TRUE(store_.create(secret).is_ok());
  EXPECT_EQ(state(c), ConditionState::Pending);
  set_secret_value(secret, "tls.crt", "PEM");
  secret.resource_version.clear();
  ASSERT_TRUE(store_.update(secret).is_ok());
  EXPECT_EQ(state(c), ConditionState::Satisfied);
}

TEST_F(ReadinessConditionsTest, ServiceExternalAddress) {
  put(kinds::kService, "kibaship", "pending",
      json::object{{"loadBalancer", json::object{}}});
  put(kinds::kService, "kibaship", "ip",
      json::object{{"loadBalancer",
                    json::object{{"ingress",
                                  json::array{json::object{{"ip", "1.2.3.4"}}}}}}});
  put(kinds::kService, "kibaship", "host",
      json::object{
          {"loadBalancer",
           json::object{{"ingress", json::array{json::object{
                                        {"hostname", "lb.example.com"}}}}}}});
  EXPECT_EQ(state(service_has_external_address(store_, "kibaship", "pending")),
            ConditionState::Pending);
  EXPECT_EQ(state(service_has_external_address(store_, "kibaship", "ip")),
            ConditionState::Satisfied);
  EXPECT_EQ(state(service_has_external_address(store_, "kibaship", "host")),
            ConditionState::Satisfied);
}

TEST_F(ReadinessConditionsTest, DeploymentReady) {
  put(kinds::kDeployment, "kibaship", "partial",
      json::object{{"readyReplicas", 1}}, json::object{{"replicas", 2}});
  put(kinds::kDeployment, "kibaship", "full",
      json::object{{"readyReplicas", 2}}, json::object{{"replicas", 2}});
  put(kinds::kDeployment, "kibaship", "none", json::object{},
      json::object{{"replicas", 0}});
  EXPECT_EQ(state(deployment_ready(store_, "kibaship", "partial")),
            ConditionState::Pending);
  EXPECT_EQ(state(deployment_ready(store_, "kibaship", "full")),
            ConditionState::Satisfied);
  EXPECT_EQ(state(deployment_ready(store_, "kibaship", "none")),
            ConditionState::Pending);
}

TEST_F(ReadinessConditionsTest, CertificateReady) {
  put(kinds::kCertificate, "kibaship", "issuing",
      json::object{{"conditions",
                    json::array{json::object{{"type", "Ready"},
                                             {"status", "False"}}}}});
  put(kinds::kCertificate, "kibaship", "issued",
      json::object{{"conditions",
                    json::array{json::object{{"type", "Issuing"},
                                             {"status", "False"}},
                                json::object{{"type", "Ready"},
                                             {"status", "True"}}}}});
  EXPECT_EQ(state(certificate_ready(store_, "kibaship", "issuing")),
            ConditionState::Pending);
  EXPECT_EQ(state(certificate_ready(store_, "kibaship", "issued")),
            ConditionState::Satisfied);
}

} // namespace
} // namespace clusterboot
