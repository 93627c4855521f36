#include <gtest/gtest.h>

#include "fault_injecting_store.hpp"
#include "provision/kinds.hpp"
#include "provision/resource_ensurer.hpp"
#include "store/memory_resource_store.hpp"

namespace clusterboot {
namespace {

Resource desired_namespace() {
  return make_resource(kinds::kCoreV1, kinds::kNamespace, "", "kibaship",
                       {{kManagedByLabel, kManagedByValue}});
}

TEST(ResourceEnsurerTest, CreatesWhenAbsent) {
  InMemoryResourceStore store;
  auto r = ensure_resource(store, desired_namespace());
  ASSERT_TRUE(r.is_ok());
  EXPECT_EQ(r.value(), EnsureOutcome::Created);
  EXPECT_EQ(store.size(), 1u);
}

TEST(ResourceEnsurerTest, RepeatedRunsLeaveOneUntouchedObject) {
  InMemoryResourceStore store;
  ASSERT_TRUE(ensure_resource(store, desired_namespace()).is_ok());
  auto before = store.get(desired_namespace().key).value();

  auto changed = desired_namespace();
  changed.object["metadata"].as_object()["labels"] =
      json::object{{"other", "value"}};
  for (int i = 0; i < 3; ++i) {
    auto r = ensure_resource(store, changed);
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value(), EnsureOutcome::AlreadyExists);
  }
  auto after = store.get(desired_namespace().key).value();
  EXPECT_EQ(after.object, before.object);
  EXPECT_EQ(after.resource_version, before.resource_version);
  EXPECT_EQ(store.size(), 1u);
}

TEST(ResourceEnsurerTest, LostCreateRaceIsAlreadyExists) {
  InMemoryResourceStore inner;
  testutil::FaultInjectingStore store(inner);
  store.before_create = [&inner](const Resource &r) {
    ASSERT_TRUE(inner.create(r).is_ok());
  };
  auto r = ensure_resource(store, desired_namespace());
  ASSERT_TRUE(r.is_ok());
  EXPECT_EQ(r.value(), EnsureOutcome::AlreadyExists);
  EXPECT_EQ(inner.size(), 1u);
}

TEST(ResourceEnsurerTest, BackendErrorsCarryIdentity) {
  InMemoryResourceStore inner;
  testutil::FaultInjectingStore store(inner);
  store.fail_gets_with = my_errors::STORE::BACKEND_ERROR;
  auto r = ensure_resource(store, desired_namespace());
  ASSERT_TRUE(r.is_err());
  EXPECT_EQ(r.error().code, my_errors::STORE::BACKEND_ERROR);
  EXPECT_NE(r.error().what.find("Namespace kibaship"), std::string::npos);
  EXPECT_EQ(store.creates, 0);

  store.fail_gets_with.reset();
  store.fail_creates_with = my_errors::STORE::BACKEND_ERROR;
  auto c = ensure_resource(store, desired_namespace());
  ASSERT_TRUE(c.is_err());
  EXPECT_NE(c.error().what.find("create Namespace kibaship"),
            std::string::npos);
}

} // namespace
} // namespace clusterboot
