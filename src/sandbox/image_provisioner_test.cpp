#include "sandbox/image_provisioner.hpp"

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "runtime/fake_container_runtime.hpp"

namespace {

using ::testing::UnorderedElementsAre;

using boxrun::runtime::FakeContainerRuntime;
using boxrun::sandbox::ImageProvisioner;

TEST(ImageProvisioner, PullsEveryImage) {
    FakeContainerRuntime runtime;
    ImageProvisioner(runtime).Ensure({"alpine:latest", "python:3.12-slim"});
    EXPECT_THAT(runtime.pulled, UnorderedElementsAre("alpine:latest", "python:3.12-slim"));
}

TEST(ImageProvisioner, FailureDoesNotStopOtherPulls) {
    FakeContainerRuntime runtime;
    runtime.pull_fails = {"alpine:latest"};
    EXPECT_NO_THROW(ImageProvisioner(runtime).Ensure({"alpine:latest", "busybox:1", "python:3.12-slim"}));
    EXPECT_THAT(runtime.pulled, UnorderedElementsAre("alpine:latest", "busybox:1", "python:3.12-slim"));
}

TEST(ImageProvisioner, NothingToPull) {
    FakeContainerRuntime runtime;
    ImageProvisioner(runtime).Ensure({});
    EXPECT_TRUE(runtime.pulled.empty());
}

}  // namespace
