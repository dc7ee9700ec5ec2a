#include "sandbox/lifecycle_guard.hpp"

#include <stdexcept>

#include "gtest/gtest.h"
#include "runtime/fake_container_runtime.hpp"

namespace {

using boxrun::runtime::FakeContainerRuntime;
using boxrun::sandbox::LifecycleGuard;
using boxrun::sandbox::SandboxEnvironment;

SandboxEnvironment Environment() {
    SandboxEnvironment environment{};
    environment.id = "abc123";
    return environment;
}

TEST(LifecycleGuard, StopsOnScopeExit) {
    FakeContainerRuntime runtime;
    {
        LifecycleGuard guard(runtime, Environment());
        EXPECT_TRUE(runtime.stopped.empty());
    }
    ASSERT_EQ(runtime.stopped.size(), 1u);
    EXPECT_EQ(runtime.stopped[0].first, "abc123");
    EXPECT_EQ(runtime.stopped[0].second, std::chrono::seconds(1));
}

TEST(LifecycleGuard, ReleaseIsIdempotent) {
    FakeContainerRuntime runtime;
    {
        LifecycleGuard guard(runtime, Environment());
        guard.Release();
        guard.Release();
    }
    EXPECT_EQ(runtime.stopped.size(), 1u);
}

TEST(LifecycleGuard, StopsWhenExceptionUnwinds) {
    FakeContainerRuntime runtime;
    EXPECT_THROW({
        LifecycleGuard guard(runtime, Environment());
        throw std::runtime_error("packaging failed");
    }, std::runtime_error);
    EXPECT_EQ(runtime.stopped.size(), 1u);
}

TEST(LifecycleGuard, SwallowsStopFailure) {
    FakeContainerRuntime runtime;
    runtime.stop_fails = true;
    EXPECT_NO_THROW({
        LifecycleGuard guard(runtime, Environment());
        guard.Release();
    });
    EXPECT_EQ(runtime.stopped.size(), 1u);
}

}  // namespace
