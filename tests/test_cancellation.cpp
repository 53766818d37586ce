#include <gtest/gtest.h>
#include "cancellation.h"

#include <atomic>
#include <thread>

using namespace piecestream;

TEST(CancellationTest, DefaultTokenIsNeverCancelled) {
    CancellationToken token;
    EXPECT_FALSE(token.can_be_cancelled());
    EXPECT_FALSE(token.is_cancelled());
    EXPECT_EQ(token.register_callback([]() {}), 0u);
}

TEST(CancellationTest, SourceCancelsItsTokens) {
    CancellationSource source;
    CancellationToken first = source.token();
    CancellationToken second = source.token();
    
    EXPECT_TRUE(first.can_be_cancelled());
    EXPECT_FALSE(first.is_cancelled());
    
    source.cancel();
    EXPECT_TRUE(source.is_cancelled());
    EXPECT_TRUE(first.is_cancelled());
    EXPECT_TRUE(second.is_cancelled());
}

TEST(CancellationTest, CallbacksRunOnce) {
    CancellationSource source;
    int calls = 0;
    source.token().register_callback([&calls]() { ++calls; });
    
    source.cancel();
    source.cancel();
    EXPECT_EQ(calls, 1);
}

TEST(CancellationTest, LateRegistrationRunsImmediately) {
    CancellationSource source;
    source.cancel();
    
    bool called = false;
    uint64_t id = source.token().register_callback([&called]() { called = true; });
    EXPECT_TRUE(called);
    EXPECT_EQ(id, 0u);
}

TEST(CancellationTest, UnregisteredCallbackDoesNotRun) {
    CancellationSource source;
    bool called = false;
    CancellationToken token = source.token();
    uint64_t id = token.register_callback([&called]() { called = true; });
    EXPECT_NE(id, 0u);
    
    token.unregister_callback(id);
    source.cancel();
    EXPECT_FALSE(called);
}

TEST(CancellationTest, RegistrationIsScoped) {
    CancellationSource source;
    int calls = 0;
    {
        CancellationRegistration registration(source.token(), [&calls]() { ++calls; });
    }
    CancellationRegistration kept(source.token(), [&calls]() { calls += 10; });
    
    source.cancel();
    EXPECT_EQ(calls, 10);
}

TEST(CancellationTest, CancelFromAnotherThread) {
    CancellationSource source;
    CancellationToken token = source.token();
    std::atomic<bool> called{false};
    token.register_callback([&called]() { called = true; });
    
    std::thread canceller([&source]() { source.cancel(); });
    canceller.join();
    
    EXPECT_TRUE(token.is_cancelled());
    EXPECT_TRUE(called.load());
}
