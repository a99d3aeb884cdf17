#include <gtest/gtest.h>
#include <string>

import Core;

namespace
{
    struct TestTag {};
    using Handle = Core::StrongHandle<TestTag>;
    using Pool = Core::ResourcePool<std::string, Handle>;
}

TEST(ResourcePool, AddGetRemoveDeferredRecycle)
{
    Pool pool;
    pool.Initialize(2);

    const Handle h0 = pool.Add("crate");
    ASSERT_TRUE(h0.IsValid());

    std::string* p0 = pool.Get(h0);
    ASSERT_NE(p0, nullptr);
    EXPECT_EQ(*p0, "crate");

    pool.Remove(h0, 10);
    EXPECT_EQ(pool.Get(h0), nullptr);
    EXPECT_EQ(pool.LiveCount(), 0u);
    EXPECT_EQ(pool.GetPendingDeletionCount(), 1u);

    // The slot is held while frames 11 and 12 may still read it.
    pool.ProcessDeletions(12);
    EXPECT_EQ(pool.GetPendingDeletionCount(), 1u);

    pool.ProcessDeletions(13);
    EXPECT_EQ(pool.GetPendingDeletionCount(), 0u);

    const Handle h1 = pool.Add("barrel");
    EXPECT_EQ(h1.Index, h0.Index);
    EXPECT_NE(h1.Generation, h0.Generation);

    EXPECT_EQ(pool.Get(h0), nullptr);
    ASSERT_NE(pool.Get(h1), nullptr);
    EXPECT_EQ(*pool.Get(h1), "barrel");
}

TEST(ResourcePool, PointersStableAcrossGrowth)
{
    Pool pool;
    pool.Initialize(2);

    const Handle first = pool.Add("first");
    const std::string* address = pool.Get(first);

    for (int i = 0; i < 1000; ++i)
        (void)pool.Add(std::to_string(i));

    EXPECT_EQ(pool.Get(first), address);
    EXPECT_EQ(pool.LiveCount(), 1001u);
}

TEST(ResourcePool, TryGetReportsNotFound)
{
    Pool pool;
    pool.Initialize(1);

    auto missing = pool.TryGet(Handle(3, 1));
    ASSERT_FALSE(missing.has_value());
    EXPECT_EQ(missing.error(), Core::ErrorCode::ResourceNotFound);

    const Handle h = pool.Add("x");
    auto found = pool.TryGet(h);
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(**found, "x");
}

TEST(ResourcePool, DoubleRemoveIsIgnored)
{
    Pool pool;
    pool.Initialize(1);

    const Handle h = pool.Add("x");
    pool.Remove(h, 0);
    pool.Remove(h, 0);
    EXPECT_EQ(pool.GetPendingDeletionCount(), 1u);
}
