#include <gtest/gtest.h>
#include <cstdint>
#include <limits>
#include <unordered_set>

import Core;

struct MeshTag {};
struct TextureTag {};

using MeshHandle = Core::StrongHandle<MeshTag>;
using TextureHandle = Core::StrongHandle<TextureTag>;

TEST(StrongHandle, DefaultConstructor_Invalid)
{
    MeshHandle h;
    EXPECT_FALSE(h.IsValid());
    EXPECT_FALSE(static_cast<bool>(h));
    EXPECT_EQ(h.Index, MeshHandle::INVALID_INDEX);
    EXPECT_EQ(h.Generation, 0u);
}

TEST(StrongHandle, ZeroIndexIsValid)
{
    MeshHandle h(0, 1);
    EXPECT_TRUE(h.IsValid());
    EXPECT_EQ(h.Index, 0u);
}

TEST(StrongHandle, GenerationDistinguishesReusedSlots)
{
    MeshHandle first(7, 1);
    MeshHandle reused(7, 2);
    EXPECT_NE(first, reused);
    EXPECT_LT(first, reused);
}

TEST(StrongHandle, PackedKeepsBothHalves)
{
    constexpr MeshHandle h(0x12345678u, 0x9ABCDEF0u);
    static_assert(h.Packed() == 0x9ABCDEF012345678ull);
    EXPECT_EQ(h.Packed() & 0xFFFFFFFFull, 0x12345678ull);
}

TEST(StrongHandle, HashSetDeduplicates)
{
    std::unordered_set<MeshHandle> handles;
    handles.insert(MeshHandle(1, 1));
    handles.insert(MeshHandle(2, 1));
    handles.insert(MeshHandle(1, 2));
    handles.insert(MeshHandle(1, 1));

    EXPECT_EQ(handles.size(), 3u);
}

TEST(StrongHandle, MaxValidIndex)
{
    MeshHandle h(MeshHandle::INVALID_INDEX - 1, 0);
    EXPECT_TRUE(h.IsValid());

    TextureHandle t(0, std::numeric_limits<uint32_t>::max());
    EXPECT_TRUE(t.IsValid());
}
