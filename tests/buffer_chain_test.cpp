// SPDX-License-Identifier: MIT

// tests/buffer_chain_test.cpp
#include <gtest/gtest.h>

#include <cstring>
#include <memory>
#include <string>

#include "lib/stream/buffer_chain.hpp"

using namespace jsonl_pipe;

namespace {

std::shared_ptr<Segment> MakeSegment(std::string_view text) {
    auto seg = std::make_shared<Segment>();
    std::memcpy(seg->data.data(), text.data(), text.size());
    seg->size = text.size();
    return seg;
}

}  // namespace

TEST(SegmentTest, BasicProperties) {
    Segment seg;
    EXPECT_EQ(seg.size, 0);
    EXPECT_EQ(seg.Remaining(), Segment::kSize);
    EXPECT_FALSE(seg.IsFull());

    seg.size = Segment::kSize;
    EXPECT_EQ(seg.Remaining(), 0);
    EXPECT_TRUE(seg.IsFull());
}

TEST(SegmentTest, WriteSpan) {
    Segment seg;
    auto span = seg.WriteSpan();
    EXPECT_EQ(span.size(), Segment::kSize);

    seg.size = 100;
    span = seg.WriteSpan();
    EXPECT_EQ(span.size(), Segment::kSize - 100);
    EXPECT_EQ(span.data(), seg.data.data() + 100);
}

TEST(BufferChainTest, EmptyChain) {
    BufferChain chain;
    EXPECT_EQ(chain.Size(), 0);
    EXPECT_TRUE(chain.Empty());
    EXPECT_EQ(chain.SegmentCount(), 0);
    EXPECT_EQ(chain.ContiguousSize(), 0);
    EXPECT_FALSE(chain.FindByte(std::byte{'\n'}).has_value());
}

TEST(BufferChainTest, AppendEmptySegmentIsIgnored) {
    BufferChain chain;
    chain.Append(std::make_shared<Segment>());
    EXPECT_TRUE(chain.Empty());
    EXPECT_EQ(chain.SegmentCount(), 0);
}

TEST(BufferChainTest, FromString) {
    auto chain = BufferChain::FromString("hello\nworld");
    EXPECT_EQ(chain.Size(), 11);
    EXPECT_EQ(chain.ToString(), "hello\nworld");
}

TEST(BufferChainTest, ConsumeAcrossSegments) {
    BufferChain chain;
    chain.Append(MakeSegment("abc"));
    chain.Append(MakeSegment("defg"));
    ASSERT_EQ(chain.Size(), 7);

    chain.Consume(4);
    EXPECT_EQ(chain.Size(), 3);
    EXPECT_EQ(chain.SegmentCount(), 1);
    EXPECT_EQ(chain.ToString(), "efg");
    EXPECT_EQ(chain.ContiguousSize(), 3);
}

TEST(BufferChainTest, ConsumeZero) {
    auto chain = BufferChain::FromString("abc");
    chain.Consume(0);
    EXPECT_EQ(chain.ToString(), "abc");
}

TEST(BufferChainTest, CopyToAcrossSegments) {
    BufferChain chain;
    chain.Append(MakeSegment("{\"a\":"));
    chain.Append(MakeSegment("1}\n"));

    char out[8] = {};
    chain.CopyTo(3, 5, out);
    EXPECT_EQ(std::string(out, 5), "a\":1}");
    EXPECT_EQ(chain.ToString(2, 4), "a\":1");
}

TEST(BufferChainTest, DataAtAfterConsume) {
    BufferChain chain;
    chain.Append(MakeSegment("xy"));
    chain.Append(MakeSegment("z"));
    chain.Consume(1);
    EXPECT_EQ(static_cast<char>(*chain.DataAt(0)), 'y');
    EXPECT_EQ(static_cast<char>(*chain.DataAt(1)), 'z');
}

TEST(BufferChainTest, FindByteSpansSegments) {
    BufferChain chain;
    chain.Append(MakeSegment("one"));
    chain.Append(MakeSegment("two\nthree\n"));

    auto first = chain.FindByte(std::byte{'\n'});
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(*first, 6);

    auto second = chain.FindByte(std::byte{'\n'}, *first + 1);
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(*second, 12);

    EXPECT_FALSE(chain.FindByte(std::byte{'\n'}, *second + 1).has_value());
}

TEST(BufferChainTest, FindByteAfterPartialConsume) {
    auto chain = BufferChain::FromString("a\nbc\n");
    chain.Consume(2);
    auto pos = chain.FindByte(std::byte{'\n'});
    ASSERT_TRUE(pos.has_value());
    EXPECT_EQ(*pos, 2);
}

TEST(BufferChainTest, AppendBytesFillsTailFirst) {
    BufferChain chain;
    chain.AppendBytes("abc", 3);
    chain.AppendBytes("def", 3);
    EXPECT_EQ(chain.SegmentCount(), 1);
    EXPECT_EQ(chain.ToString(), "abcdef");
}

TEST(BufferChainTest, AppendBytesLargerThanSegment) {
    std::string big(Segment::kSize + 10, 'q');
    BufferChain chain;
    chain.AppendBytes(big.data(), big.size());
    EXPECT_EQ(chain.SegmentCount(), 2);
    EXPECT_EQ(chain.Size(), big.size());
    EXPECT_EQ(chain.ToString(), big);
}

TEST(BufferChainTest, AppendBytesDoesNotTouchSharedSegment) {
    auto shared = MakeSegment("abc");
    BufferChain chain;
    chain.Append(shared);
    chain.AppendBytes("def", 3);

    EXPECT_EQ(shared->size, 3);
    EXPECT_EQ(chain.SegmentCount(), 2);
    EXPECT_EQ(chain.ToString(), "abcdef");
}

TEST(BufferChainTest, SpliceMovesSegments) {
    auto a = BufferChain::FromString("first ");
    auto b = BufferChain::FromString("second");
    a.Splice(std::move(b));
    EXPECT_EQ(a.ToString(), "first second");
    EXPECT_TRUE(b.Empty());
}

TEST(BufferChainTest, WouldOverflow) {
    auto chain = BufferChain::FromString("12345");
    EXPECT_FALSE(chain.WouldOverflow(5, 10));
    EXPECT_TRUE(chain.WouldOverflow(6, 10));
    EXPECT_TRUE(chain.WouldOverflow(0, 4));
}

TEST(BufferChainTest, MoveLeavesSourceEmpty) {
    auto a = BufferChain::FromString("abc");
    a.Consume(1);
    BufferChain b(std::move(a));
    EXPECT_EQ(b.ToString(), "bc");
    EXPECT_TRUE(a.Empty());
}

TEST(SegmentPoolTest, AcquireAndRelease) {
    SegmentPool pool(2);
    auto seg = pool.Acquire();
    seg->size = 10;
    pool.Release(std::move(seg));
    EXPECT_EQ(pool.PoolSize(), 1);

    auto again = pool.Acquire();
    EXPECT_EQ(again->size, 0);
    EXPECT_EQ(pool.PoolSize(), 0);
}

TEST(SegmentPoolTest, PoolSizeLimit) {
    SegmentPool pool(1);
    pool.Release(std::make_shared<Segment>());
    pool.Release(std::make_shared<Segment>());
    EXPECT_EQ(pool.PoolSize(), 1);
}

TEST(SegmentPoolTest, SharedSegmentIsNotPooled) {
    SegmentPool pool;
    auto seg = std::make_shared<Segment>();
    auto other = seg;
    pool.Release(std::move(seg));
    EXPECT_EQ(pool.PoolSize(), 0);
}

TEST(SegmentPoolTest, RecyclerReturnsConsumedSegments) {
    SegmentPool pool;
    BufferChain chain;
    chain.SetRecycleCallback(pool.MakeRecycler());
    chain.Append(MakeSegment("abc"));
    chain.Append(MakeSegment("def"));

    chain.Consume(2);
    EXPECT_EQ(pool.PoolSize(), 0);  // Partially consumed

    chain.Consume(1);
    EXPECT_EQ(pool.PoolSize(), 1);

    chain.Clear();
    EXPECT_EQ(pool.PoolSize(), 2);
    EXPECT_TRUE(chain.Empty());
}
