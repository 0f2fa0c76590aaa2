#include <gtest/gtest.h>
#include "partition/buffer_lease.hpp"

#include <utility>
#include <vector>

namespace mpart
{
    namespace testing
    {

        TEST(BufferLeaseTest, LeaseRegistersRange)
        {
            std::vector<Idx> data(8);
            {
                BufferLease lease = BufferLease::of("data", IdxView(data));
                EXPECT_TRUE(lease.active());
                EXPECT_TRUE(BufferLease::isLeased(data.data(), sizeof(Idx)));
            }
            EXPECT_FALSE(BufferLease::isLeased(data.data(), data.size() * sizeof(Idx)));
        }

        TEST(BufferLeaseTest, OverlappingLeaseThrows)
        {
            std::vector<Idx> data(8);
            BufferLease whole = BufferLease::of("data", IdxView(data));

            IdxView tail(data.data() + 4, 4);
            EXPECT_THROW(BufferLease::of("tail", tail), std::logic_error);
        }

        TEST(BufferLeaseTest, DisjointRangesCoexist)
        {
            std::vector<Idx> data(8);
            IdxView head(data.data(), 4);
            IdxView tail(data.data() + 4, 4);

            BufferLease first = BufferLease::of("head", head);
            EXPECT_NO_THROW(BufferLease::of("tail", tail));
        }

        TEST(BufferLeaseTest, EmptyRangeIsNotRegistered)
        {
            std::vector<Idx> data;
            BufferLease first = BufferLease::of("empty", IdxView(data));
            BufferLease second = BufferLease::of("empty", IdxView(data));
            EXPECT_FALSE(first.active());
            EXPECT_FALSE(second.active());
        }

        TEST(BufferLeaseTest, MoveKeepsRangeLeased)
        {
            std::vector<Idx> data(4);
            BufferLease first = BufferLease::of("data", IdxView(data));
            BufferLease second = std::move(first);

            EXPECT_FALSE(first.active());
            EXPECT_TRUE(second.active());
            EXPECT_TRUE(BufferLease::isLeased(data.data(), sizeof(Idx)));
        }

        TEST(BufferLeaseTest, MoveAssignReleasesPreviousRange)
        {
            std::vector<Idx> a(4);
            std::vector<Idx> b(4);
            BufferLease lease = BufferLease::of("a", IdxView(a));
            lease = BufferLease::of("b", IdxView(b));

            EXPECT_FALSE(BufferLease::isLeased(a.data(), a.size() * sizeof(Idx)));
            EXPECT_TRUE(BufferLease::isLeased(b.data(), b.size() * sizeof(Idx)));
        }

        TEST(BufferLeaseTest, ErrorNamesTheArray)
        {
            std::vector<Idx> data(2);
            BufferLease lease = BufferLease::of("xadj", IdxView(data));
            try
            {
                BufferLease::of("xadj", IdxView(data));
                FAIL() << "expected std::logic_error";
            }
            catch (const std::logic_error &e)
            {
                EXPECT_NE(std::string(e.what()).find("xadj"), std::string::npos);
            }
        }

    } // namespace testing
} // namespace mpart
