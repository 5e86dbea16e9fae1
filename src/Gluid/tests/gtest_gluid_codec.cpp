#include <gtest/gtest.h>

#include <Core/UUID.h>
#include <Gluid/GluidCodec.h>

#include <Poco/UUID.h>

#include <limits>
#include <random>
#include <string>
#include <thread>
#include <vector>

using namespace Gluid;

namespace
{

/// Namespaces of the round-trip tables. "none" and "" are different namespaces.
const NamespaceName none = std::nullopt;

std::string toString(NamespaceName name)
{
    return name ? "'" + std::string(*name) + "'" : "none";
}

template <typename T>
struct RoundTripCase
{
    T input;
    NamespaceName namespace_in;
    NamespaceName namespace_out;
    std::optional<T> expected;
};

template <typename T>
std::ostream & operator<<(std::ostream & ostr, const RoundTripCase<T> & test_case)
{
    return ostr << test_case.input << " " << toString(test_case.namespace_in) << " -> " << toString(test_case.namespace_out);
}

}

using Int32RoundTripCase = RoundTripCase<Int32>;
using Int64RoundTripCase = RoundTripCase<Int64>;

class GluidInt32RoundTrip : public ::testing::TestWithParam<Int32RoundTripCase> {};

TEST_P(GluidInt32RoundTrip, Decode)
{
    const auto & test_case = GetParam();
    UUID uuid = encode(test_case.input, test_case.namespace_in);
    EXPECT_EQ(toInt32(uuid, test_case.namespace_out), test_case.expected);
    EXPECT_EQ(isLinked(uuid, test_case.namespace_out), test_case.expected.has_value());
    EXPECT_TRUE(isGluid(uuid));
}

INSTANTIATE_TEST_SUITE_P(Gluid, GluidInt32RoundTrip, ::testing::ValuesIn(std::vector<Int32RoundTripCase>{
    {1, "test", "test", 1},
    {2, "test", "blah", std::nullopt},
    {3, "test", "", std::nullopt},
    {4, "test", none, std::nullopt},
    {5, "", "", 5},
    {6, "", none, std::nullopt},
    {7, "", "blah", std::nullopt},
    {8, none, none, 8},
    {9, none, "", std::nullopt},
    {10, none, "blah", std::nullopt},
    {std::numeric_limits<Int32>::max(), "test", "test", std::numeric_limits<Int32>::max()},
    {std::numeric_limits<Int32>::max(), none, none, std::numeric_limits<Int32>::max()},
    {std::numeric_limits<Int32>::min(), "test", "test", std::numeric_limits<Int32>::min()},
    {std::numeric_limits<Int32>::min(), none, none, std::numeric_limits<Int32>::min()},
}));


class GluidInt64RoundTrip : public ::testing::TestWithParam<Int64RoundTripCase> {};

TEST_P(GluidInt64RoundTrip, Decode)
{
    const auto & test_case = GetParam();
    UUID uuid = encode(test_case.input, test_case.namespace_in);
    EXPECT_EQ(toInt64(uuid, test_case.namespace_out), test_case.expected);
}

INSTANTIATE_TEST_SUITE_P(Gluid, GluidInt64RoundTrip, ::testing::ValuesIn(std::vector<Int64RoundTripCase>{
    {10000000001, "test", "test", 10000000001},
    {10000000002, "test", "blah", std::nullopt},
    {10000000003, "test", "", std::nullopt},
    {10000000004, "test", none, std::nullopt},
    {10000000005, "", "", 10000000005},
    {10000000006, "", none, std::nullopt},
    {10000000007, "", "blah", std::nullopt},
    {10000000008, none, none, 10000000008},
    {10000000009, none, "", std::nullopt},
    {10000000010, none, "blah", std::nullopt},
    {std::numeric_limits<Int64>::max(), "test", "test", std::numeric_limits<Int64>::max()},
    {std::numeric_limits<Int64>::max(), none, none, std::numeric_limits<Int64>::max()},
    {std::numeric_limits<Int64>::min(), "test", "test", std::numeric_limits<Int64>::min()},
    {std::numeric_limits<Int64>::min(), none, none, std::numeric_limits<Int64>::min()},
}));


TEST(Gluid, TwoInts)
{
    struct Case
    {
        Int32 input1;
        Int32 input2;
        NamespaceName namespace_in;
        NamespaceName namespace_out;
        std::optional<Int32> expected1;
        std::optional<Int32> expected2;
    };

    constexpr Int32 max = std::numeric_limits<Int32>::max();
    constexpr Int32 min = std::numeric_limits<Int32>::min();

    const std::vector<Case> cases{
        {1, 10, "test", "test", 1, 10},
        {2, 9, "test", "blah", std::nullopt, std::nullopt},
        {3, 8, "test", "", std::nullopt, std::nullopt},
        {4, 7, "test", none, std::nullopt, std::nullopt},
        {5, 6, "", "", 5, 6},
        {6, 5, "", none, std::nullopt, std::nullopt},
        {7, 4, "", "blah", std::nullopt, std::nullopt},
        {8, 3, none, none, 8, 3},
        {9, 2, none, "", std::nullopt, std::nullopt},
        {10, 1, none, "blah", std::nullopt, std::nullopt},
        {max, max, "test", "test", max, max},
        {max, max, none, none, max, max},
        {min, min, "test", "test", min, min},
        {min, min, none, none, min, min},
        {max, min, "test", "test", max, min},
        {max, min, none, none, max, min},
        {min, max, "test", "test", min, max},
        {min, max, none, none, min, max},
    };

    for (const auto & test_case : cases)
    {
        SCOPED_TRACE(std::to_string(test_case.input1) + ", " + std::to_string(test_case.input2) + " "
            + toString(test_case.namespace_in) + " -> " + toString(test_case.namespace_out));

        UUID uuid = encode(test_case.input1, test_case.input2, test_case.namespace_in);
        EXPECT_EQ(toInt32(uuid, test_case.namespace_out), test_case.expected1);
        EXPECT_EQ(secondInt32(uuid, test_case.namespace_out), test_case.expected2);
    }
}

TEST(Gluid, SingleIntHasZeroSecondValue)
{
    UUID uuid = encode(42, "test");
    EXPECT_EQ(secondInt32(uuid, "test"), 0);
    EXPECT_EQ(toInt64(uuid, "test"), 42);
}

TEST(Gluid, Int64LanesAreTwoInt32)
{
    const Int64 value = (Int64{-2} << 32) | 0x7FFFFFFF;
    UUID uuid = encode(value, "lanes");
    EXPECT_EQ(toInt32(uuid, "lanes"), 0x7FFFFFFF);
    EXPECT_EQ(secondInt32(uuid, "lanes"), -2);
    EXPECT_EQ(formatUUID(uuid), formatUUID(encode(Int32{0x7FFFFFFF}, Int32{-2}, "lanes")));
}

TEST(Gluid, KnownIdentifiers)
{
    EXPECT_EQ(formatUUID(encode(1)), "00000001-0000-1000-e0cc-cccc00000000");
    EXPECT_EQ(formatUUID(encode(1, "test")), "81d0869e-4c88-157d-e656-e326a0c55ad0");
    EXPECT_EQ(formatUUID(encode(1, 10, "test")), "81d0869e-4c82-157d-e656-e326a0c55ad0");
    EXPECT_EQ(formatUUID(encode(5, "")), "42c4b0e6-fc98-141c-e156-3738c8996fb9");

    EXPECT_EQ(toInt32(parseUUID("81d0869e-4c88-157d-e656-e326a0c55ad0"), "test"), 1);
}

TEST(Gluid, Deterministic)
{
    for (NamespaceName name : {none, NamespaceName(""), NamespaceName("test")})
    {
        EXPECT_TRUE(encode(12345, name) == encode(12345, name));
        EXPECT_TRUE(encode(Int64{1} << 40, name) == encode(Int64{1} << 40, name));
        EXPECT_TRUE(encode(1, 2, name) == encode(1, 2, name));
    }
}

TEST(Gluid, NamespaceIsolation)
{
    const std::vector<NamespaceName> names{none, "", "test", "blah", "Test", "test ", "customers", "orders"};

    std::mt19937 rng(7);
    std::uniform_int_distribution<Int32> distribution(std::numeric_limits<Int32>::min(), std::numeric_limits<Int32>::max());

    for (size_t i = 0; i < 200; ++i)
    {
        Int32 value = distribution(rng);
        for (const auto & name_in : names)
        {
            UUID uuid = encode(value, name_in);
            for (const auto & name_out : names)
            {
                if (name_in == name_out)
                    ASSERT_EQ(toInt32(uuid, name_out), value) << toString(name_in);
                else
                    ASSERT_EQ(toInt32(uuid, name_out), std::nullopt) << toString(name_in) << " -> " << toString(name_out);
            }
        }
    }
}

TEST(Gluid, IsGluidIndependentOfNamespace)
{
    for (size_t i = 0; i < 2000; ++i)
    {
        std::string name = "ns" + std::to_string(i);
        UUID uuid = encode(static_cast<Int64>(i) * 1000003, name);
        ASSERT_TRUE(isGluid(uuid)) << name;
        ASSERT_EQ(toPocoUUID(uuid).version(), 1) << name;
    }
}

TEST(Gluid, StandardUUIDsAreNotGluids)
{
    for (size_t i = 0; i < 1000; ++i)
    {
        UUID uuid = UUIDHelpers::generateV4();
        ASSERT_FALSE(isGluid(uuid)) << formatUUID(uuid);

        for (NamespaceName name : {none, NamespaceName(""), NamespaceName("test")})
        {
            ASSERT_FALSE(isLinked(uuid, name));
            ASSERT_EQ(toInt32(uuid, name), std::nullopt);
            ASSERT_EQ(toInt64(uuid, name), std::nullopt);
            ASSERT_EQ(secondInt32(uuid, name), std::nullopt);
        }
    }

    EXPECT_FALSE(isGluid(UUIDHelpers::Nil));
    EXPECT_EQ(toInt32(UUIDHelpers::Nil), std::nullopt);
}

TEST(Gluid, MarkersWithoutTagAreNotLinked)
{
    /// Version and variant of a Gluid, arbitrary bytes elsewhere.
    UUID uuid = parseUUID("0badf00d-1234-1abc-efed-0123456789ab");
    EXPECT_TRUE(isGluid(uuid));
    EXPECT_FALSE(isLinked(uuid));
    EXPECT_FALSE(isLinked(uuid, "test"));
    EXPECT_EQ(toInt32(uuid), std::nullopt);
}

TEST(Gluid, CustomEntropyCodec)
{
    GluidSettings settings;
    settings.entropy = 11;
    GluidCodec codec(settings);

    UUID first = codec.encode(1, "test");
    UUID second = codec.encode(2, "test");

    EXPECT_EQ(formatUUID(first), "00000001-869f-11d0-e844-80b1659a2fea");
    EXPECT_EQ(formatUUID(second), "00000002-869f-11d0-e844-80b1659a2fea");
    EXPECT_TRUE(first < second);

    EXPECT_EQ(codec.toInt32(first, "test"), 1);
    EXPECT_EQ(codec.toInt32(first, "blah"), std::nullopt);

    /// The default codec uses the whole window, so it does not recognize the namespace.
    EXPECT_EQ(toInt32(first, "test"), std::nullopt);

    /// Without a namespace there is no mask, the entropy does not matter.
    EXPECT_TRUE(codec.encode(8) == encode(8));
}

TEST(Gluid, ConcurrentUse)
{
    GluidCodec codec;
    std::vector<std::thread> threads;
    std::vector<size_t> failures(4, 0);

    for (size_t t = 0; t < failures.size(); ++t)
    {
        threads.emplace_back([&codec, &failures, t]
        {
            std::string name = "thread" + std::to_string(t);
            for (Int32 value = 0; value < 2000; ++value)
            {
                UUID uuid = codec.encode(value, static_cast<Int32>(t), name);
                if (codec.toInt32(uuid, name) != value || codec.secondInt32(uuid, name) != static_cast<Int32>(t))
                    ++failures[t];
            }
        });
    }

    for (auto & thread : threads)
        thread.join();

    for (size_t count : failures)
        EXPECT_EQ(count, 0);
}
