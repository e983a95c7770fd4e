#include <gtest/gtest.h>

#include <agentd/core/uuid.h>

#include <chrono>
#include <cstddef>
#include <set>
#include <string>

using namespace agentd::core;

namespace {

bool is_ascii_lower_hex(char c) {
    return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f');
}

} // namespace

TEST(UuidTest, HasVersion4Format) {
    auto uuid = generateUUID();
    ASSERT_EQ(uuid.size(), 36u);
    // Check dash positions: 8-4-4-4-12
    EXPECT_EQ(uuid[8], '-');
    EXPECT_EQ(uuid[13], '-');
    EXPECT_EQ(uuid[18], '-');
    EXPECT_EQ(uuid[23], '-');
    EXPECT_EQ(uuid[14], '4');
    char v = uuid[19];
    EXPECT_TRUE(v == '8' || v == '9' || v == 'a' || v == 'b');

    for (std::size_t i = 0; i < uuid.size(); ++i) {
        if (i == 8 || i == 13 || i == 18 || i == 23)
            continue;
        EXPECT_TRUE(is_ascii_lower_hex(uuid[i])) << "position " << i;
    }
}

TEST(UuidTest, ManyUuidsAreUnique) {
    std::set<std::string> seen;
    for (int i = 0; i < 64; ++i) {
        seen.insert(generateUUID());
    }
    EXPECT_EQ(seen.size(), 64u);
}

TEST(UuidTest, FormatsTimestampWithMilliseconds) {
    // 2023-01-01T10:00:00.042Z
    auto tp = std::chrono::system_clock::time_point{std::chrono::seconds(1672567200)} +
              std::chrono::milliseconds(42);
    EXPECT_EQ(formatTimestamp(tp), "2023-01-01T10:00:00.042Z");
}
