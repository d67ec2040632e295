// ============================================================================
// Scriptum - KeyMaterial and SecureString Unit Tests
// ============================================================================

#include <gtest/gtest.h>
#include "scriptum/key_material.hpp"

#include <utility>

namespace scriptum::tests {

// ============================================================================
// Fingerprint Tests
// ============================================================================

TEST(KeyMaterialTest, Fingerprint_IsSha256OfNormalizedKey) {
    auto result = KeyMaterial::fingerprint("CLAVE");

    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result, "61455ff103a1fce3983361adbcae447d07fd8ae3dbd905867a6662039550b5c8");
    EXPECT_EQ(result->size(), constants::FINGERPRINT_HEX_LENGTH);
}

TEST(KeyMaterialTest, Fingerprint_IgnoresCase) {
    auto lower = KeyMaterial::fingerprint("clave");
    auto upper = KeyMaterial::fingerprint("CLAVE");

    ASSERT_TRUE(lower.has_value());
    ASSERT_TRUE(upper.has_value());
    EXPECT_EQ(*lower, *upper);
}

TEST(KeyMaterialTest, Fingerprint_DifferentKeysDiffer) {
    auto first = KeyMaterial::fingerprint("CLAVE");
    auto second = KeyMaterial::fingerprint("LLAVE");

    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(second.has_value());
    EXPECT_NE(*first, *second);
}

TEST(KeyMaterialTest, Fingerprint_KeyWithoutLettersReturnsError) {
    auto result = KeyMaterial::fingerprint("1234");

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), ErrorCode::KeyHasNoLetters);
}

TEST(KeyMaterialTest, ShortFingerprint_TruncatesWithEllipsis) {
    auto result = KeyMaterial::short_fingerprint("CLAVE");

    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result, "61455ff103a1fce3...");

    auto full = KeyMaterial::short_fingerprint("CLAVE", 64);
    ASSERT_TRUE(full.has_value());
    EXPECT_EQ(full->size(), constants::FINGERPRINT_HEX_LENGTH);
}

// ============================================================================
// SecureString Tests
// ============================================================================

TEST(SecureStringTest, HoldsValue) {
    SecureString key(std::string("CLAVE"));

    EXPECT_EQ(key.view(), "CLAVE");
    EXPECT_EQ(key.size(), 5u);
    EXPECT_FALSE(key.empty());
}

TEST(SecureStringTest, ClearEmptiesValue) {
    SecureString key(std::string("CLAVE"));
    key.clear();

    EXPECT_TRUE(key.empty());
    EXPECT_EQ(key.view(), "");
}

TEST(SecureStringTest, TakeWipesSource) {
    std::string source = "CLAVE";
    SecureString key = SecureString::take(source);

    EXPECT_EQ(key.view(), "CLAVE");
    EXPECT_TRUE(source.empty());
}

TEST(SecureStringTest, MoveTransfersOwnership) {
    SecureString source(std::string("CLAVE"));
    SecureString target(std::move(source));

    EXPECT_EQ(target.view(), "CLAVE");
    EXPECT_TRUE(source.empty());  // NOLINT(bugprone-use-after-move)

    SecureString assigned;
    assigned = std::move(target);
    EXPECT_EQ(assigned.view(), "CLAVE");
    EXPECT_TRUE(target.empty());  // NOLINT(bugprone-use-after-move)
}

} // namespace scriptum::tests
