// ============================================================================
// Scriptum - KeyExpander Unit Tests
// ============================================================================

#include <gtest/gtest.h>
#include "scriptum/key_expander.hpp"

namespace scriptum::tests {

TEST(KeyExpanderTest, SingleLetterKeyRepeats) {
    auto result = KeyExpander::expand("HOLA", "A");

    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result, "AAAA");
}

TEST(KeyExpanderTest, RepeatsAndTruncates) {
    auto result = KeyExpander::expand("HOLAMUNDO", "AB");

    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result, "ABABABABA");
}

TEST(KeyExpanderTest, ExactMultipleOfKeyLength) {
    auto result = KeyExpander::expand("ATAQUEALAM", "CLAVE");

    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result, "CLAVECLAVE");
}

TEST(KeyExpanderTest, KeyLongerThanText) {
    auto result = KeyExpander::expand("SOL", "CLAVE");

    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result, "CLA");
}

TEST(KeyExpanderTest, EmptyTextGivesEmptyKey) {
    auto result = KeyExpander::expand("", "CLAVE");

    ASSERT_TRUE(result.has_value());
    EXPECT_TRUE(result->empty());
}

TEST(KeyExpanderTest, NormalizesTheKey) {
    auto result = KeyExpander::expand("ABCDEFG", "c-l a");

    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result, "CLACLAC");
}

TEST(KeyExpanderTest, KeyWithoutLettersReturnsError) {
    auto result = KeyExpander::expand("HOLA", "123");

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), ErrorCode::EmptyKey);
}

TEST(KeyExpanderTest, LengthMatchesText) {
    const std::string text(1000, 'X');
    auto result = KeyExpander::expand(text, "VIGENERE");

    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->size(), text.size());
    EXPECT_EQ(result->substr(0, 8), "VIGENERE");
    EXPECT_EQ(result->substr(992), "VIGENERE");
}

} // namespace scriptum::tests
