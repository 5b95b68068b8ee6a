#include "TestUtil.h"
#include "protocol/ModifierTable.h"
#include <stdlib.h>
#include <unity.h>

void setUp(void) {}
void tearDown(void) {}

static void test_substitutesEveryOccurrence()
{
    std::string out = modifiers::substitute("{lctrl}a{lctrl}b");
    TEST_ASSERT_EQUAL_UINT32(4, out.size());
    TEST_ASSERT_EQUAL_HEX8(0xE0, (uint8_t)out[0]);
    TEST_ASSERT_EQUAL_INT('a', out[1]);
    TEST_ASSERT_EQUAL_HEX8(0xE0, (uint8_t)out[2]);
    TEST_ASSERT_EQUAL_INT('b', out[3]);
}

static void test_knownCodes()
{
    TEST_ASSERT_EQUAL_HEX8(0xE7, (uint8_t)modifiers::substitute("{rgui}")[0]);
    TEST_ASSERT_EQUAL_HEX8(0xD2, (uint8_t)modifiers::substitute("{arrowup}")[0]);
    TEST_ASSERT_EQUAL_HEX8(0xC5, (uint8_t)modifiers::substitute("{f12}")[0]);
    TEST_ASSERT_EQUAL_HEX8(0xBA, (uint8_t)modifiers::substitute("{f1}")[0]);
    TEST_ASSERT_EQUAL_HEX8(0xA8, (uint8_t)modifiers::substitute("{enter}")[0]);
    TEST_ASSERT_EQUAL_HEX8(0xAC, (uint8_t)modifiers::substitute("{space}")[0]);
}

// {f1} is a prefix of {f12} only without the closing brace, so the two never interfere
static void test_f1AndF12AreDistinct()
{
    std::string out = modifiers::substitute("{f12}{f1}");
    TEST_ASSERT_EQUAL_UINT32(2, out.size());
    TEST_ASSERT_EQUAL_HEX8(0xC5, (uint8_t)out[0]);
    TEST_ASSERT_EQUAL_HEX8(0xBA, (uint8_t)out[1]);
}

static void test_unknownTokenPassesThrough()
{
    TEST_ASSERT_EQUAL_STRING("{ctrl}x{F1}", modifiers::substitute("{ctrl}x{F1}").c_str());
    TEST_ASSERT_EQUAL_STRING("plain text", modifiers::substitute("plain text").c_str());
}

// Substituting tokens one at a time in any order gives the same result as the full pass
static void test_orderIndependentForNonOverlappingInput()
{
    const std::string raw = "{lshift}{tab}x{f5}{home}";
    std::string forward = modifiers::substitute(raw);

    std::string backward = raw;
    for (size_t i = modifiers::tokenCount; i-- > 0;) {
        const ModifierToken &t = modifiers::tokenAt(i);
        std::string name(t.name);
        for (size_t pos = backward.find(name); pos != std::string::npos; pos = backward.find(name, pos + 1))
            backward.replace(pos, name.size(), 1, (char)t.code);
    }
    TEST_ASSERT_TRUE(forward == backward);
}

static void test_countModifiers()
{
    TEST_ASSERT_EQUAL_UINT32(0, modifiers::countModifiers("{enter}{f1}abc"));
    TEST_ASSERT_EQUAL_UINT32(1, modifiers::countModifiers("{ralt}x"));
    TEST_ASSERT_EQUAL_UINT32(2, modifiers::countModifiers("{lctrl}{lctrl}{rshift}a"));
    TEST_ASSERT_EQUAL_UINT32(1, modifiers::countModifiers("{lgui}{lgui}{lgui}{lgui}"));
}

static void test_lookups()
{
    const ModifierToken *t = modifiers::findToken("{lgui}");
    TEST_ASSERT_NOT_NULL(t);
    TEST_ASSERT_EQUAL_HEX8(0xE3, t->code);
    TEST_ASSERT_TRUE(t->isModifier);

    t = modifiers::findCode(0xCC);
    TEST_ASSERT_NOT_NULL(t);
    TEST_ASSERT_EQUAL_STRING("{delete}", t->name);
    TEST_ASSERT_FALSE(t->isModifier);

    TEST_ASSERT_NULL(modifiers::findToken("{nope}"));
    TEST_ASSERT_NULL(modifiers::findCode('a'));
}

static void test_describeInvertsSubstitute()
{
    const std::string raw = "{lctrl}{lalt}{delete}";
    TEST_ASSERT_EQUAL_STRING(raw.c_str(), modifiers::describe(modifiers::substitute(raw)).c_str());
}

void setup()
{
    initializeTestEnvironment();
    UNITY_BEGIN();
    RUN_TEST(test_substitutesEveryOccurrence);
    RUN_TEST(test_knownCodes);
    RUN_TEST(test_f1AndF12AreDistinct);
    RUN_TEST(test_unknownTokenPassesThrough);
    RUN_TEST(test_orderIndependentForNonOverlappingInput);
    RUN_TEST(test_countModifiers);
    RUN_TEST(test_lookups);
    RUN_TEST(test_describeInvertsSubstitute);
    exit(UNITY_END());
}

void loop() {}
