#include "TestUtil.h"
#include "protocol/ResponseParser.h"
#include <stdlib.h>
#include <unity.h>
#include <vector>

class BannerSink
{
  public:
    std::vector<int32_t> versions;

    CallbackObserver<BannerSink, const DeviceBanner *> observer =
        CallbackObserver<BannerSink, const DeviceBanner *>(this, &BannerSink::onBanner);

    int onBanner(const DeviceBanner *b)
    {
        if (b->kind == BannerKind::VERSION)
            versions.push_back(b->value);
        return 0;
    }
};

static ResponseParser *parser;
static BannerSink *sink;

void setUp(void)
{
    parser = new ResponseParser();
    sink = new BannerSink();
    sink->observer.observe(&parser->onBanner);
}

void tearDown(void)
{
    delete sink;
    delete parser;
}

static void test_markerThenNumberInNextChunk()
{
    TEST_ASSERT_FALSE(parser->feed("APP-VER="));
    TEST_ASSERT_EQUAL_UINT32(8, parser->pending());
    TEST_ASSERT_TRUE(parser->feed("5"));
    TEST_ASSERT_EQUAL_UINT32(1, sink->versions.size());
    TEST_ASSERT_EQUAL_INT32(5, sink->versions[0]);
    TEST_ASSERT_EQUAL_UINT32(0, parser->pending());
}

static void test_leadingGarbageIsSkipped()
{
    TEST_ASSERT_FALSE(parser->feed("garbage"));
    TEST_ASSERT_TRUE(parser->feed("APP-VER=12"));
    TEST_ASSERT_EQUAL_UINT32(1, sink->versions.size());
    TEST_ASSERT_EQUAL_INT32(12, sink->versions[0]);
    TEST_ASSERT_EQUAL_UINT32(0, parser->pending());
}

static void test_trailingTextIsIgnored()
{
    TEST_ASSERT_TRUE(parser->feed("boot ok\r\nAPP-VER=103\r\nready"));
    TEST_ASSERT_EQUAL_INT32(103, sink->versions[0]);
}

static void test_markerSplitAcrossChunks()
{
    TEST_ASSERT_FALSE(parser->feed("APP-"));
    TEST_ASSERT_TRUE(parser->feed("VER=3"));
    TEST_ASSERT_EQUAL_INT32(3, sink->versions[0]);
}

static void test_waitsWhileNothingFollowsMarker()
{
    TEST_ASSERT_FALSE(parser->feed("log: APP-VER="));
    TEST_ASSERT_EQUAL_UINT32(0, sink->versions.size());
    TEST_ASSERT_EQUAL_UINT32(13, parser->pending());
    TEST_ASSERT_TRUE(parser->feed("42"));
    TEST_ASSERT_EQUAL_INT32(42, sink->versions[0]);
}

static void test_malformedBannerIsDropped()
{
    TEST_ASSERT_FALSE(parser->feed("APP-VER=abc"));
    TEST_ASSERT_EQUAL_UINT32(0, sink->versions.size());
    TEST_ASSERT_EQUAL_UINT32(0, parser->pending());

    // And the parser is usable afterwards
    TEST_ASSERT_TRUE(parser->feed("APP-VER=9"));
    TEST_ASSERT_EQUAL_INT32(9, sink->versions[0]);
}

static void test_textWithoutMarkerIsRetained()
{
    TEST_ASSERT_FALSE(parser->feed("hello device"));
    TEST_ASSERT_EQUAL_UINT32(12, parser->pending());
}

static void test_trimToKeepsTail()
{
    parser->feed(std::string(100, 'x') + "APP-VE");
    parser->trimTo(ResponseParser::maxMarkerLength());
    TEST_ASSERT_EQUAL_UINT32(8, parser->pending());

    // The partial marker survived the trim
    TEST_ASSERT_TRUE(parser->feed("R=21"));
    TEST_ASSERT_EQUAL_INT32(21, sink->versions[0]);
}

static void test_oneBannerPerFeed()
{
    TEST_ASSERT_TRUE(parser->feed("APP-VER=1 APP-VER=2"));
    TEST_ASSERT_EQUAL_UINT32(1, sink->versions.size());
    TEST_ASSERT_EQUAL_INT32(1, sink->versions[0]);
    TEST_ASSERT_EQUAL_UINT32(0, parser->pending());
}

void setup()
{
    initializeTestEnvironment();
    UNITY_BEGIN();
    RUN_TEST(test_markerThenNumberInNextChunk);
    RUN_TEST(test_leadingGarbageIsSkipped);
    RUN_TEST(test_trailingTextIsIgnored);
    RUN_TEST(test_markerSplitAcrossChunks);
    RUN_TEST(test_waitsWhileNothingFollowsMarker);
    RUN_TEST(test_malformedBannerIsDropped);
    RUN_TEST(test_textWithoutMarkerIsRetained);
    RUN_TEST(test_trimToKeepsTail);
    RUN_TEST(test_oneBannerPerFeed);
    exit(UNITY_END());
}

void loop() {}
