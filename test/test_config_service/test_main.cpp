#include "ConfigService.h"
#include "MockTransport.h"
#include "TestUtil.h"
#include <stdlib.h>
#include <unity.h>

static MockTransport *mock;
static ConnectionManager *conn;
static ConfigService *service;

static std::string frame(const char *bytes, size_t len)
{
    return std::string(bytes, len);
}

void setUp(void)
{
    clearErrors();
    mock = new MockTransport();
    conn = new ConnectionManager(std::unique_ptr<Transport>(mock));
    TEST_ASSERT_TRUE(ErrorCode::NONE == conn->connect());
    mock->writes.clear(); // drop the version query
    service = new ConfigService(*conn);
}

void tearDown(void)
{
    delete service;
    delete conn;
}

static void test_profileDefaultsToZero()
{
    TEST_ASSERT_EQUAL_INT('0', service->getProfile());
}

static void test_selectProfile()
{
    TEST_ASSERT_TRUE(ErrorCode::NONE == service->selectProfile('3'));
    TEST_ASSERT_EQUAL_INT('3', service->getProfile());

    TEST_ASSERT_TRUE(ErrorCode::VALIDATION == service->selectProfile('5'));
    TEST_ASSERT_EQUAL_INT('3', service->getProfile());
    TEST_ASSERT_EQUAL_STRING("profile must be 0-4", service->lastReason());
}

static void test_bindMacroUsesCurrentProfile()
{
    service->selectProfile('1');
    TEST_ASSERT_TRUE(ErrorCode::NONE == service->bindMacro(1, "hello"));
    TEST_ASSERT_EQUAL_UINT32(1, mock->writes.size());
    TEST_ASSERT_TRUE(frame("ebf\x0b"
                           "01.1:0hello",
                           15) == mock->writes[0]);
    TEST_ASSERT_NULL(service->lastReason());
}

static void test_invalidMacroSendsNothing()
{
    TEST_ASSERT_TRUE(ErrorCode::VALIDATION == service->bindMacro(1, "{lctrl}abcdefg"));
    TEST_ASSERT_EQUAL_UINT32(0, mock->writes.size());
    TEST_ASSERT_EQUAL_STRING("only 6 keys allowed when using a key modifier, such as {lctrl}", service->lastReason());
    TEST_ASSERT_TRUE(ErrorCode::VALIDATION == getLastError());
}

static void test_keyOutOfRangeSendsNothing()
{
    TEST_ASSERT_TRUE(ErrorCode::VALIDATION == service->bindMacro(9, "x"));
    TEST_ASSERT_TRUE(ErrorCode::VALIDATION == service->removeAlias(0));
    TEST_ASSERT_EQUAL_UINT32(0, mock->writes.size());
    TEST_ASSERT_EQUAL_STRING("key must be 1-8", service->lastReason());
}

static void test_aliasAndScriptRemoval()
{
    service->selectProfile('2');
    TEST_ASSERT_TRUE(ErrorCode::NONE == service->removeAlias(3));
    TEST_ASSERT_TRUE(ErrorCode::NONE == service->removeScript(3));
    TEST_ASSERT_TRUE(frame("ebf\x05"
                           "32.3:",
                           9) == mock->writes[0]);
    TEST_ASSERT_TRUE(frame("ebf\x05"
                           "72.3:",
                           9) == mock->writes[1]);
}

static void test_oversizedAliasIsRefused()
{
    TEST_ASSERT_TRUE(ErrorCode::FRAME_TOO_LONG == service->setAlias(1, std::string(300, 'a')));
    TEST_ASSERT_EQUAL_UINT32(0, mock->writes.size());
    TEST_ASSERT_NOT_NULL(service->lastReason());
}

static void test_saveKeyConfigSendsThreeFrames()
{
    const std::string alias = "copy";
    TEST_ASSERT_TRUE(ErrorCode::NONE == service->saveKeyConfig(4, "{lctrl}c", &alias, NULL));
    TEST_ASSERT_EQUAL_UINT32(3, mock->writes.size());
    TEST_ASSERT_EQUAL_INT('0', mock->writes[0][4]);
    TEST_ASSERT_TRUE(frame("ebf\x09"
                           "20.4:copy",
                           13) == mock->writes[1]);
    TEST_ASSERT_TRUE(frame("ebf\x05"
                           "70.4:",
                           9) == mock->writes[2]);
}

// One bad part and none of the frames go out
static void test_saveKeyConfigIsAllOrNothing()
{
    const std::string script(300, 's');
    TEST_ASSERT_TRUE(ErrorCode::FRAME_TOO_LONG == service->saveKeyConfig(1, "ok", NULL, &script));
    TEST_ASSERT_EQUAL_UINT32(0, mock->writes.size());
}

static void test_led()
{
    TEST_ASSERT_TRUE(ErrorCode::NONE == service->setLed("#00ff7f", 100));
    TEST_ASSERT_TRUE(frame("ebf\x0a"
                           "100ff7f100",
                           14) == mock->writes[0]);
    TEST_ASSERT_TRUE(ErrorCode::VALIDATION == service->setLed("green", 100));
    TEST_ASSERT_TRUE(ErrorCode::VALIDATION == service->setLed("#00ff7f", -1));
    TEST_ASSERT_EQUAL_UINT32(1, mock->writes.size());
}

static void test_wifi()
{
    TEST_ASSERT_TRUE(ErrorCode::NONE == service->setWifi("lab", "hunter22"));
    TEST_ASSERT_TRUE(frame("ebf\x0d"
                           "4lab.hunter22",
                           17) == mock->writes[0]);
    TEST_ASSERT_TRUE(ErrorCode::VALIDATION == service->setWifi("", "x"));
}

static void test_queryVersion()
{
    TEST_ASSERT_TRUE(ErrorCode::NONE == service->queryVersion());
    TEST_ASSERT_TRUE(frame("ebf\x01"
                           "5",
                           5) == mock->writes[0]);
}

static void test_notConnectedIsReported()
{
    conn->disconnect();
    conn->runOnce();
    TEST_ASSERT_TRUE(ErrorCode::NOT_CONNECTED == service->bindMacro(1, "x"));
    TEST_ASSERT_EQUAL_UINT32(0, mock->writes.size());
}

void setup()
{
    initializeTestEnvironment();
    UNITY_BEGIN();
    RUN_TEST(test_profileDefaultsToZero);
    RUN_TEST(test_selectProfile);
    RUN_TEST(test_bindMacroUsesCurrentProfile);
    RUN_TEST(test_invalidMacroSendsNothing);
    RUN_TEST(test_keyOutOfRangeSendsNothing);
    RUN_TEST(test_aliasAndScriptRemoval);
    RUN_TEST(test_oversizedAliasIsRefused);
    RUN_TEST(test_saveKeyConfigSendsThreeFrames);
    RUN_TEST(test_saveKeyConfigIsAllOrNothing);
    RUN_TEST(test_led);
    RUN_TEST(test_wifi);
    RUN_TEST(test_queryVersion);
    RUN_TEST(test_notConnectedIsReported);
    exit(UNITY_END());
}

void loop() {}
