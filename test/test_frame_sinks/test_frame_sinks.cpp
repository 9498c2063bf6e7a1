/**
 * @file test_frame_sinks.cpp
 * @brief Unit tests for the output sinks and their wire formats
 *
 * Covers DRGB datagram layout (including a loopback send), the WLED JSON
 * state body, the HTTP retry policy and the terminal simulator output.
 */

#include <unity.h>
#include <ArduinoJson.h>
#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>
#include <cstdio>
#include <cstring>
#include <deque>
#include <string>
#include <vector>
#include "../../src/network/DrgbFrameEncoder.h"
#include "../../src/network/HttpJsonSink.h"
#include "../../src/network/UdpDrgbSink.h"
#include "../../src/network/WledStateCodec.h"
#include "../../src/sim/TerminalSimulatorSink.h"
#include "../../src/utils/Log.h"

using namespace lumibeacon::core;
using namespace lumibeacon::network;
using lumibeacon::sim::TerminalSimulatorSink;

// ============================================================================
// Helper Functions
// ============================================================================

static std::vector<std::string> s_logLines;

static void captureWarnings() {
    lumibeacon::logging::setLogLevel(LB_LOG_LEVEL_WARN);
    lumibeacon::logging::setLogCallback([](const char* line) { s_logLines.push_back(line); });
}

static PixelBuffer threePixels() {
    PixelBuffer frame = makeBlankFrame(3);
    frame[0] = CRGB(255, 0, 0);
    frame[1] = CRGB(0, 128, 0);
    frame[2] = CRGB(1, 2, 3);
    return frame;
}

/**
 * @brief HTTP sink with scripted transport outcomes
 */
class ScriptedHttpSink : public HttpJsonSink {
public:
    explicit ScriptedHttpSink(const HttpSinkSettings& settings) : HttpJsonSink(settings) {}

    std::deque<HttpAttempt> script;
    std::vector<std::string> bodies;
    std::vector<uint32_t> backoffs;

protected:
    HttpAttempt performRequest(const std::string& url, const std::string& body) override {
        (void)url;
        bodies.push_back(body);
        if (script.empty()) {
            HttpAttempt ok;
            ok.result = HttpAttemptResult::OK;
            ok.statusCode = 200;
            return ok;
        }
        HttpAttempt next = script.front();
        script.pop_front();
        return next;
    }

    void backoff(uint32_t delayMs) override {
        backoffs.push_back(delayMs);
    }
};

static HttpAttempt attempt(HttpAttemptResult result, long status = 0) {
    HttpAttempt a;
    a.result = result;
    a.statusCode = status;
    a.error = result == HttpAttemptResult::OK ? "" : "Timeout was reached";
    return a;
}

// ============================================================================
// Test: DRGB Encoding
// ============================================================================

void test_drgb_layout() {
    std::vector<uint8_t> datagram = DrgbFrameEncoder::encode(threePixels());

    const uint8_t expected[] = {'D', 'R', 'G', 'B', 255, 0, 0, 0, 128, 0, 1, 2, 3};
    TEST_ASSERT_EQUAL_UINT32(sizeof(expected), datagram.size());
    TEST_ASSERT_EQUAL_UINT8_ARRAY(expected, datagram.data(), sizeof(expected));
    TEST_ASSERT_TRUE(DrgbFrameEncoder::validate(datagram.data(), datagram.size()));
}

void test_drgb_rejects_small_buffer() {
    PixelBuffer frame = threePixels();
    uint8_t out[8];
    TEST_ASSERT_EQUAL_UINT32(0, DrgbFrameEncoder::encode(frame.data(), frame.size(), out, sizeof(out)));
}

void test_drgb_validate_rejects_bad_header() {
    const uint8_t bad[] = {'D', 'R', 'G', 'X', 1, 2, 3};
    const uint8_t partial[] = {'D', 'R', 'G', 'B', 1, 2};
    TEST_ASSERT_FALSE(DrgbFrameEncoder::validate(bad, sizeof(bad)));
    TEST_ASSERT_FALSE(DrgbFrameEncoder::validate(partial, sizeof(partial)));
}

void test_udp_sink_sends_one_datagram_per_frame() {
    int receiver = socket(AF_INET, SOCK_DGRAM, 0);
    TEST_ASSERT_TRUE(receiver >= 0);

    struct sockaddr_in addr;
    memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    addr.sin_port = 0;
    TEST_ASSERT_EQUAL_INT(0, bind(receiver, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)));

    socklen_t len = sizeof(addr);
    TEST_ASSERT_EQUAL_INT(0, getsockname(receiver, reinterpret_cast<struct sockaddr*>(&addr), &len));
    struct timeval timeout = {2, 0};
    setsockopt(receiver, SOL_SOCKET, SO_RCVTIMEO, &timeout, sizeof(timeout));

    UdpDrgbSink sink("127.0.0.1", ntohs(addr.sin_port));
    TEST_ASSERT_TRUE(sink.begin());
    sink.update(threePixels());

    uint8_t buffer[64];
    ssize_t received = recv(receiver, buffer, sizeof(buffer), 0);
    close(receiver);

    TEST_ASSERT_EQUAL_INT(13, received);
    TEST_ASSERT_EQUAL_MEMORY("DRGB", buffer, 4);
    TEST_ASSERT_EQUAL_UINT8(128, buffer[8]);
    TEST_ASSERT_EQUAL_UINT32(1, sink.getStats().success);
}

void test_udp_sink_unstarted_swallows_frames() {
    UdpDrgbSink sink("127.0.0.1", 21324);
    sink.update(threePixels());
    TEST_ASSERT_EQUAL_UINT32(0, sink.getStats().attempts);
    TEST_ASSERT_EQUAL_UINT32(1, sink.getStats().dropped);
}

void test_udp_sink_first_unstarted_drop_is_logged() {
    captureWarnings();
    UdpDrgbSink sink("127.0.0.1", 21324);

    sink.update(threePixels());
    sink.update(threePixels());
    sink.update(threePixels());

    TEST_ASSERT_EQUAL_UINT32(3, sink.getStats().dropped);
    TEST_ASSERT_EQUAL_UINT32_MESSAGE(1, s_logLines.size(), "First drop logged, repeats throttled");
    TEST_ASSERT_NOT_NULL(strstr(s_logLines[0].c_str(), "not started"));
}

// ============================================================================
// Test: WLED JSON State
// ============================================================================

void test_wled_state_body() {
    JsonDocument doc;
    JsonObject obj = doc.to<JsonObject>();
    WledStateCodec::encodeState(threePixels(), obj);

    TEST_ASSERT_TRUE(obj["on"].as<bool>());
    JsonArray seg = obj["seg"].as<JsonArray>();
    TEST_ASSERT_EQUAL_UINT32(1, seg.size());
    TEST_ASSERT_EQUAL_INT(0, seg[0]["id"].as<int>());

    JsonArray pixels = seg[0]["i"].as<JsonArray>();
    TEST_ASSERT_EQUAL_UINT32(3, pixels.size());
    TEST_ASSERT_EQUAL_INT(255, pixels[0][0].as<int>());
    TEST_ASSERT_EQUAL_INT(128, pixels[1][1].as<int>());
    TEST_ASSERT_EQUAL_INT(3, pixels[2][2].as<int>());
}

void test_wled_state_serialized() {
    PixelBuffer frame = makeBlankFrame(2);
    frame[1] = CRGB(4, 5, 6);
    TEST_ASSERT_EQUAL_STRING(R"({"on":true,"seg":[{"id":0,"i":[[0,0,0],[4,5,6]]}]})",
                             WledStateCodec::serializeState(frame).c_str());
}

void test_wled_state_url() {
    TEST_ASSERT_EQUAL_STRING("http://wled.local/json/state", WledStateCodec::stateUrl("wled.local").c_str());
}

// ============================================================================
// Test: HTTP Retry Policy
// ============================================================================

void test_http_success_first_attempt() {
    ScriptedHttpSink sink(HttpSinkSettings{});
    sink.update(threePixels());

    HttpJsonSink::HttpStats stats = sink.getStats();
    TEST_ASSERT_EQUAL_UINT32(1, stats.attempts);
    TEST_ASSERT_EQUAL_UINT32(1, stats.framesDelivered);
    TEST_ASSERT_EQUAL_UINT32(0, sink.backoffs.size());
}

void test_http_retries_timeouts_then_succeeds() {
    ScriptedHttpSink sink(HttpSinkSettings{});
    sink.script.push_back(attempt(HttpAttemptResult::RETRYABLE));
    sink.script.push_back(attempt(HttpAttemptResult::OK, 200));

    sink.update(threePixels());

    HttpJsonSink::HttpStats stats = sink.getStats();
    TEST_ASSERT_EQUAL_UINT32(2, stats.attempts);
    TEST_ASSERT_EQUAL_UINT32(1, stats.retries);
    TEST_ASSERT_EQUAL_UINT32(1, stats.framesDelivered);
    TEST_ASSERT_EQUAL_UINT32(1, sink.backoffs.size());
    TEST_ASSERT_EQUAL_UINT32(50, sink.backoffs[0]);
    TEST_ASSERT_EQUAL_STRING(sink.bodies[0].c_str(), sink.bodies[1].c_str());
}

void test_http_drops_frame_after_exhausting_attempts() {
    HttpSinkSettings settings;
    settings.maxAttempts = 3;
    ScriptedHttpSink sink(settings);
    for (int i = 0; i < 3; i++) {
        sink.script.push_back(attempt(HttpAttemptResult::RETRYABLE));
    }

    sink.update(threePixels());

    HttpJsonSink::HttpStats stats = sink.getStats();
    TEST_ASSERT_EQUAL_UINT32(3, stats.attempts);
    TEST_ASSERT_EQUAL_UINT32(1, stats.framesDropped);
    TEST_ASSERT_EQUAL_UINT32(0, stats.framesDelivered);
    TEST_ASSERT_EQUAL_UINT32_MESSAGE(2, sink.backoffs.size(), "No backoff after the final attempt");

    // Next frame is attempted normally
    sink.update(threePixels());
    TEST_ASSERT_EQUAL_UINT32(1, sink.getStats().framesDelivered);
}

void test_http_fatal_error_not_retried() {
    ScriptedHttpSink sink(HttpSinkSettings{});
    sink.script.push_back(attempt(HttpAttemptResult::FATAL));

    sink.update(threePixels());

    TEST_ASSERT_EQUAL_UINT32(1, sink.getStats().attempts);
    TEST_ASSERT_EQUAL_UINT32(1, sink.getStats().framesDropped);
}

void test_http_error_status_counts_as_delivered() {
    ScriptedHttpSink sink(HttpSinkSettings{});
    sink.script.push_back(attempt(HttpAttemptResult::OK, 500));

    sink.update(threePixels());

    HttpJsonSink::HttpStats stats = sink.getStats();
    TEST_ASSERT_EQUAL_UINT32(1, stats.attempts);
    TEST_ASSERT_EQUAL_UINT32(1, stats.httpErrors);
    TEST_ASSERT_EQUAL_INT32(500, stats.lastStatusCode);
}

void test_http_sink_rejects_out_of_range_timeout() {
    HttpSinkSettings settings;
    settings.timeoutSeconds = 1e9;
    HttpJsonSink huge(settings);
    TEST_ASSERT_FALSE(huge.begin());

    settings.timeoutSeconds = 0.0;
    HttpJsonSink zero(settings);
    TEST_ASSERT_FALSE(zero.begin());

    // Refused sinks stay unstarted and drop frames
    huge.update(threePixels());
    TEST_ASSERT_EQUAL_UINT32(1, huge.getStats().framesDropped);
}

void test_http_unstarted_sink_drops_without_retry() {
    HttpJsonSink sink(HttpSinkSettings{});
    sink.update(threePixels());
    TEST_ASSERT_EQUAL_UINT32(1, sink.getStats().framesDropped);
    TEST_ASSERT_EQUAL_UINT32(1, sink.getStats().attempts);
}

// ============================================================================
// Test: Terminal Simulator
// ============================================================================

void test_simulator_rejects_mismatched_grid() {
    TerminalSimulatorSink sink(60, 10, 5, nullptr);
    TEST_ASSERT_FALSE(sink.begin());

    TerminalSimulatorSink ok(60, 10, 6, stdout);
    TEST_ASSERT_TRUE(ok.begin());
}

void test_simulator_renders_grid() {
    TerminalSimulatorSink sink(4, 2, 2, nullptr);
    PixelBuffer frame = makeBlankFrame(4);
    frame[3] = CRGB(10, 20, 30);

    const std::string text = sink.renderToString(frame);

    TEST_ASSERT_EQUAL_INT(0, text.find("\033[H\033[J"));
    TEST_ASSERT_TRUE(text.find("LED Strip Simulator") != std::string::npos);
    TEST_ASSERT_TRUE(text.find("==========\n") != std::string::npos);
    TEST_ASSERT_TRUE(text.find("\033[38;2;10;20;30m") != std::string::npos);
    TEST_ASSERT_TRUE(text.find("Average brightness: 5.0/255") != std::string::npos);
}

void test_simulator_average_brightness_uses_integer_division() {
    PixelBuffer frame = makeBlankFrame(2);
    frame[0] = CRGB(1, 1, 0);       // (2) / 3 = 0
    frame[1] = CRGB(255, 255, 255); // 255
    TEST_ASSERT_DOUBLE_WITHIN(1e-9, 127.5, TerminalSimulatorSink::averageBrightness(frame));
}

void test_simulator_writes_and_snapshots() {
    FILE* out = tmpfile();
    TEST_ASSERT_NOT_NULL(out);

    TerminalSimulatorSink sink(2, 1, 2, out);
    TEST_ASSERT_TRUE(sink.begin());

    PixelBuffer frame = makeBlankFrame(2);
    frame[0] = CRGB(7, 8, 9);
    sink.update(frame);

    PixelBuffer snap = sink.snapshot();
    TEST_ASSERT_EQUAL_UINT8(7, snap[0].r);
    TEST_ASSERT_EQUAL_UINT8(9, snap[0].b);

    TEST_ASSERT_TRUE(ftell(out) > 0);
    fclose(out);
}

// ============================================================================
// Unity setUp/tearDown
// ============================================================================

void setUp(void) {
    s_logLines.clear();
    lumibeacon::logging::setLogLevel(LB_LOG_LEVEL_NONE);
}

void tearDown(void) {
    lumibeacon::logging::clearLogCallback();
    lumibeacon::logging::setLogLevel(LB_LOG_LEVEL_INFO);
}

// ============================================================================
// Test Runner
// ============================================================================

int main() {
    UNITY_BEGIN();

    RUN_TEST(test_drgb_layout);
    RUN_TEST(test_drgb_rejects_small_buffer);
    RUN_TEST(test_drgb_validate_rejects_bad_header);
    RUN_TEST(test_udp_sink_sends_one_datagram_per_frame);
    RUN_TEST(test_udp_sink_unstarted_swallows_frames);
    RUN_TEST(test_udp_sink_first_unstarted_drop_is_logged);

    RUN_TEST(test_wled_state_body);
    RUN_TEST(test_wled_state_serialized);
    RUN_TEST(test_wled_state_url);

    RUN_TEST(test_http_success_first_attempt);
    RUN_TEST(test_http_retries_timeouts_then_succeeds);
    RUN_TEST(test_http_drops_frame_after_exhausting_attempts);
    RUN_TEST(test_http_fatal_error_not_retried);
    RUN_TEST(test_http_error_status_counts_as_delivered);
    RUN_TEST(test_http_sink_rejects_out_of_range_timeout);
    RUN_TEST(test_http_unstarted_sink_drops_without_retry);

    RUN_TEST(test_simulator_rejects_mismatched_grid);
    RUN_TEST(test_simulator_renders_grid);
    RUN_TEST(test_simulator_average_brightness_uses_integer_division);
    RUN_TEST(test_simulator_writes_and_snapshots);

    return UNITY_END();
}
