#include <unity.h>
#include "session_protocol.h"
#include "test_support.h"

#include <string>
#include <vector>

namespace {

struct SessionFixture {
    MockTransport transport;
    ManualClock clock;
    std::vector<SessionError> errors;
    std::vector<std::pair<float, bool>> controls;
    std::vector<std::string> transcripts;
    std::vector<std::string> replies;
    size_t audio_bytes = 0;
    int audio_chunks = 0;
    // Declared last so it is destroyed before anything its callbacks touch
    SessionProtocol session{transport};

    explicit SessionFixture(int max_reconnect = 3) {
        SessionProtocolConfig cfg;
        cfg.agent_id = "agent_1";
        cfg.endpoint = "wss://voice.example.com/v1/convai/conversation";
        cfg.connection_timeout_ms = 10000;
        cfg.max_reconnect_attempts = max_reconnect;
        cfg.reconnect_delay_ms = 2000;
        cfg.initiation.user_id = "u1";
        session.setTimeSource(clock.source());
        TEST_ASSERT_EQUAL(VOX_OK, session.init(cfg));

        session.setOnError([this](const SessionError& e) { errors.push_back(e); });
        session.setOnPlaybackControl([this](float gain, bool flush) { controls.emplace_back(gain, flush); });
        session.setOnUserTranscript([this](const std::string& t) { transcripts.push_back(t); });
        session.setOnAgentResponse([this](const std::string& t) { replies.push_back(t); });
        session.setOnAudio([this](const uint8_t*, size_t len) {
            audio_chunks++;
            audio_bytes += len;
        });
    }

    void bringUp(const char* conversation_id = "conv_1") {
        TEST_ASSERT_EQUAL(VOX_OK, session.connect());
        transport.acceptConnection();
        transport.completeHandshake(conversation_id);
        TEST_ASSERT_EQUAL(SessionState::Active, session.getState());
    }
};

// 4 bytes of PCM as base64
const char* kAudioMsg = "{\"type\":\"audio\",\"audio_event\":{\"audio_base_64\":\"AAABAA==\"}}";

} // namespace

void test_session_init_requires_agent() {
    MockTransport transport;
    SessionProtocol session(transport);
    SessionProtocolConfig cfg;
    TEST_ASSERT_EQUAL(VOX_ERR_INVALID_ARG, session.init(cfg));
    TEST_ASSERT_EQUAL(VOX_ERR_INVALID_STATE, session.connect());

    cfg.url = "wss://voice.example.com/custom?signed=1";
    TEST_ASSERT_EQUAL(VOX_OK, session.init(cfg));
    TEST_ASSERT_EQUAL_STRING("wss://voice.example.com/custom?signed=1", session.url().c_str());
}

void test_session_url_carries_agent_id() {
    SessionFixture f;
    TEST_ASSERT_EQUAL_STRING("wss://voice.example.com/v1/convai/conversation?agent_id=agent_1",
                             f.session.url().c_str());
    TEST_ASSERT_EQUAL(VOX_OK, f.session.connect());
    TEST_ASSERT_EQUAL(1, f.transport.starts);
    TEST_ASSERT_EQUAL_STRING(f.session.url().c_str(), f.transport.last_uri.c_str());
    TEST_ASSERT_EQUAL(10000, f.transport.last_timeout_ms);
}

void test_session_handshake_reaches_active() {
    std::vector<SessionState> states;
    SessionFixture f;
    f.session.setOnStateChange([&](SessionState, SessionState now) { states.push_back(now); });

    TEST_ASSERT_EQUAL(VOX_OK, f.session.connect());
    TEST_ASSERT_EQUAL(SessionState::Connecting, f.session.getState());

    f.transport.acceptConnection();
    TEST_ASSERT_EQUAL(SessionState::Handshaking, f.session.getState());
    TEST_ASSERT_EQUAL(1, f.transport.countContaining("conversation_initiation_client_data"));
    TEST_ASSERT_EQUAL(1, f.transport.countContaining("\"user_id\":\"u1\""));

    f.transport.completeHandshake("conv_42");
    TEST_ASSERT_TRUE(f.session.isActive());
    TEST_ASSERT_EQUAL_STRING("conv_42", f.session.conversationId().c_str());

    TEST_ASSERT_EQUAL(3, (int)states.size());
    TEST_ASSERT_EQUAL(SessionState::Active, states[2]);
    TEST_ASSERT_EQUAL(0, (int)f.errors.size());
}

void test_session_metadata_without_id_keeps_handshaking() {
    SessionFixture f;
    TEST_ASSERT_EQUAL(VOX_OK, f.session.connect());
    f.transport.acceptConnection();
    f.transport.deliver("{\"type\":\"conversation_initiation_metadata\","
                        "\"conversation_initiation_metadata_event\":{}}");
    TEST_ASSERT_EQUAL(SessionState::Handshaking, f.session.getState());
}

void test_session_ping_answered_with_pong() {
    SessionFixture f;
    f.bringUp();
    const size_t before = f.transport.sentCount();

    f.transport.deliver("{\"type\":\"ping\",\"ping_event\":{\"event_id\":42}}");

    TEST_ASSERT_EQUAL((int)before + 1, (int)f.transport.sentCount());
    std::vector<std::string> pongs = f.transport.sentContaining("pong");
    TEST_ASSERT_EQUAL(1, (int)pongs.size());
    TEST_ASSERT_EQUAL_STRING("{\"type\":\"pong\",\"event_id\":42}", pongs[0].c_str());
}

void test_session_ping_during_handshake_answered() {
    SessionFixture f;
    TEST_ASSERT_EQUAL(VOX_OK, f.session.connect());
    f.transport.acceptConnection();
    f.transport.deliver("{\"type\":\"ping\",\"ping_event\":{\"event_id\":\"p1\"}}");
    TEST_ASSERT_EQUAL(1, f.transport.countContaining("\"event_id\":\"p1\""));
}

void test_session_send_audio_only_when_active() {
    SessionFixture f;
    const uint8_t pcm[4] = {1, 2, 3, 4};

    TEST_ASSERT_EQUAL(VOX_ERR_INVALID_STATE, f.session.sendAudio(pcm, sizeof(pcm)));
    TEST_ASSERT_EQUAL(VOX_OK, f.session.connect());
    f.transport.acceptConnection();
    TEST_ASSERT_EQUAL(VOX_ERR_INVALID_STATE, f.session.sendAudio(pcm, sizeof(pcm)));
    TEST_ASSERT_EQUAL(0, f.transport.countContaining("user_audio_chunk"));

    f.transport.completeHandshake("c");
    TEST_ASSERT_EQUAL(VOX_OK, f.session.sendAudio(pcm, sizeof(pcm)));
    TEST_ASSERT_EQUAL(1, f.transport.countContaining("{\"user_audio_chunk\":\"AQIDBA==\"}"));
    TEST_ASSERT_EQUAL(1, (int)f.session.audioChunksSent());
    TEST_ASSERT_EQUAL(VOX_ERR_INVALID_ARG, f.session.sendAudio(pcm, 0));
}

void test_session_inbound_audio_and_text() {
    SessionFixture f;
    f.transport.deliver(kAudioMsg); // not connected yet
    f.bringUp();

    f.transport.deliver(kAudioMsg);
    f.transport.deliver("{\"type\":\"user_transcript\",\"user_transcript_event\":{\"user_transcript\":\"hello\"}}");
    f.transport.deliver("{\"type\":\"agent_response\",\"agent_response_event\":{\"agent_response\":\"hi there\"}}");
    f.transport.deliver("{\"type\":\"audio\",\"audio_event\":{\"audio_base_64\":\"@@@\"}}");

    TEST_ASSERT_EQUAL(1, f.audio_chunks);
    TEST_ASSERT_EQUAL(4, (int)f.audio_bytes);
    TEST_ASSERT_EQUAL(1, (int)f.session.audioChunksReceived());
    TEST_ASSERT_EQUAL(1, (int)f.transcripts.size());
    TEST_ASSERT_EQUAL_STRING("hello", f.transcripts[0].c_str());
    TEST_ASSERT_EQUAL(1, (int)f.replies.size());
    TEST_ASSERT_EQUAL_STRING("hi there", f.replies[0].c_str());
}

void test_session_ignores_garbage_and_unknown() {
    SessionFixture f;
    f.bringUp();
    const size_t before = f.transport.sentCount();

    f.transport.deliver("}{ not json");
    f.transport.deliver("{\"type\":\"interruption\",\"interruption_event\":{\"event_id\":9}}");
    f.transport.deliver("{\"type\":\"ping\"}");

    TEST_ASSERT_TRUE(f.session.isActive());
    TEST_ASSERT_EQUAL((int)before, (int)f.transport.sentCount());
    TEST_ASSERT_EQUAL(0, (int)f.errors.size());
}

void test_session_barge_in_drops_audio_and_ducks() {
    SessionFixture f;
    f.bringUp();

    f.session.setLocalSpeaking(true);
    TEST_ASSERT_TRUE(f.session.isLocalSpeaking());
    TEST_ASSERT_EQUAL(1, (int)f.controls.size());
    TEST_ASSERT_EQUAL_FLOAT(0.0f, f.controls[0].first);
    TEST_ASSERT_TRUE(f.controls[0].second);

    f.transport.deliver(kAudioMsg);
    f.transport.deliver(kAudioMsg);
    TEST_ASSERT_EQUAL(0, f.audio_chunks);
    TEST_ASSERT_EQUAL(2, (int)f.session.audioChunksDropped());

    f.session.setLocalSpeaking(true); // no change, no callback
    TEST_ASSERT_EQUAL(1, (int)f.controls.size());

    f.session.setLocalSpeaking(false);
    TEST_ASSERT_EQUAL(2, (int)f.controls.size());
    TEST_ASSERT_EQUAL_FLOAT(1.0f, f.controls[1].first);

    f.transport.deliver(kAudioMsg);
    TEST_ASSERT_EQUAL(1, f.audio_chunks);
}

void test_session_connect_timeout_is_fatal() {
    SessionFixture f;
    TEST_ASSERT_EQUAL(VOX_OK, f.session.connect());
    f.clock.advance(9999);
    f.session.tick();
    TEST_ASSERT_EQUAL(SessionState::Connecting, f.session.getState());

    f.clock.advance(1);
    f.session.tick();
    TEST_ASSERT_EQUAL(SessionState::Disconnected, f.session.getState());
    TEST_ASSERT_EQUAL(1, f.transport.stops);
    TEST_ASSERT_EQUAL(1, (int)f.errors.size());
    TEST_ASSERT_EQUAL(VOX_ERR_CONNECTION_TIMEOUT, f.errors[0].code);
    TEST_ASSERT_TRUE(f.errors[0].fatal);

    // No retry for a session that never became active
    f.clock.advance(60000);
    f.session.tick();
    TEST_ASSERT_EQUAL(1, f.transport.starts);
}

void test_session_handshake_timeout() {
    SessionFixture f;
    TEST_ASSERT_EQUAL(VOX_OK, f.session.connect());
    f.transport.acceptConnection();
    f.clock.advance(10000);
    f.session.tick();
    TEST_ASSERT_EQUAL(SessionState::Disconnected, f.session.getState());
    TEST_ASSERT_EQUAL(1, (int)f.errors.size());
    TEST_ASSERT_EQUAL(VOX_ERR_CONNECTION_TIMEOUT, f.errors[0].code);
}

void test_session_refused_before_active_is_fatal() {
    SessionFixture f;
    TEST_ASSERT_EQUAL(VOX_OK, f.session.connect());
    f.transport.dropLink("connection refused");
    TEST_ASSERT_EQUAL(SessionState::Disconnected, f.session.getState());
    TEST_ASSERT_EQUAL(1, (int)f.errors.size());
    TEST_ASSERT_EQUAL(VOX_ERR_CONNECTION, f.errors[0].code);
    TEST_ASSERT_TRUE(f.errors[0].fatal);
    TEST_ASSERT_EQUAL_STRING("connection refused", f.errors[0].message.c_str());
    TEST_ASSERT_FALSE(f.session.reconnectPending());
}

void test_session_reconnects_after_link_loss() {
    SessionFixture f;
    f.bringUp("first");
    f.transport.dropLink();

    TEST_ASSERT_EQUAL(SessionState::Disconnected, f.session.getState());
    TEST_ASSERT_EQUAL(1, (int)f.errors.size());
    TEST_ASSERT_FALSE(f.errors[0].fatal);
    TEST_ASSERT_TRUE(f.session.reconnectPending());
    TEST_ASSERT_EQUAL(1, f.session.reconnectAttempts());

    f.clock.advance(1999);
    f.session.tick();
    TEST_ASSERT_EQUAL(1, f.transport.starts);

    f.clock.advance(1);
    f.session.tick();
    TEST_ASSERT_EQUAL(2, f.transport.starts);
    f.transport.acceptConnection();
    f.transport.completeHandshake("second");

    TEST_ASSERT_TRUE(f.session.isActive());
    TEST_ASSERT_EQUAL_STRING("second", f.session.conversationId().c_str());
    TEST_ASSERT_EQUAL(0, f.session.reconnectAttempts());
    TEST_ASSERT_EQUAL(2, f.transport.countContaining("conversation_initiation_client_data"));
}

void test_session_reconnect_gives_up_after_limit() {
    SessionFixture f(3);
    f.bringUp();
    f.transport.dropLink();

    for (int i = 0; i < 3; i++) {
        f.clock.advance(2000);
        f.session.tick();
        TEST_ASSERT_EQUAL(SessionState::Connecting, f.session.getState());
        f.transport.dropLink("refused");
    }

    TEST_ASSERT_EQUAL(4, f.transport.starts);
    TEST_ASSERT_FALSE(f.session.reconnectPending());
    TEST_ASSERT_EQUAL(SessionState::Disconnected, f.session.getState());

    const SessionError& last = f.errors.back();
    TEST_ASSERT_TRUE(last.fatal);
    TEST_ASSERT_EQUAL(VOX_ERR_CONNECTION, last.code);
    TEST_ASSERT_TRUE(last.message.find("after 3 attempts") != std::string::npos);

    f.clock.advance(10000);
    f.session.tick();
    TEST_ASSERT_EQUAL(4, f.transport.starts);
}

void test_session_transport_start_failure_counts_as_attempt() {
    SessionFixture f(1);
    f.bringUp();
    f.transport.start_result = VOX_ERR_CONNECTION;
    f.transport.serverClose();

    f.clock.advance(2000);
    f.session.tick();
    TEST_ASSERT_EQUAL(2, f.transport.starts);
    TEST_ASSERT_EQUAL(SessionState::Disconnected, f.session.getState());
    TEST_ASSERT_TRUE(f.errors.back().fatal);
}

void test_session_no_reconnect_when_limit_zero() {
    SessionFixture f(0);
    f.bringUp();
    f.transport.dropLink();
    TEST_ASSERT_EQUAL(1, (int)f.errors.size());
    TEST_ASSERT_TRUE(f.errors[0].fatal);
    TEST_ASSERT_EQUAL(VOX_ERR_CONNECTION, f.errors[0].code);
    TEST_ASSERT_FALSE(f.session.reconnectPending());
}

void test_session_disconnect_is_idempotent() {
    SessionFixture f;
    f.bringUp();

    f.session.disconnect();
    TEST_ASSERT_EQUAL(SessionState::Disconnected, f.session.getState());
    TEST_ASSERT_EQUAL_STRING("", f.session.conversationId().c_str());
    f.session.disconnect();
    f.session.disconnect();
    TEST_ASSERT_EQUAL(SessionState::Disconnected, f.session.getState());
    TEST_ASSERT_EQUAL(0, (int)f.errors.size());

    // A late link-down after a user disconnect does not schedule anything
    f.transport.dropLink();
    f.clock.advance(5000);
    f.session.tick();
    TEST_ASSERT_EQUAL(1, f.transport.starts);
    TEST_ASSERT_EQUAL(0, (int)f.errors.size());

    // And the session can be started again
    TEST_ASSERT_EQUAL(VOX_OK, f.session.connect());
    TEST_ASSERT_EQUAL(2, f.transport.starts);
}

void test_session_user_message_requires_active() {
    SessionFixture f;
    TEST_ASSERT_EQUAL(VOX_ERR_INVALID_STATE, f.session.sendUserMessage("hi"));
    f.bringUp();
    TEST_ASSERT_EQUAL(VOX_ERR_INVALID_ARG, f.session.sendUserMessage(""));
    TEST_ASSERT_EQUAL(VOX_OK, f.session.sendUserMessage("what's the weather"));
    TEST_ASSERT_EQUAL(1, f.transport.countContaining("\"type\":\"user_message\""));
}

void run_session_protocol_tests() {
    RUN_TEST(test_session_init_requires_agent);
    RUN_TEST(test_session_url_carries_agent_id);
    RUN_TEST(test_session_handshake_reaches_active);
    RUN_TEST(test_session_metadata_without_id_keeps_handshaking);
    RUN_TEST(test_session_ping_answered_with_pong);
    RUN_TEST(test_session_ping_during_handshake_answered);
    RUN_TEST(test_session_send_audio_only_when_active);
    RUN_TEST(test_session_inbound_audio_and_text);
    RUN_TEST(test_session_ignores_garbage_and_unknown);
    RUN_TEST(test_session_barge_in_drops_audio_and_ducks);
    RUN_TEST(test_session_connect_timeout_is_fatal);
    RUN_TEST(test_session_handshake_timeout);
    RUN_TEST(test_session_refused_before_active_is_fatal);
    RUN_TEST(test_session_reconnects_after_link_loss);
    RUN_TEST(test_session_reconnect_gives_up_after_limit);
    RUN_TEST(test_session_transport_start_failure_counts_as_attempt);
    RUN_TEST(test_session_no_reconnect_when_limit_zero);
    RUN_TEST(test_session_disconnect_is_idempotent);
    RUN_TEST(test_session_user_message_requires_active);
}
