#include <unity.h>
#include "cJSON.h"
#include "session_messages.h"
#include "session_state_machine.h"

#include <cstring>
#include <string>
#include <vector>

namespace {

InboundMessage parse(const char* json, vox_err_t expected = VOX_OK) {
    InboundMessage msg;
    TEST_ASSERT_EQUAL(expected, parseInboundMessage(json, strlen(json), msg));
    return msg;
}

} // namespace

//==============================================================================
// Inbound
//==============================================================================

void test_messages_parse_ping_keeps_id_type() {
    InboundMessage msg = parse("{\"type\":\"ping\",\"ping_event\":{\"event_id\":42,\"ping_ms\":30}}");
    TEST_ASSERT_EQUAL(InboundType::Ping, msg.type);
    TEST_ASSERT_EQUAL_STRING("42", msg.event_id_json.c_str());

    msg = parse("{\"type\":\"ping\",\"ping_event\":{\"event_id\":\"e-7\"}}");
    TEST_ASSERT_EQUAL_STRING("\"e-7\"", msg.event_id_json.c_str());

    parse("{\"type\":\"ping\",\"ping_event\":{}}", VOX_ERR_PROTOCOL);
}

void test_messages_parse_metadata_and_audio() {
    InboundMessage msg = parse(
        "{\"type\":\"conversation_initiation_metadata\","
        "\"conversation_initiation_metadata_event\":{\"conversation_id\":\"conv_1\","
        "\"agent_output_audio_format\":\"pcm_16000\"}}");
    TEST_ASSERT_EQUAL(InboundType::InitiationMetadata, msg.type);
    TEST_ASSERT_EQUAL_STRING("conv_1", msg.conversation_id.c_str());

    msg = parse("{\"type\":\"audio\",\"audio_event\":{\"audio_base_64\":\"AAAA\",\"event_id\":3}}");
    TEST_ASSERT_EQUAL(InboundType::Audio, msg.type);
    TEST_ASSERT_EQUAL_STRING("AAAA", msg.audio_base64.c_str());
}

void test_messages_parse_transcripts() {
    InboundMessage msg =
        parse("{\"type\":\"user_transcript\",\"user_transcript_event\":{\"user_transcript\":\"hello\"}}");
    TEST_ASSERT_EQUAL(InboundType::UserTranscript, msg.type);
    TEST_ASSERT_EQUAL_STRING("hello", msg.text.c_str());

    msg = parse("{\"type\":\"user_transcript\",\"user_transcript_event\":{\"transcript\":\"hi\"}}");
    TEST_ASSERT_EQUAL_STRING("hi", msg.text.c_str());

    msg = parse("{\"type\":\"agent_response\",\"agent_response_event\":{\"agent_response\":\"Sure.\"}}");
    TEST_ASSERT_EQUAL(InboundType::AgentResponse, msg.type);
    TEST_ASSERT_EQUAL_STRING("Sure.", msg.text.c_str());
}

void test_messages_parse_unknown_and_garbage() {
    InboundMessage msg = parse("{\"type\":\"vad_score\",\"vad_score_event\":{\"vad_score\":0.9}}");
    TEST_ASSERT_EQUAL(InboundType::Unknown, msg.type);
    TEST_ASSERT_EQUAL_STRING("vad_score", msg.type_name.c_str());

    parse("not json at all", VOX_ERR_PROTOCOL);
    parse("{\"no_type\":1}", VOX_ERR_PROTOCOL);
    parse("{\"type\":5}", VOX_ERR_PROTOCOL);

    InboundMessage out;
    TEST_ASSERT_EQUAL(VOX_ERR_PROTOCOL, parseInboundMessage(nullptr, 0, out));
}

//==============================================================================
// Outbound
//==============================================================================

void test_messages_build_initiation() {
    SessionInitiation init;
    init.language = "de";
    init.user_id = "u-9";
    init.dynamic_variables["user_id"] = "u-9";
    init.dynamic_variables["plan"] = "pro";

    cJSON* root = cJSON_Parse(buildInitiationMessage(init).c_str());
    TEST_ASSERT_NOT_NULL(root);
    TEST_ASSERT_EQUAL_STRING("conversation_initiation_client_data",
                             cJSON_GetObjectItem(root, "type")->valuestring);
    TEST_ASSERT_EQUAL_STRING("u-9", cJSON_GetObjectItem(root, "user_id")->valuestring);
    cJSON* agent = cJSON_GetObjectItem(cJSON_GetObjectItem(root, "conversation_config_override"), "agent");
    TEST_ASSERT_EQUAL_STRING("de", cJSON_GetObjectItem(agent, "language")->valuestring);
    cJSON* vars = cJSON_GetObjectItem(root, "dynamic_variables");
    TEST_ASSERT_EQUAL_STRING("pro", cJSON_GetObjectItem(vars, "plan")->valuestring);
    cJSON_Delete(root);
}

void test_messages_build_initiation_minimal() {
    SessionInitiation init;
    cJSON* root = cJSON_Parse(buildInitiationMessage(init).c_str());
    TEST_ASSERT_NOT_NULL(root);
    TEST_ASSERT_NULL(cJSON_GetObjectItem(root, "user_id"));
    TEST_ASSERT_NULL(cJSON_GetObjectItem(root, "dynamic_variables"));
    cJSON* agent = cJSON_GetObjectItem(cJSON_GetObjectItem(root, "conversation_config_override"), "agent");
    TEST_ASSERT_EQUAL_STRING("en", cJSON_GetObjectItem(agent, "language")->valuestring);
    cJSON_Delete(root);
}

void test_messages_build_audio_pong_and_text() {
    TEST_ASSERT_EQUAL_STRING("{\"user_audio_chunk\":\"AAAA\"}", buildAudioChunkMessage("AAAA").c_str());
    TEST_ASSERT_EQUAL_STRING("{\"type\":\"pong\",\"event_id\":42}", buildPongMessage("42").c_str());
    TEST_ASSERT_EQUAL_STRING("{\"type\":\"pong\",\"event_id\":\"e-7\"}", buildPongMessage("\"e-7\"").c_str());
    TEST_ASSERT_EQUAL_STRING("{\"type\":\"user_message\",\"text\":\"say \\\"hi\\\"\"}",
                             buildUserMessage("say \"hi\"").c_str());
}

//==============================================================================
// State machine
//==============================================================================

void test_state_machine_valid_path() {
    SessionStateMachine sm;
    std::vector<SessionState> seen;
    sm.addStateChangeListener([&](SessionState, SessionState now) { seen.push_back(now); });

    TEST_ASSERT_TRUE(sm.transitionTo(SessionState::Connecting));
    TEST_ASSERT_TRUE(sm.transitionTo(SessionState::Handshaking));
    TEST_ASSERT_TRUE(sm.transitionTo(SessionState::Active));
    TEST_ASSERT_TRUE(sm.transitionTo(SessionState::Active)); // already there, no event
    TEST_ASSERT_TRUE(sm.transitionTo(SessionState::Closing));
    TEST_ASSERT_TRUE(sm.transitionTo(SessionState::Disconnected));

    TEST_ASSERT_EQUAL(5, (int)seen.size());
    TEST_ASSERT_EQUAL(SessionState::Disconnected, seen.back());
}

void test_state_machine_rejects_invalid() {
    SessionStateMachine sm;
    TEST_ASSERT_FALSE(sm.transitionTo(SessionState::Active));
    TEST_ASSERT_FALSE(sm.transitionTo(SessionState::Handshaking));
    TEST_ASSERT_EQUAL(SessionState::Disconnected, sm.getState());

    TEST_ASSERT_TRUE(sm.transitionTo(SessionState::Connecting));
    TEST_ASSERT_FALSE(sm.transitionTo(SessionState::Active));
    TEST_ASSERT_FALSE(sm.transitionFrom(SessionState::Handshaking, SessionState::Active));
    TEST_ASSERT_TRUE(sm.transitionFrom(SessionState::Connecting, SessionState::Disconnected));
}

void test_state_machine_remove_listener() {
    SessionStateMachine sm;
    int calls = 0;
    int id = sm.addStateChangeListener([&](SessionState, SessionState) { calls++; });
    sm.transitionTo(SessionState::Connecting);
    sm.removeStateChangeListener(id);
    sm.transitionTo(SessionState::Disconnected);
    TEST_ASSERT_EQUAL(1, calls);
}

void run_session_messages_tests() {
    RUN_TEST(test_messages_parse_ping_keeps_id_type);
    RUN_TEST(test_messages_parse_metadata_and_audio);
    RUN_TEST(test_messages_parse_transcripts);
    RUN_TEST(test_messages_parse_unknown_and_garbage);
    RUN_TEST(test_messages_build_initiation);
    RUN_TEST(test_messages_build_initiation_minimal);
    RUN_TEST(test_messages_build_audio_pong_and_text);
    RUN_TEST(test_state_machine_valid_path);
    RUN_TEST(test_state_machine_rejects_invalid);
    RUN_TEST(test_state_machine_remove_listener);
}
