#include <unity.h>
#include "vox_log.h"

void run_ring_buffer_tests();
void run_audio_codec_tests();
void run_vad_tests();
void run_url_tests();
void run_session_messages_tests();
void run_session_protocol_tests();
void run_transcoder_tests();
void run_orchestrator_tests();
void run_webhook_tests();
void run_wav_device_tests();

void setUp(void) {
    // Setup before each test
}

void tearDown(void) {
    // Cleanup after each test
}

int main(void) {
    vox_log_level_set("*", VOX_LOG_WARN);
    UNITY_BEGIN();

    run_ring_buffer_tests();
    run_audio_codec_tests();
    run_vad_tests();
    run_url_tests();
    run_session_messages_tests();
    run_session_protocol_tests();
    run_transcoder_tests();
    run_orchestrator_tests();
    run_webhook_tests();
    run_wav_device_tests();

    return UNITY_END();
}
