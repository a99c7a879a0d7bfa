#include <unity.h>
#include "pcm_codec.h"
#include "test_support.h"
#include "webhook_client.h"
#include "webhook_dialog.h"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstring>
#include <functional>
#include <future>
#include <string>
#include <thread>
#include <vector>

namespace {

constexpr int kRate = 16000;

bool waitFor(const std::function<bool()>& done, int timeout_ms = 2000) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    while (!done()) {
        if (std::chrono::steady_clock::now() > deadline) {
            return false;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
    }
    return true;
}

WebhookDialogConfig dialogConfig() {
    WebhookDialogConfig cfg;
    cfg.capture_rate_hz = kRate;
    cfg.vad.frame_ms = 20;
    cfg.vad.pre_roll_ms = 100;
    cfg.vad.hangover_ms = 200;
    cfg.vad.min_speech_ms = 200;
    cfg.vad.max_speech_ms = 2000;
    cfg.vad.cooldown_ms = 300;
    cfg.vad.buffer_seconds = 10;
    cfg.playback.output_rate_hz = 48000;
    return cfg;
}

void speakOnce(MockCaptureDevice& mic) {
    std::vector<float> pcm = makeSilence(kRate, 500);
    mic.feed(pcm.data(), pcm.size());
    pcm = makeTone(440.0f, kRate, 600, 0.3f);
    mic.feed(pcm.data(), pcm.size());
    pcm = makeSilence(kRate, 400);
    mic.feed(pcm.data(), pcm.size());
}

WebhookReply wavReply(int ms) {
    std::vector<float> tone = makeTone(300.0f, kRate, ms, 0.5f);
    WebhookReply reply;
    reply.status = 200;
    reply.content_type = "audio/wav";
    reply.format = ReplyFormat::Wav;
    reply.audio = WavCodec::encode(tone.data(), tone.size(), kRate, 1);
    return reply;
}

} // namespace

//==============================================================================
// Reply sniffing and multipart
//==============================================================================

void test_webhook_sniff_magic_bytes() {
    const uint8_t wav[] = {'R', 'I', 'F', 'F', 0, 0, 0, 0, 'W', 'A', 'V', 'E'};
    const uint8_t id3[] = {'I', 'D', '3', 4, 0};
    const uint8_t sync[] = {0xFF, 0xFB, 0x90, 0x00};
    const uint8_t text[] = {'{', '"', 'o', 'k'};

    TEST_ASSERT_EQUAL(ReplyFormat::Wav, sniffReplyFormat(wav, sizeof(wav), "application/octet-stream"));
    TEST_ASSERT_EQUAL(ReplyFormat::Mp3, sniffReplyFormat(id3, sizeof(id3), ""));
    TEST_ASSERT_EQUAL(ReplyFormat::Mp3, sniffReplyFormat(sync, sizeof(sync), "audio/wav"));
    TEST_ASSERT_EQUAL(ReplyFormat::Unknown, sniffReplyFormat(text, sizeof(text), "application/json"));
}

void test_webhook_sniff_falls_back_to_content_type() {
    const uint8_t raw[] = {0x01, 0x02, 0x03, 0x04};
    TEST_ASSERT_EQUAL(ReplyFormat::Wav, sniffReplyFormat(raw, sizeof(raw), "audio/x-WAV"));
    TEST_ASSERT_EQUAL(ReplyFormat::Mp3, sniffReplyFormat(raw, sizeof(raw), "audio/mpeg"));
    TEST_ASSERT_EQUAL(ReplyFormat::Mp3, sniffReplyFormat(raw, sizeof(raw), "audio/mp3"));
    TEST_ASSERT_EQUAL(ReplyFormat::Unknown, sniffReplyFormat(nullptr, 0, ""));
    TEST_ASSERT_EQUAL_STRING("mp3", GetReplyFormatName(ReplyFormat::Mp3));
}

void test_webhook_multipart_layout() {
    const uint8_t data[] = {'a', 'b', 'c'};
    MultipartBody form = buildMultipartFile("XYZ", "file", "rec.wav", "audio/wav", data, sizeof(data));
    TEST_ASSERT_EQUAL_STRING("multipart/form-data; boundary=XYZ", form.content_type.c_str());
    TEST_ASSERT_EQUAL_STRING("--XYZ\r\n"
                             "Content-Disposition: form-data; name=\"file\"; filename=\"rec.wav\"\r\n"
                             "Content-Type: audio/wav\r\n\r\n"
                             "abc\r\n"
                             "--XYZ--\r\n",
                             form.body.c_str());
}

//==============================================================================
// Client
//==============================================================================

void test_webhook_client_validates_url() {
    WebhookClient client;
    WebhookConfig cfg;
    TEST_ASSERT_EQUAL(VOX_ERR_INVALID_ARG, client.init(cfg));
    cfg.url = "wss://n8n.example.com/webhook/voice";
    TEST_ASSERT_EQUAL(VOX_ERR_INVALID_ARG, client.init(cfg));
    TEST_ASSERT_FALSE(client.isInitialized());

    WebhookReply reply;
    const uint8_t wav[] = {0};
    TEST_ASSERT_EQUAL(VOX_ERR_INVALID_STATE, client.postWav(wav, sizeof(wav), reply));
}

void test_webhook_client_appends_user_id() {
    WebhookClient client;
    WebhookConfig cfg;
    cfg.url = "https://n8n.example.com/webhook/voice";
    cfg.user_id = "kid 7";
    TEST_ASSERT_EQUAL(VOX_OK, client.init(cfg));
    TEST_ASSERT_EQUAL_STRING("https://n8n.example.com/webhook/voice?userId=kid%207",
                             client.requestUrl().c_str());

    WebhookReply reply;
    TEST_ASSERT_EQUAL(VOX_ERR_INVALID_ARG, client.postWav(nullptr, 0, reply));

    WebhookClient plain;
    cfg.user_id.clear();
    TEST_ASSERT_EQUAL(VOX_OK, plain.init(cfg));
    TEST_ASSERT_EQUAL_STRING(cfg.url.c_str(), plain.requestUrl().c_str());
}

//==============================================================================
// Dialog
//==============================================================================

void test_webhook_dialog_needs_uploader_and_mic() {
    MockCaptureDevice missing(kRate, 1, false);
    WebhookDialog dialog;
    TEST_ASSERT_EQUAL(VOX_ERR_INVALID_STATE, dialog.start(nullptr));
    TEST_ASSERT_EQUAL(VOX_OK, dialog.init(dialogConfig()));
    TEST_ASSERT_EQUAL(VOX_ERR_INVALID_STATE, dialog.start(nullptr));

    dialog.setUploader([](const uint8_t*, size_t, WebhookReply&) { return VOX_OK; });
    TEST_ASSERT_EQUAL(VOX_ERR_DEVICE_UNAVAILABLE, dialog.start(&missing));
    TEST_ASSERT_FALSE(dialog.isRunning());
}

void test_webhook_dialog_uploads_and_plays_wav_reply() {
    MockCaptureDevice mic(kRate, 1);
    std::vector<uint8_t> uploaded;
    std::atomic<int> turns{0};
    bool played = false;
    WebhookDialog dialog;

    TEST_ASSERT_EQUAL(VOX_OK, dialog.init(dialogConfig()));
    dialog.setUploader([&](const uint8_t* wav, size_t len, WebhookReply& reply) {
        uploaded.assign(wav, wav + len);
        reply = wavReply(200);
        return VOX_OK;
    });
    dialog.setOnReply([&](const WebhookReply&, bool p) { played = p; });
    dialog.setOnTurnFinished([&](bool ok) {
        if (ok) {
            turns++;
        }
    });

    TEST_ASSERT_EQUAL(VOX_OK, dialog.start(&mic));
    TEST_ASSERT_EQUAL(1, mic.start_count);
    speakOnce(mic);
    TEST_ASSERT_TRUE(waitFor([&] { return turns.load() == 1; }));

    TEST_ASSERT_TRUE(played);
    TEST_ASSERT_EQUAL(1, (int)dialog.turnsCompleted());
    TEST_ASSERT_EQUAL(0, (int)dialog.turnsFailed());
    TEST_ASSERT_FALSE(dialog.isBusy());

    // Utterance went up as a mono PCM16 WAV at the capture rate
    WavAudio sent;
    TEST_ASSERT_EQUAL(VOX_OK, WavCodec::decode(uploaded, sent));
    TEST_ASSERT_EQUAL(kRate, sent.sample_rate);
    TEST_ASSERT_EQUAL(1, sent.channels);
    TEST_ASSERT_EQUAL(1600 + 9600 + 3200, (int)sent.frames());

    // 200 ms reply resampled to the 48 kHz output
    TEST_ASSERT_EQUAL(9600, (int)dialog.playback().buffered());

    dialog.stop();
    TEST_ASSERT_EQUAL(1, mic.stop_count);
    TEST_ASSERT_FALSE(dialog.isRunning());
}

void test_webhook_dialog_plays_reply_longer_than_buffer() {
    MockCaptureDevice mic(kRate, 1);
    std::atomic<int> turns{0};
    WebhookDialogConfig cfg = dialogConfig();
    cfg.playback.buffer_ms = 1000;
    WebhookDialog dialog;

    TEST_ASSERT_EQUAL(VOX_OK, dialog.init(cfg));
    dialog.setUploader([](const uint8_t*, size_t, WebhookReply& reply) {
        // 3 s reply whose opening second is louder than the rest
        std::vector<float> pcm(kRate * 3, 0.1f);
        std::fill(pcm.begin(), pcm.begin() + kRate, 0.5f);
        reply.status = 200;
        reply.content_type = "audio/wav";
        reply.format = ReplyFormat::Wav;
        reply.audio = WavCodec::encode(pcm.data(), pcm.size(), kRate, 1);
        return VOX_OK;
    });
    dialog.setOnTurnFinished([&](bool) { turns++; });
    TEST_ASSERT_EQUAL(VOX_OK, dialog.start(&mic));

    const size_t expected = 48000 * 3;
    std::vector<float> heard;
    std::atomic<bool> stop{false};
    std::thread output([&]() {
        std::vector<float> block(480, 0.0f);
        while (!stop.load() && heard.size() < expected) {
            dialog.renderPlayback(block.data(), block.size(), 1);
            for (float v : block) {
                if (v != 0.0f) {
                    heard.push_back(v);
                }
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
    });

    speakOnce(mic);
    bool finished = waitFor([&] { return turns.load() == 1; }, 10000);
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(10);
    while (output.joinable() && std::chrono::steady_clock::now() < deadline &&
           dialog.playback().buffered() > 0) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    stop.store(true);
    output.join();
    dialog.stop();

    TEST_ASSERT_TRUE(finished);
    TEST_ASSERT_EQUAL(1, (int)dialog.turnsCompleted());
    TEST_ASSERT_EQUAL((int)expected, (int)heard.size());
    TEST_ASSERT_FLOAT_WITHIN(1e-4f, 0.5f, heard[0]);
    int loud = 0;
    for (float v : heard) {
        if (v > 0.3f) {
            loud++;
        }
    }
    TEST_ASSERT_INT_WITHIN(3, 48000, loud);
}

void test_webhook_dialog_reports_mp3_without_playing() {
    MockCaptureDevice mic(kRate, 1);
    std::atomic<int> turns{0};
    bool played = true;
    ReplyFormat seen = ReplyFormat::Unknown;
    WebhookDialog dialog;

    TEST_ASSERT_EQUAL(VOX_OK, dialog.init(dialogConfig()));
    dialog.setUploader([](const uint8_t*, size_t, WebhookReply& reply) {
        reply.status = 200;
        reply.content_type = "audio/mpeg";
        reply.format = ReplyFormat::Mp3;
        reply.audio = {'I', 'D', '3', 4, 0, 0};
        return VOX_OK;
    });
    dialog.setOnReply([&](const WebhookReply& reply, bool p) {
        played = p;
        seen = reply.format;
    });
    dialog.setOnTurnFinished([&](bool) { turns++; });

    TEST_ASSERT_EQUAL(VOX_OK, dialog.start(&mic));
    speakOnce(mic);
    TEST_ASSERT_TRUE(waitFor([&] { return turns.load() == 1; }));

    TEST_ASSERT_FALSE(played);
    TEST_ASSERT_EQUAL(ReplyFormat::Mp3, seen);
    TEST_ASSERT_EQUAL(1, (int)dialog.turnsCompleted());
    TEST_ASSERT_EQUAL(0, (int)dialog.playback().buffered());
}

void test_webhook_dialog_counts_failed_upload() {
    MockCaptureDevice mic(kRate, 1);
    std::atomic<int> turns{0};
    int replies = 0;
    WebhookDialog dialog;

    TEST_ASSERT_EQUAL(VOX_OK, dialog.init(dialogConfig()));
    dialog.setUploader([](const uint8_t*, size_t, WebhookReply&) { return VOX_FAIL; });
    dialog.setOnReply([&](const WebhookReply&, bool) { replies++; });
    dialog.setOnTurnFinished([&](bool ok) {
        if (!ok) {
            turns++;
        }
    });

    TEST_ASSERT_EQUAL(VOX_OK, dialog.start(&mic));
    speakOnce(mic);
    TEST_ASSERT_TRUE(waitFor([&] { return turns.load() == 1; }));

    TEST_ASSERT_EQUAL(0, replies);
    TEST_ASSERT_EQUAL(0, (int)dialog.turnsCompleted());
    TEST_ASSERT_EQUAL(1, (int)dialog.turnsFailed());
}

void test_webhook_dialog_ignores_speech_while_uploading() {
    MockCaptureDevice mic(kRate, 1);
    std::promise<void> release;
    std::shared_future<void> gate = release.get_future().share();
    std::atomic<int> uploads{0};
    std::atomic<int> turns{0};
    WebhookDialog dialog;

    TEST_ASSERT_EQUAL(VOX_OK, dialog.init(dialogConfig()));
    dialog.setUploader([&](const uint8_t*, size_t, WebhookReply& reply) {
        uploads++;
        gate.wait();
        reply = wavReply(100);
        return VOX_OK;
    });
    dialog.setOnTurnFinished([&](bool) { turns++; });

    TEST_ASSERT_EQUAL(VOX_OK, dialog.start(&mic));
    speakOnce(mic);
    TEST_ASSERT_TRUE(dialog.isBusy());
    TEST_ASSERT_TRUE(waitFor([&] { return uploads.load() == 1; }));

    speakOnce(mic);
    TEST_ASSERT_FALSE(dialog.vad().isSpeaking());

    release.set_value();
    TEST_ASSERT_TRUE(waitFor([&] { return turns.load() == 1; }));
    TEST_ASSERT_EQUAL(1, uploads.load());
    TEST_ASSERT_FALSE(dialog.isBusy());
    TEST_ASSERT_TRUE(dialog.vad().isCoolingDown());
}

void run_webhook_tests() {
    RUN_TEST(test_webhook_sniff_magic_bytes);
    RUN_TEST(test_webhook_sniff_falls_back_to_content_type);
    RUN_TEST(test_webhook_multipart_layout);
    RUN_TEST(test_webhook_client_validates_url);
    RUN_TEST(test_webhook_client_appends_user_id);
    RUN_TEST(test_webhook_dialog_needs_uploader_and_mic);
    RUN_TEST(test_webhook_dialog_uploads_and_plays_wav_reply);
    RUN_TEST(test_webhook_dialog_plays_reply_longer_than_buffer);
    RUN_TEST(test_webhook_dialog_reports_mp3_without_playing);
    RUN_TEST(test_webhook_dialog_counts_failed_upload);
    RUN_TEST(test_webhook_dialog_ignores_speech_while_uploading);
}
