#include "conversation_orchestrator.h"
#include "vox_config.h"
#include "vox_err.h"
#include "vox_log.h"
#include "vox_time.h"
#include "wav_file_device.h"
#include "webhook_dialog.h"
#include "ws_transport.h"

#include <atomic>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>

static const char *TAG = "main";

namespace {

std::atomic<bool> g_stop{false};

void onSignal(int) { g_stop.store(true); }

struct DemoArgs {
  std::string mode = "stream"; // stream | webhook
  std::string input;
  std::string output = "voxlink_out.wav";
  std::string agent_id = CONFIG_VOX_AGENT_ID;
  std::string url;
  std::string webhook_url = CONFIG_VOX_WEBHOOK_URL;
  std::string user_id = CONFIG_VOX_USER_ID;
  std::string text;
  int chunk_ms = CONFIG_VOX_CHUNK_MS;
  int max_seconds = CONFIG_VOX_MAX_CONVERSATION_SECONDS;
  bool gated = false;
  bool fast = false;
  bool insecure = false;
  int log_level = CONFIG_VOX_LOG_LEVEL;
};

void printUsage(const char *prog) {
  fprintf(stderr,
          "usage: %s --input <file.wav> [options]\n"
          "  --mode stream|webhook   streaming session or batch webhook (default stream)\n"
          "  --output <file.wav>     where rendered playback is written\n"
          "  --agent-id <id>         agent id (stream mode)\n"
          "  --url <wss://...>       full session URL, overrides --agent-id\n"
          "  --webhook <url>         webhook URL (webhook mode)\n"
          "  --user-id <id>          user id sent with the session / webhook\n"
          "  --text <message>        send a text message once the session is active\n"
          "  --chunk-ms <50..250>    outbound chunk interval\n"
          "  --max-seconds <n>       end the conversation after n seconds\n"
          "  --gated                 only stream while speech is detected\n"
          "  --fast                  feed the input file without real-time pacing\n"
          "  --insecure              skip TLS certificate verification\n"
          "  --log-level <0..5>\n",
          prog);
}

bool parseArgs(int argc, char **argv, DemoArgs &args) {
  for (int i = 1; i < argc; ++i) {
    std::string a = argv[i];
    if (a == "--help" || a == "-h") {
      return false;
    }
    if (a == "--gated") { args.gated = true; continue; }
    if (a == "--fast") { args.fast = true; continue; }
    if (a == "--insecure") { args.insecure = true; continue; }
    if (i + 1 >= argc) {
      fprintf(stderr, "missing value for %s\n", a.c_str());
      return false;
    }
    if (a == "--mode") { args.mode = argv[++i]; continue; }
    if (a == "--input") { args.input = argv[++i]; continue; }
    if (a == "--output") { args.output = argv[++i]; continue; }
    if (a == "--agent-id") { args.agent_id = argv[++i]; continue; }
    if (a == "--url") { args.url = argv[++i]; continue; }
    if (a == "--webhook") { args.webhook_url = argv[++i]; continue; }
    if (a == "--user-id") { args.user_id = argv[++i]; continue; }
    if (a == "--text") { args.text = argv[++i]; continue; }
    if (a == "--chunk-ms") { args.chunk_ms = std::atoi(argv[++i]); continue; }
    if (a == "--max-seconds") { args.max_seconds = std::atoi(argv[++i]); continue; }
    if (a == "--log-level") { args.log_level = std::atoi(argv[++i]); continue; }
    fprintf(stderr, "unknown option %s\n", a.c_str());
    return false;
  }
  if (args.input.empty()) {
    fprintf(stderr, "--input is required\n");
    return false;
  }
  return args.mode == "stream" || args.mode == "webhook";
}

int runStreaming(const DemoArgs &args, WavFileCaptureDevice &mic,
                 WavFilePlaybackDevice &speaker) {
  OrchestratorConfig cfg;
  cfg.transcoder.chunk_ms = args.chunk_ms;
  cfg.transcoder.mode = args.gated ? CaptureMode::VoiceGated : CaptureMode::Continuous;
  cfg.transcoder.playback.output_rate_hz = CONFIG_VOX_OUTPUT_RATE_HZ;
  cfg.transcoder.playback.preroll_ms = CONFIG_VOX_PLAYBACK_PREROLL_MS;
  cfg.session.agent_id = args.agent_id;
  cfg.session.endpoint = CONFIG_VOX_ENDPOINT;
  cfg.session.url = args.url;
  cfg.session.initiation.language = CONFIG_VOX_LANGUAGE;
  cfg.session.initiation.user_id = args.user_id;
  if (!args.user_id.empty()) {
    cfg.session.initiation.dynamic_variables["user_id"] = args.user_id;
  }
  cfg.session.connection_timeout_ms = CONFIG_VOX_CONNECTION_TIMEOUT_MS;
  cfg.session.max_reconnect_attempts = CONFIG_VOX_MAX_RECONNECT_ATTEMPTS;
  cfg.session.reconnect_delay_ms = CONFIG_VOX_RECONNECT_DELAY_MS;
  cfg.warmup_ms = CONFIG_VOX_WARMUP_MS;
  cfg.max_conversation_seconds = args.max_seconds;

  WsTransportConfig wsCfg;
  wsCfg.verify_peer = !args.insecure;
  WebSocketTransport ws(wsCfg);

  ConversationOrchestrator conv(ws, &mic, &speaker);
  vox_err_t err = conv.init(cfg);
  if (err != VOX_OK) {
    VOX_LOGE(TAG, "init failed: %s", vox_err_to_name(err));
    return 1;
  }

  bool textSent = false;
  bool failed = false;
  conv.setOnEvent([&](const ConversationEvent &ev) {
    switch (ev.type) {
    case ConversationEventType::Started:
      VOX_LOGI(TAG, "[started] conversation_id=%s", ev.text.c_str());
      break;
    case ConversationEventType::Ended:
      VOX_LOGI(TAG, "[ended] %s", ev.text.c_str());
      break;
    case ConversationEventType::Transcript:
      VOX_LOGI(TAG, "[you] %s", ev.text.c_str());
      break;
    case ConversationEventType::AgentText:
      VOX_LOGI(TAG, "[agent] %s", ev.text.c_str());
      break;
    case ConversationEventType::ConnectionStatus:
      VOX_LOGI(TAG, "[connection] %s -> %s", GetSessionStateName(ev.old_state),
               GetSessionStateName(ev.new_state));
      break;
    case ConversationEventType::Error:
      VOX_LOGE(TAG, "[error] %s%s: %s", vox_err_to_name(ev.code),
               ev.fatal ? " (fatal)" : "", ev.text.c_str());
      failed = failed || ev.fatal;
      break;
    }
  });

  err = conv.beginConversation();
  if (err != VOX_OK) {
    VOX_LOGE(TAG, "begin failed: %s", vox_err_to_name(err));
    return 1;
  }

  int64_t lastStatus = 0;
  while (conv.phase() != ConversationPhase::Idle) {
    conv.tick();
    if (conv.isActive()) {
      if (!textSent && !args.text.empty()) {
        textSent = conv.sendTextMessage(args.text) == VOX_OK;
      }
      if (mic.isFinished() || g_stop.load()) {
        (void)conv.endConversation();
      }
    } else if (g_stop.load()) {
      conv.forceEndConversation();
    }
    if (vox_time_ms() - lastStatus >= 5000) {
      lastStatus = vox_time_ms();
      VOX_LOGI(TAG, "%s", conv.getStatus().c_str());
    }
    vox_delay_ms(20);
  }
  conv.tick(); // deliver the final events

  VOX_LOGI(TAG, "sent %u chunks, received %u, dropped %u during barge-in",
           (unsigned)conv.pipeline().chunksSent(),
           (unsigned)conv.session().audioChunksReceived(),
           (unsigned)conv.session().audioChunksDropped());
  return failed ? 1 : 0;
}

int runWebhook(const DemoArgs &args, WavFileCaptureDevice &mic,
               WavFilePlaybackDevice &speaker) {
  WebhookDialogConfig cfg;
  cfg.capture_rate_hz = mic.sampleRate();
  cfg.webhook.url = args.webhook_url;
  cfg.webhook.user_id = args.user_id;
  cfg.webhook.http.verify_peer = !args.insecure;
  cfg.playback.output_rate_hz = speaker.sampleRate();
  cfg.playback.preroll_ms = CONFIG_VOX_PLAYBACK_PREROLL_MS;

  WebhookDialog dialog;
  vox_err_t err = dialog.init(cfg);
  if (err != VOX_OK) {
    VOX_LOGE(TAG, "init failed: %s", vox_err_to_name(err));
    return 1;
  }
  dialog.setOnReply([](const WebhookReply &reply, bool played) {
    VOX_LOGI(TAG, "[reply] %s, %u bytes%s", GetReplyFormatName(reply.format),
             (unsigned)reply.audio.size(), played ? "" : " (not played)");
  });

  err = speaker.start([&dialog](float *out, size_t frames, int ch) {
    dialog.renderPlayback(out, frames, ch);
  });
  if (err != VOX_OK) {
    VOX_LOGE(TAG, "speaker start failed: %s", vox_err_to_name(err));
    return 1;
  }
  err = dialog.start(&mic);
  if (err != VOX_OK) {
    VOX_LOGE(TAG, "start failed: %s", vox_err_to_name(err));
    speaker.stop();
    return 1;
  }

  // Let the last reply play out
  while (!g_stop.load() &&
         (!mic.isFinished() || dialog.isBusy() || dialog.playback().buffered() > 0)) {
    vox_delay_ms(50);
  }
  dialog.stop();
  speaker.stop();
  return dialog.turnsFailed() > 0 ? 1 : 0;
}

} // namespace

int main(int argc, char **argv) {
  DemoArgs args;
  if (!parseArgs(argc, argv, args)) {
    printUsage(argv[0]);
    return 2;
  }
  vox_log_level_set("*", (vox_log_level_t)args.log_level);

  std::signal(SIGINT, onSignal);
  std::signal(SIGTERM, onSignal);

  VOX_LOGI(TAG, "========================================");
  VOX_LOGI(TAG, "  voxlink demo (%s mode)", args.mode.c_str());
  VOX_LOGI(TAG, "========================================");

  WavCaptureConfig capCfg;
  capCfg.path = args.input;
  capCfg.realtime = !args.fast;
  capCfg.tail_silence_ms = 1500; // let the detector close the last utterance
  WavFileCaptureDevice mic;
  vox_err_t err = mic.open(capCfg);
  if (err != VOX_OK) {
    VOX_LOGE(TAG, "cannot open input: %s", vox_err_to_name(err));
    return 1;
  }

  WavPlaybackConfig outCfg;
  outCfg.path = args.output;
  outCfg.sample_rate_hz = CONFIG_VOX_OUTPUT_RATE_HZ;
  outCfg.channels = 2;
  WavFilePlaybackDevice speaker;
  err = speaker.init(outCfg);
  if (err != VOX_OK) {
    VOX_LOGE(TAG, "cannot set up output: %s", vox_err_to_name(err));
    return 1;
  }

  int rc = args.mode == "webhook" ? runWebhook(args, mic, speaker)
                                  : runStreaming(args, mic, speaker);
  VOX_LOGI(TAG, "done (rc=%d), playback written to %s", rc, args.output.c_str());
  return rc;
}
