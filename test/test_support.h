/**
 * voxlink - shared test doubles
 *
 * - ManualClock: time only moves when a test advances it
 * - MockTransport: records every frame the session sends and lets a test
 *   inject server messages and link failures
 * - MockCaptureDevice / MockPlaybackDevice: devices driven by the test
 */

#pragma once

#include "audio_device.h"
#include "session_transport.h"
#include "vox_time.h"

#include <cmath>
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

//==============================================================================
// Time
//==============================================================================

struct ManualClock {
    int64_t now_ms = 1000;

    VoxClock source() {
        return [this]() { return now_ms; };
    }
    void advance(int64_t ms) { now_ms += ms; }
};

//==============================================================================
// Transport
//==============================================================================

class MockTransport : public SessionTransport {
public:
    vox_err_t start(const std::string& uri, int timeout_ms) override {
        starts++;
        last_uri = uri;
        last_timeout_ms = timeout_ms;
        connected = false;
        return start_result;
    }

    void stop() override {
        stops++;
        connected = false;
    }

    bool isConnected() const override { return connected; }

    vox_err_t sendText(const std::string& text) override {
        std::lock_guard<std::mutex> lock(mutex);
        if (!connected) {
            return VOX_ERR_INVALID_STATE;
        }
        sent.push_back(text);
        return VOX_OK;
    }

    // ---- server side ----

    void acceptConnection() {
        connected = true;
        emit(TransportEvent::Connected);
    }

    void deliver(const std::string& json) { emit(TransportEvent::Data, json); }

    void completeHandshake(const char* conversation_id) {
        deliver(std::string("{\"type\":\"conversation_initiation_metadata\","
                            "\"conversation_initiation_metadata_event\":{\"conversation_id\":\"") +
                conversation_id + "\"}}");
    }

    void dropLink(const char* reason = "connection reset") {
        connected = false;
        emit(TransportEvent::Error, reason);
        emit(TransportEvent::Disconnected);
    }

    void serverClose() {
        connected = false;
        emit(TransportEvent::Closed, "1000");
        emit(TransportEvent::Disconnected);
    }

    // ---- inspection ----

    int countContaining(const char* needle) const {
        std::lock_guard<std::mutex> lock(mutex);
        int n = 0;
        for (const auto& s : sent) {
            if (s.find(needle) != std::string::npos) {
                n++;
            }
        }
        return n;
    }

    std::vector<std::string> sentContaining(const char* needle) const {
        std::lock_guard<std::mutex> lock(mutex);
        std::vector<std::string> out;
        for (const auto& s : sent) {
            if (s.find(needle) != std::string::npos) {
                out.push_back(s);
            }
        }
        return out;
    }

    size_t sentCount() const {
        std::lock_guard<std::mutex> lock(mutex);
        return sent.size();
    }

    int starts = 0;
    int stops = 0;
    std::string last_uri;
    int last_timeout_ms = 0;
    bool connected = false;
    vox_err_t start_result = VOX_OK;

    mutable std::mutex mutex;
    std::vector<std::string> sent;
};

//==============================================================================
// Devices
//==============================================================================

class MockCaptureDevice : public AudioCaptureDevice {
public:
    MockCaptureDevice(int rate, int channels, bool available = true)
        : rate_(rate), channels_(channels), available_(available) {}

    bool isAvailable() const override { return available_; }
    int sampleRate() const override { return rate_; }
    int channels() const override { return channels_; }

    vox_err_t start(FrameCallback callback) override {
        if (!available_) {
            return VOX_ERR_DEVICE_UNAVAILABLE;
        }
        callback_ = std::move(callback);
        running_ = true;
        start_count++;
        return VOX_OK;
    }

    void stop() override {
        running_ = false;
        callback_ = nullptr;
        stop_count++;
    }

    bool isRunning() const override { return running_; }

    /** Push interleaved frames as the device thread would. */
    void feed(const float* interleaved, size_t frames) {
        if (running_ && callback_) {
            callback_(interleaved, frames, channels_);
        }
    }

    int start_count = 0;
    int stop_count = 0;

private:
    int rate_;
    int channels_;
    bool available_;
    bool running_ = false;
    FrameCallback callback_;
};

class MockPlaybackDevice : public AudioPlaybackDevice {
public:
    MockPlaybackDevice(int rate, int channels) : rate_(rate), channels_(channels) {}

    bool isAvailable() const override { return true; }
    int sampleRate() const override { return rate_; }
    int channels() const override { return channels_; }

    vox_err_t start(RenderCallback callback) override {
        callback_ = std::move(callback);
        running_ = true;
        return VOX_OK;
    }

    void stop() override {
        running_ = false;
        callback_ = nullptr;
    }

    bool isRunning() const override { return running_; }

    /** Pull one output block; returns the peak absolute sample. */
    float pull(size_t frames) {
        block_.assign(frames * (size_t)channels_, 0.0f);
        if (running_ && callback_) {
            callback_(block_.data(), frames, channels_);
        }
        float peak = 0.0f;
        for (float v : block_) {
            peak = std::fmax(peak, std::fabs(v));
        }
        return peak;
    }

    /** Interleaved samples from the last pull(). */
    const std::vector<float>& lastBlock() const { return block_; }

private:
    int rate_;
    int channels_;
    bool running_ = false;
    RenderCallback callback_;
    std::vector<float> block_;
};

//==============================================================================
// Signals
//==============================================================================

inline std::vector<float> makeTone(float freq_hz, int rate, int duration_ms, float amplitude) {
    const size_t n = (size_t)rate * (size_t)duration_ms / 1000;
    std::vector<float> out(n);
    for (size_t i = 0; i < n; i++) {
        out[i] = amplitude * (float)std::sin(2.0 * 3.14159265358979323846 * freq_hz * (double)i / rate);
    }
    return out;
}

inline std::vector<float> makeSilence(int rate, int duration_ms) {
    return std::vector<float>((size_t)rate * (size_t)duration_ms / 1000, 0.0f);
}
