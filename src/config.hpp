#pragma once

// opus frame(ms) used by the peripheral: 60, one frame per notification

namespace config {
// audio format
constexpr auto sample_rate        = 16000; // Hz
constexpr auto frame_ms           = 60;
constexpr auto frame_samples      = sample_rate * frame_ms / 1000;
constexpr auto device_header_size = 3;     // sequence/metadata prefix of every raw frame

// peripheral link
constexpr auto max_retry_attempts        = 3;
constexpr auto retry_delay_ms            = 2000;
constexpr auto connect_timeout_ms        = 10000;
constexpr auto audio_characteristic_uuid = "19B10001-E8F2-537E-4F6C-D104768A1214";

// delivery
constexpr auto queue_capacity            = 1000;
constexpr auto retry_interval_ms         = 5000;
constexpr auto offline_probe_multiplier  = 2;
constexpr auto offline_failure_threshold = 3;
constexpr auto persisted_batch_size      = 5;
constexpr auto worker_join_timeout_ms    = 2000;
constexpr auto default_storage_dir       = "audio_cache";

// networking
constexpr auto default_backend_url   = "http://localhost:3000";
constexpr auto audio_stream_endpoint = "/stream/audio";
constexpr auto http_timeout_ms       = 5000; // each of connect, send and receive
constexpr auto max_response_header   = 4096;

// pipeline
// holds the frames captured while sends time out on the way to offline mode
constexpr auto frame_channel_slots = offline_failure_threshold * 3 * http_timeout_ms / frame_ms + 1;
} // namespace config
