#pragma once

/**
 * @file constants.h
 * @brief System-wide constants and tuning parameters
 *
 * Defaults for everything the config file can override live here.
 */

namespace live_relay {
namespace constants {

// =============================================================================
// Capture Constants
// =============================================================================

namespace capture {
    /// Delay between camera/screen frames (ms)
    constexpr int FRAME_INTERVAL_MS = 1000;

    /// Camera frames are thumbnailed to fit within this square (px)
    constexpr int CAMERA_MAX_DIMENSION = 1024;

    /// Screen frames are resized to this width, aspect preserved (px)
    constexpr int SCREEN_MAX_WIDTH = 640;

    /// JPEG quality for encoded frames (0-100)
    constexpr int JPEG_QUALITY = 75;
}

// =============================================================================
// Pipeline Constants
// =============================================================================

namespace pipeline {
    /// Granularity of stop-flag checks inside blocking reads (ms)
    constexpr int POLL_SLICE_MS = 100;

    /// Substituted for an empty operator message so the turn still completes
    constexpr const char* EMPTY_TURN_TEXT = ".";
}

// =============================================================================
// Session Constants
// =============================================================================

namespace session {
    constexpr const char* DEFAULT_MODEL = "models/gemini-2.0-flash-exp";

    constexpr const char* DEFAULT_ENDPOINT =
        "wss://generativelanguage.googleapis.com/ws/"
        "google.ai.generativelanguage.v1beta.GenerativeService.BidiGenerateContent";

    constexpr const char* API_KEY_ENV = "GEMINI_API_KEY";

    /// Time allowed for the websocket upgrade and setupComplete (ms)
    constexpr int CONNECT_TIMEOUT_MS = 15000;

    /// Longest a single outgoing frame may wait on a full socket (ms)
    constexpr int SEND_TIMEOUT_MS = 10000;

    /// Budget for the close frame during shutdown (ms)
    constexpr int CLOSE_TIMEOUT_MS = 1000;
}

// =============================================================================
// Tool Host (MCP) Constants
// =============================================================================

namespace mcp {
    constexpr const char* PROTOCOL_VERSION = "2024-11-05";

    /// Per-request response timeout (ms)
    constexpr int REQUEST_TIMEOUT_MS = 30000;

    /// Grace period between SIGTERM and SIGKILL on disconnect (ms)
    constexpr int SHUTDOWN_GRACE_MS = 5000;

    /// Worker threads for controller tool calls
    constexpr int MAX_CONCURRENT_CALLS = 2;
}

// =============================================================================
// Controller Constants
// =============================================================================

namespace controller {
    constexpr const char* TRANSCRIPTION_PROMPT =
        "Please transcribe this audio to text. Only return the transcribed text, nothing else: ";

    constexpr const char* DEFAULT_START_MODE = "screen";
}

} // namespace constants
} // namespace live_relay
