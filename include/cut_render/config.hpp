/**
 * @file config.hpp
 * @brief Render configuration and its environment-variable front-end
 *
 * @details RenderConfig is the explicit configuration passed into
 *          Composer::compose(). The Config namespace provides lazy,
 *          memoized readers for the environment variables that the CLI
 *          uses to fill a RenderConfig; library code never reads the
 *          environment itself.
 *
 */

#ifndef CUT_RENDER_CONFIG_HPP
#define CUT_RENDER_CONFIG_HPP

#include <cstdint>
#include <cstdlib>
#include <string>

#include "types.hpp"

namespace cut_render {

/**
 * @struct RenderConfig
 * @brief Encode options and transition settings for one compose() call.
 */
struct RenderConfig {
  std::string preset = "fast";
  int crf = 20;
  int frame_rate = 30;
  int threads = 2; //< 0 = cgroup-aware CPU limit
  std::string video_codec = "libx264";
  std::string audio_codec = "aac";
  std::string audio_bitrate = "192k";

  bool transitions_enabled = false;
  TimeMs transition_duration_ms = DEFAULT_TRANSITION_MS;
  TimeMs audio_fade_ms = DEFAULT_TRANSITION_MS;

  /// See TrimOptions::last_segment_by_duration
  bool last_segment_by_duration = true;

  std::string ffmpeg_path = "ffmpeg";
  int encode_timeout_sec = 0; //< 0 = no timeout

  TransitionConfig transition() const {
    return {transition_duration_ms, audio_fade_ms};
  }
};

namespace Config {

/**
 * @brief Get a string value from environment variable.
 * @param name Environment variable name
 * @param default_val Default value if not set or empty
 * @return Value or default
 */
inline std::string get_env_string(const char *name, const char *default_val) {
  const char *val = std::getenv(name);
  return (val && *val) ? std::string(val) : std::string(default_val);
}

/**
 * @brief Get an integer value from environment variable.
 * @param name Environment variable name
 * @param default_val Default value if not set
 * @return Parsed integer value or default
 * @throw std::invalid_argument if the value is not a number
 */
inline int get_env_int(const char *name, int default_val) {
  const char *val = std::getenv(name);
  return (val && *val) ? std::stoi(val) : default_val;
}

/**
 * @brief Get a boolean from environment variable ("true"/"1" are true).
 */
inline bool get_env_bool(const char *name, bool default_val) {
  const char *val = std::getenv(name);
  if (!val || !*val)
    return default_val;
  std::string s(val);
  return s == "true" || s == "1" || s == "TRUE" || s == "yes";
}

/// x264 speed/quality preset
inline std::string preset() {
  static std::string val = get_env_string("RENDER_PRESET", "fast");
  return val;
}

/// Constant rate factor
inline int crf() {
  static int val = get_env_int("RENDER_CRF", 20);
  return val;
}

/// Output frame rate
inline int fps() {
  static int val = get_env_int("RENDER_FPS", 30);
  return val;
}

/// Encoder threads (0 = detect_cpu_limit())
inline int threads() {
  static int val = get_env_int("RENDER_THREADS", 2);
  return val;
}

inline std::string audio_codec() {
  static std::string val = get_env_string("RENDER_AUDIO_CODEC", "aac");
  return val;
}

inline std::string audio_bitrate() {
  static std::string val = get_env_string("RENDER_AUDIO_BITRATE", "192k");
  return val;
}

// **---- TRANSITIONS ----**

inline bool transitions_enabled() {
  static bool val = get_env_bool("TRANSITIONS_ENABLED", false);
  return val;
}

/// Crossfade duration, must lie in (0, 5000]
inline int transition_duration_ms() {
  static int val = get_env_int("TRANSITIONS_DURATION_MS", 300);
  return val;
}

/**
 * @brief Audio crossfade duration
 * @note Defaults to TRANSITIONS_DURATION_MS when unset
 */
inline int audio_fade_ms() {
  static int val =
      get_env_int("TRANSITIONS_AUDIO_FADE_MS", transition_duration_ms());
  return val;
}

// **---- EXECUTION ----**

inline std::string ffmpeg_path() {
  static std::string val = get_env_string("FFMPEG_PATH", "ffmpeg");
  return val;
}

/// Encode timeout in seconds (0 = wait indefinitely)
inline int encode_timeout_sec() {
  static int val = get_env_int("ENCODE_TIMEOUT_SEC", 0);
  return val;
}

inline bool last_segment_by_duration() {
  static bool val = get_env_bool("LAST_SEGMENT_BY_DURATION", true);
  return val;
}

/**
 * @brief Assemble a RenderConfig from the environment.
 */
inline RenderConfig render_config() {
  RenderConfig cfg;
  cfg.preset = preset();
  cfg.crf = crf();
  cfg.frame_rate = fps();
  cfg.threads = threads();
  cfg.audio_codec = audio_codec();
  cfg.audio_bitrate = audio_bitrate();
  cfg.transitions_enabled = transitions_enabled();
  cfg.transition_duration_ms = transition_duration_ms();
  cfg.audio_fade_ms = audio_fade_ms();
  cfg.last_segment_by_duration = last_segment_by_duration();
  cfg.ffmpeg_path = ffmpeg_path();
  cfg.encode_timeout_sec = encode_timeout_sec();
  return cfg;
}

} // namespace Config
} // namespace cut_render

#endif // CUT_RENDER_CONFIG_HPP
