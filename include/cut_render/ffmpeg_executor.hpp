/**
 * @file ffmpeg_executor.hpp
 * @brief Codec engine: runs one filter_complex encode
 *
 * @details The orchestrator talks to a CodecEngine; FfmpegEngine is the
 *          production implementation and spawns the ffmpeg binary. Tests
 *          substitute a fake engine.
 */

#ifndef CUT_RENDER_FFMPEG_EXECUTOR_HPP
#define CUT_RENDER_FFMPEG_EXECUTOR_HPP

#include <string>
#include <vector>

#include "config.hpp"
#include "errors.hpp"
#include "system.hpp"
#include "types.hpp"

namespace cut_render {

/**
 * @struct EncodeJob
 * @brief One encode: a source, a compiled graph and an output path.
 */
struct EncodeJob {
  std::string source_path;
  std::string output_path;
  FilterGraph graph;
};

/**
 * @brief Build the ffmpeg argument vector (without the program name).
 *
 * @details `-y -hide_banner -loglevel error -i SRC -filter_complex GRAPH
 *          -map VOUT -map AOUT -r FPS -c:v CODEC -preset P -crf C
 *          -c:a ACODEC -b:a ABR -threads T OUT`
 *
 * @note threads == 0 in the config is resolved to the CPU limit.
 */
std::vector<std::string> build_encode_args(const EncodeJob &job,
                                           const RenderConfig &config);

/**
 * @class CodecEngine
 * @brief Executes an encode job to completion.
 */
class CodecEngine {
public:
  virtual ~CodecEngine() = default;

  /**
   * @return Ok once the output file is complete, CodecExecutionFailed
   *         otherwise. A failed encode leaves no file behind.
   */
  virtual Status encode(const EncodeJob &job, const RenderConfig &config,
                        const CancellationToken &cancel) = 0;
};

/**
 * @class FfmpegEngine
 * @brief CodecEngine backed by the ffmpeg CLI (RenderConfig::ffmpeg_path).
 */
class FfmpegEngine : public CodecEngine {
public:
  /// @param log_prefix Prepended to log lines, e.g. "[Job 3] " (may be empty)
  explicit FfmpegEngine(std::string log_prefix = "");

  Status encode(const EncodeJob &job, const RenderConfig &config,
                const CancellationToken &cancel) override;

private:
  std::string prefix_;
};

} // namespace cut_render

#endif // CUT_RENDER_FFMPEG_EXECUTOR_HPP
