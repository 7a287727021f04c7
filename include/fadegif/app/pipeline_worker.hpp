#pragma once

#include <fadegif/core/error.hpp>
#include <fadegif/core/pipeline_config.hpp>
#include <fadegif/core/pipeline_result.hpp>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace fadegif::app {

enum class WorkerState : std::uint8_t {
  Idle,
  Running,
  Completed,
  Failed,
  Cancelled,
};

/// Callbacks run on the worker thread (the caller's thread for run()).
/// Any may be empty.
struct PipelineCallbacks {
  /// After each source image: (images processed, images total).
  std::function<void(std::size_t, std::size_t)> on_progress;
  std::function<void(const std::filesystem::path&, std::size_t frame_count)> on_complete;
  std::function<void(fadegif::core::PipelineError, const std::string&)> on_error;
  std::function<void()> on_cancelled;
};

/// Turns an ordered list of images into one fading GIF.
///
/// Frames are streamed to the encoder: at most the previous and current base
/// frames plus one pair's fade frames are in memory. Cancellation is checked
/// between images; a cancelled or failed run leaves no output file, preview
/// included (the preview is written only once the GIF is complete).
/// Exactly one of on_complete, on_error, on_cancelled fires per run.
class PipelineWorker {
 public:
  PipelineWorker(fadegif::core::PipelineConfig config,
                 std::vector<std::filesystem::path> images,
                 std::filesystem::path output,
                 PipelineCallbacks callbacks = {});
  ~PipelineWorker();

  PipelineWorker(const PipelineWorker&) = delete;
  PipelineWorker& operator=(const PipelineWorker&) = delete;

  /// Run on a background thread. std::logic_error unless Idle.
  void start();

  /// Run on the calling thread. std::logic_error unless Idle.
  fadegif::core::PipelineResult run();

  /// Join the background thread and return the run's result.
  fadegif::core::PipelineResult wait();

  /// Request cancellation; takes effect at the next image boundary.
  void cancel() noexcept { cancel_requested_.store(true); }

  [[nodiscard]] WorkerState state() const noexcept { return state_.load(); }

 private:
  void claim();
  fadegif::core::PipelineResult execute();
  /// execute() with escaping exceptions reported as Encoding errors.
  fadegif::core::PipelineResult execute_guarded();
  fadegif::core::PipelineResult finish_run(fadegif::core::PipelineResult result);

  fadegif::core::PipelineConfig config_;
  std::vector<std::filesystem::path> images_;
  std::filesystem::path output_;
  PipelineCallbacks callbacks_;

  std::atomic<WorkerState> state_{WorkerState::Idle};
  std::atomic<bool> cancel_requested_{false};
  std::thread thread_;
  std::optional<fadegif::core::PipelineResult> result_;
};

}  // namespace fadegif::app
