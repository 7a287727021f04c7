#include <fadegif/app/pipeline_worker.hpp>
#include <fadegif/app/config.hpp>
#include <fadegif/gif/gif_writer.hpp>
#include <fadegif/gif/quantizer.hpp>
#include <fadegif/imaging/color_management.hpp>
#include <fadegif/imaging/fade_interpolator.hpp>
#include <fadegif/imaging/frame_builder.hpp>
#include <fadegif/imaging/image_io.hpp>
#include <fadegif/imaging/source_image.hpp>
#include <exception>
#include <filesystem>
#include <new>
#include <optional>
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>
#include <variant>

#ifdef FADEGIF_HAS_TBB
#include <tbb/blocked_range.h>
#include <tbb/parallel_for.h>
#endif

namespace fadegif::app {

namespace fc = fadegif::core;

namespace {

fc::Error cancelled_error() {
  return fc::Error{fc::PipelineError::Cancelled, "cancelled by request"};
}

/// Quantize and write the fade frames between prev and next, in order.
std::expected<void, fc::Error> write_fades(const fc::Frame& prev,
                                           const fc::Frame& next,
                                           const fc::PipelineConfig& config,
                                           const gif::Quantizer& quantizer,
                                           const fc::Palette* shared_palette,
                                           gif::GifWriter& writer) {
#ifdef FADEGIF_HAS_TBB
  auto fades = imaging::interpolate(prev, next, config.fade_steps, config.fade_duration_ms);
  if (!fades) return std::unexpected(std::move(fades.error()));

  const std::size_t n = fades->size();
  std::vector<std::optional<std::expected<fc::IndexedFrame, fc::Error>>> indexed(n);
  tbb::parallel_for(
      tbb::blocked_range<std::size_t>(0, n),
      [&](const tbb::blocked_range<std::size_t>& range) {
        for (std::size_t i = range.begin(); i != range.end(); ++i) {
          indexed[i] = quantizer.quantize((*fades)[i], shared_palette);
        }
      });
  fades->clear();

  for (auto& frame : indexed) {
    if (!*frame) return std::unexpected(std::move(frame->error()));
    if (auto written = writer.write(**frame); !written) return written;
  }
  return {};
#else
  return imaging::for_each_fade_frame(
      prev, next, config.fade_steps, config.fade_duration_ms,
      [&](fc::Frame fade) -> std::expected<void, fc::Error> {
        auto indexed = quantizer.quantize(fade, shared_palette);
        if (!indexed) return std::unexpected(std::move(indexed.error()));
        return writer.write(*indexed);
      });
#endif
}

}  // namespace

PipelineWorker::PipelineWorker(fc::PipelineConfig config,
                               std::vector<std::filesystem::path> images,
                               std::filesystem::path output,
                               PipelineCallbacks callbacks)
    : config_(std::move(config)),
      images_(std::move(images)),
      output_(std::move(output)),
      callbacks_(std::move(callbacks)) {}

PipelineWorker::~PipelineWorker() {
  cancel();
  if (thread_.joinable()) thread_.join();
}

void PipelineWorker::claim() {
  WorkerState expected = WorkerState::Idle;
  if (!state_.compare_exchange_strong(expected, WorkerState::Running)) {
    throw std::logic_error("PipelineWorker can only be started once");
  }
}

void PipelineWorker::start() {
  claim();
  thread_ = std::thread([this] { result_ = finish_run(execute_guarded()); });
}

fc::PipelineResult PipelineWorker::run() {
  claim();
  result_ = finish_run(execute_guarded());
  return *result_;
}

fc::PipelineResult PipelineWorker::execute_guarded() {
  try {
    return execute();
  } catch (const std::bad_alloc&) {
    return std::unexpected(fc::Error{fc::PipelineError::Encoding,
                                     "out of memory building " + output_.string()});
  } catch (const std::exception& e) {
    return std::unexpected(fc::Error{fc::PipelineError::Encoding,
                                     "failed building " + output_.string() + ": " + e.what()});
  }
}

fc::PipelineResult PipelineWorker::wait() {
  if (thread_.joinable()) thread_.join();
  if (!result_) {
    return std::unexpected(fc::Error{fc::PipelineError::InvalidConfig, "worker was never started"});
  }
  return *result_;
}

fc::PipelineResult PipelineWorker::finish_run(fc::PipelineResult result) {
  if (result) {
    state_.store(WorkerState::Completed);
    if (callbacks_.on_complete) callbacks_.on_complete(result->output_path, result->frame_count);
  } else if (result.error().kind == fc::PipelineError::Cancelled) {
    state_.store(WorkerState::Cancelled);
    if (callbacks_.on_cancelled) callbacks_.on_cancelled();
  } else {
    state_.store(WorkerState::Failed);
    if (callbacks_.on_error) callbacks_.on_error(result.error().kind, result.error().message);
  }
  return result;
}

fc::PipelineResult PipelineWorker::execute() {
  if (auto valid = validate_config(config_); !valid) {
    return std::unexpected(std::move(valid.error()));
  }
  if (images_.empty()) {
    return std::unexpected(fc::Error{fc::PipelineError::EmptyInput, "no input images"});
  }

  const auto canvas = imaging::resolve_canvas(config_, images_);
  if (!canvas) return std::unexpected(std::move(canvas.error()));

  const gif::Quantizer quantizer(config_);
  // Removes its partial file on every early return.
  gif::GifWriter writer;
  imaging::FrameBuilder builder(config_, *canvas);
  std::optional<fc::Palette> global_palette;
  std::optional<fc::Frame> previous;
  std::optional<fc::Frame> preview;
  const std::size_t total = images_.size();

  for (std::size_t i = 0; i < total; ++i) {
    if (cancel_requested_.load()) return std::unexpected(cancelled_error());

    imaging::SourceImage source(images_[i]);
    auto base = builder.build(source);
    if (!base) return std::unexpected(std::move(base.error()));

    if (i == 0) {
      if (config_.preview_path) preview = *base;
      if (const auto* global = std::get_if<fc::GlobalPalette>(&config_.palette_mode)) {
        if (global->palette) {
          global_palette = global->palette;
        } else {
          auto built = quantizer.build_palette(*base);
          if (!built) return std::unexpected(std::move(built.error()));
          global_palette = std::move(*built);
        }
      }

      gif::GifStreamOptions options;
      options.global_palette = global_palette;
      // Every frame is sRGB after loading; say so when the source declared a profile.
      if (source.metadata().profile == imaging::ColorProfile::Embedded) {
        options.icc_profile = imaging::srgb_icc_profile();
      }
      options.optimize = config_.optimize;
      if (auto opened = writer.open(output_, canvas->width, canvas->height, std::move(options));
          !opened) {
        return std::unexpected(std::move(opened.error()));
      }
    }

    const fc::Palette* shared = global_palette ? &*global_palette : nullptr;
    if (previous) {
      if (auto fades = write_fades(*previous, *base, config_, quantizer, shared, writer); !fades) {
        return std::unexpected(std::move(fades.error()));
      }
    }

    auto indexed = quantizer.quantize(*base, shared);
    if (!indexed) return std::unexpected(std::move(indexed.error()));
    indexed->is_hold = true;
    if (auto written = writer.write(*indexed); !written) {
      return std::unexpected(std::move(written.error()));
    }

    source.release();
    previous = std::move(*base);
    if (callbacks_.on_progress) callbacks_.on_progress(i + 1, total);
  }

  auto result = writer.finish();
  if (!result || !preview) return result;

  if (auto written = imaging::write_jpeg(*preview, *config_.preview_path, config_.jpeg_quality);
      !written) {
    std::error_code ec;
    std::filesystem::remove(result->output_path, ec);
    return std::unexpected(std::move(written.error()));
  }
  return result;
}

}  // namespace fadegif::app
