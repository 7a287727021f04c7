/**
 * fadegif-cli: build a looping GIF that holds each image and cross-fades to the next.
 * Build: cmake -B build && cmake --build build
 * Run:   ./build/fadegif_cli [options] image1.png image2.jpg ...
 * Ctrl-C cancels at the next image boundary; no partial GIF is left behind.
 */

#include <fadegif/app/config.hpp>
#include <fadegif/app/pipeline_worker.hpp>
#include <fadegif/core/error.hpp>
#include <fadegif/imaging/image_io.hpp>

#include <atomic>
#include <chrono>
#include <csignal>
#include <expected>
#include <filesystem>
#include <iostream>
#include <string>
#include <string_view>
#include <thread>
#include <utility>
#include <vector>

namespace {

std::atomic<bool> g_interrupted{false};

void on_sigint(int) { g_interrupted.store(true); }

void print_usage() {
  std::cout << "Usage: fadegif_cli [options] image...\n"
            << "  --config <path>        Settings file (key=value); flags override it\n"
            << "  --output <path>        Output GIF (default: fade.gif)\n"
            << "  --steps <n>            Fade frames per transition, 5-50 (default 15)\n"
            << "  --hold <ms>            Hold per image, 100-5000 (default 1000)\n"
            << "  --fade <ms>            Duration of each transition, 10-500 (default 50)\n"
            << "  --canvas <WxH>         Output size (default 1920x1080)\n"
            << "  --preserve             Size the canvas to the largest image instead of --canvas\n"
            << "  --resample <name>      lanczos | bicubic | bilinear | nearest\n"
            << "  --quantize <name>      median-cut | max-coverage | octree\n"
            << "  --dither <name>        floyd-steinberg | ordered | none\n"
            << "  --global-palette       One palette for the whole GIF\n"
            << "  --sharpen <s>          Unsharp mask strength, 0.0-2.0\n"
            << "  --crop <l,t,r,b>       Crop rectangle in source pixels\n"
            << "  --crop-preset <ratio>  16:9 | 4:3 | 1:1 | 9:16 | 21:9\n"
            << "  --quality <q>          Preview JPEG quality, 50-100\n"
            << "  --no-optimize          Keep full local color tables\n"
            << "  --preview <path>       Also write the first frame as JPEG\n";
}

/// Flags that map one-to-one onto config keys.
const std::vector<std::pair<std::string_view, std::string_view>> kValueFlags = {
    {"--steps", "fade_steps"},     {"--hold", "hold_ms"},       {"--fade", "fade_ms"},
    {"--resample", "resampling"},  {"--quantize", "quantize"},  {"--dither", "dither"},
    {"--sharpen", "sharpen"},      {"--crop", "crop"},          {"--crop-preset", "crop_preset"},
    {"--quality", "quality"},      {"--preview", "preview"},
};

}  // namespace

int main(int argc, char* argv[]) {
  std::string config_path;
  std::filesystem::path output("fade.gif");
  std::vector<std::pair<std::string, std::string>> overrides;
  std::vector<std::filesystem::path> images;

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--help" || arg == "-h") {
      print_usage();
      return 0;
    }
    if (arg == "--config" && i + 1 < argc) {
      config_path = argv[++i];
    } else if (arg == "--output" && i + 1 < argc) {
      output = argv[++i];
    } else if (arg == "--canvas" && i + 1 < argc) {
      const std::string size = argv[++i];
      const auto x = size.find('x');
      if (x == std::string::npos) {
        std::cerr << "Invalid --canvas " << size << " (expected WxH)\n";
        return 1;
      }
      overrides.emplace_back("canvas_width", size.substr(0, x));
      overrides.emplace_back("canvas_height", size.substr(x + 1));
    } else if (arg == "--preserve") {
      overrides.emplace_back("preserve_original", "true");
    } else if (arg == "--global-palette") {
      overrides.emplace_back("palette", "global");
    } else if (arg == "--no-optimize") {
      overrides.emplace_back("optimize", "false");
    } else if (arg.starts_with("--")) {
      bool matched = false;
      for (const auto& [flag, key] : kValueFlags) {
        if (arg == flag && i + 1 < argc) {
          overrides.emplace_back(std::string(key), argv[++i]);
          matched = true;
          break;
        }
      }
      if (!matched) {
        std::cerr << "Unknown or incomplete option " << arg << " (see --help)\n";
        return 1;
      }
    } else {
      images.emplace_back(arg);
    }
  }

  std::expected<fadegif::app::PipelineConfig, fadegif::core::Error> cfg =
      fadegif::app::default_config();
  if (!config_path.empty()) cfg = fadegif::app::load_config(config_path);
  if (!cfg) {
    std::cerr << "Config error: " << cfg.error().message << "\n";
    return 1;
  }
  for (const auto& [key, value] : overrides) {
    if (auto applied = fadegif::app::apply_setting(*cfg, key, value); !applied) {
      std::cerr << "Config error: " << applied.error().message << "\n";
      return 1;
    }
  }

  if (images.empty()) {
    std::cerr << "No input images (see --help)\n";
    return 1;
  }
  for (const auto& image : images) {
    if (!fadegif::imaging::is_supported_extension(image)) {
      std::cerr << "Warning: " << image.string() << " has an unrecognized extension\n";
    }
  }

  int exit_code = 1;
  fadegif::app::PipelineCallbacks callbacks;
  callbacks.on_progress = [](std::size_t done, std::size_t total) {
    std::cerr << "[" << done << "/" << total << "] images processed\n";
  };
  callbacks.on_complete = [&exit_code](const std::filesystem::path& path, std::size_t frames) {
    std::cout << "Wrote " << path.string() << " (" << frames << " frames)\n";
    exit_code = 0;
  };
  callbacks.on_error = [&exit_code](fadegif::core::PipelineError kind, const std::string& message) {
    std::cerr << "Error (" << fadegif::core::to_string(kind) << "): " << message << "\n";
    exit_code = 1;
  };
  callbacks.on_cancelled = [&exit_code]() {
    std::cerr << "Cancelled\n";
    exit_code = 130;
  };

  std::signal(SIGINT, on_sigint);

  fadegif::app::PipelineWorker worker(std::move(*cfg), std::move(images), output,
                                      std::move(callbacks));
  worker.start();
  while (worker.state() == fadegif::app::WorkerState::Running) {
    if (g_interrupted.load()) worker.cancel();
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
  }
  worker.wait();
  return exit_code;
}
