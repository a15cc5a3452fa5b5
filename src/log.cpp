#include "log.hpp"
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <memory>
#include <mutex>
#include <string>
#include <system_error>
#include <unordered_map>
#include <vector>
#include <zlib.h>

#include <spdlog/async.h>
#include <spdlog/async_logger.h>
#include <spdlog/details/os.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/dist_sink.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace {
constexpr const char *kRootLoggerName = "prw";
constexpr std::size_t kMaxLogFileSize = 1024 * 1024 * 5;

std::weak_ptr<spdlog::logger> g_logger;
std::shared_ptr<spdlog::sinks::dist_sink_mt> g_root_sink;
std::mutex g_logger_mutex;

/// Caller must hold g_logger_mutex.
std::shared_ptr<spdlog::details::thread_pool> shared_pool() {
  auto pool = spdlog::thread_pool();
  if (!pool) {
    constexpr std::size_t queue_size = 8192;
    constexpr std::size_t num_threads = 1;
    spdlog::init_thread_pool(queue_size, num_threads);
    pool = spdlog::thread_pool();
  }
  return pool;
}

/// Caller must hold g_logger_mutex.
std::shared_ptr<spdlog::sinks::dist_sink_mt> root_sink() {
  if (!g_root_sink) {
    g_root_sink = std::make_shared<spdlog::sinks::dist_sink_mt>();
    g_root_sink->add_sink(
        std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
  }
  return g_root_sink;
}

namespace fs = std::filesystem;

/**
 * Compute the filesystem path for a rotated log file.
 *
 * `prw.log` rotated once becomes `prw.1.log`, matching the naming used by
 * spdlog's rotating sink.
 *
 * @param base Base log file path.
 * @param index Rotation index to compute.
 * @return Filesystem path pointing to the rotated file.
 */
fs::path calc_rotated_path(const std::string &base, std::size_t index) {
  fs::path base_path(base);
  if (index == 0) {
    return base_path;
  }
  fs::path stem = base_path.stem();
  fs::path ext = base_path.extension();
  if (stem.empty()) {
    stem = base_path.filename();
    ext.clear();
  }
  std::string rotated =
      stem.string() + "." + std::to_string(index) + ext.string();
  return base_path.parent_path() / rotated;
}

/**
 * Shift compressed archives one slot up, dropping the oldest.
 *
 * @param base Base log file path.
 * @param max_files Maximum number of compressed files to retain.
 */
void rotate_compressed_logs(const std::string &base, std::size_t max_files) {
  if (max_files == 0) {
    return;
  }
  std::error_code ec;
  fs::remove(calc_rotated_path(base, max_files).string() + ".gz", ec);
  for (std::size_t i = max_files; i > 1; --i) {
    fs::path src_gz(calc_rotated_path(base, i - 1).string() + ".gz");
    if (!fs::exists(src_gz, ec)) {
      continue;
    }
    fs::path target_gz(calc_rotated_path(base, i).string() + ".gz");
    fs::remove(target_gz, ec);
    fs::rename(src_gz, target_gz, ec);
  }
}

/**
 * Compress a rotated log file into gzip format and remove the original.
 *
 * Runs inside the sink's file event hook, so failures are written straight
 * to stderr instead of going back through the logger that owns the sink.
 *
 * @param path Filesystem path to the log file to compress.
 * @return `true` if compression succeeded, otherwise `false`.
 */
bool compress_rotated_file(const std::string &path) {
  std::ifstream input(path, std::ios::binary);
  if (!input) {
    std::fprintf(stderr, "prw: cannot open %s for compression\n",
                 path.c_str());
    return false;
  }
  std::string compressed_path = path + ".gz";
  gzFile gz = gzopen(compressed_path.c_str(), "wb");
  if (!gz) {
    std::fprintf(stderr, "prw: cannot create %s\n", compressed_path.c_str());
    return false;
  }
  char buffer[16 * 1024];
  while (input) {
    input.read(buffer, sizeof(buffer));
    std::streamsize read = input.gcount();
    if (read > 0) {
      int written = gzwrite(gz, buffer, static_cast<unsigned>(read));
      if (written == 0 || written != read) {
        gzclose(gz);
        std::error_code ec;
        fs::remove(fs::path(compressed_path), ec);
        return false;
      }
    }
  }
  gzclose(gz);
  input.close();
  std::error_code ec;
  fs::remove(fs::path(path), ec);
  return !ec;
}

std::vector<spdlog::sink_ptr> make_sinks(const std::string &file,
                                         std::size_t rotate_files,
                                         bool compress_rotations) {
  std::vector<spdlog::sink_ptr> sinks;
  sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
  if (file.empty()) {
    return sinks;
  }
  if (rotate_files == 0) {
    sinks.push_back(
        std::make_shared<spdlog::sinks::basic_file_sink_mt>(file, false));
    return sinks;
  }
  spdlog::file_event_handlers handlers;
  if (compress_rotations) {
    handlers.before_open = [rotate_files](const spdlog::filename_t &filename) {
      const auto base = spdlog::details::os::filename_to_str(filename);
      rotate_compressed_logs(base, rotate_files);
      fs::path newest = calc_rotated_path(base, 1);
      std::error_code ec;
      if (fs::exists(newest, ec)) {
        compress_rotated_file(newest.string());
      }
    };
  }
  sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
      file, kMaxLogFileSize, rotate_files, false, handlers));
  return sinks;
}
} // namespace

namespace prw {

/**
 * Initialize the global spdlog logger with optional file rotation.
 *
 * Every logger writes through one shared distribution sink, so calling this
 * again swaps the destinations of the root and all category loggers.
 */
void init_logger(spdlog::level::level_enum level, const std::string &pattern,
                 const std::string &file, std::size_t rotate_files,
                 bool compress_rotations) {
  std::unique_lock<std::mutex> lock(g_logger_mutex);
  auto sink = root_sink();
  sink->set_sinks(make_sinks(file, rotate_files, compress_rotations));
  auto logger = spdlog::get(kRootLoggerName);
  if (!logger) {
    logger = std::make_shared<spdlog::async_logger>(
        kRootLoggerName, sink, shared_pool(),
        spdlog::async_overflow_policy::block);
    spdlog::set_default_logger(logger);
  }
  g_logger = logger;
  lock.unlock();
  spdlog::set_level(level);
  if (!pattern.empty()) {
    spdlog::set_pattern(pattern);
  }
  logger->debug(
      "Logger initialised (level={}, file='{}', rotate={}, compress={})",
      spdlog::level::to_string_view(level), file, rotate_files,
      compress_rotations ? "true" : "false");
}

void ensure_default_logger() {
  auto logger = spdlog::default_logger();
  auto locked = g_logger.lock();
  if (!logger || !locked || logger.get() != locked.get()) {
    init_logger(spdlog::level::info);
  }
}

std::shared_ptr<spdlog::logger> category_logger(const std::string &category) {
  if (!g_logger.lock()) {
    init_logger(spdlog::level::info);
  }
  const std::string name = std::string(kRootLoggerName) + "." + category;
  std::lock_guard<std::mutex> lock(g_logger_mutex);
  auto logger = spdlog::get(name);
  if (logger) {
    return logger;
  }
  auto root = g_logger.lock();
  auto new_logger = std::make_shared<spdlog::async_logger>(
      name, root_sink(), shared_pool(), spdlog::async_overflow_policy::block);
  new_logger->set_level(root ? root->level() : spdlog::level::info);
  spdlog::register_logger(new_logger);
  return new_logger;
}

void configure_log_categories(
    const std::unordered_map<std::string, spdlog::level::level_enum>
        &overrides) {
  if (overrides.empty()) {
    return;
  }
  for (const auto &[category, level] : overrides) {
    auto logger = category_logger(category);
    logger->set_level(level);
    logger->debug("Category '{}' set to level {}", category,
                  spdlog::level::to_string_view(level));
  }
  category_logger("logging")
      ->debug("Applied {} log category override(s)", overrides.size());
}

} // namespace prw
