#include "log.hpp"
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <system_error>
#include <unordered_map>
#include <vector>
#include <zlib.h>

#include <spdlog/details/os.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace {

namespace fs = std::filesystem;

constexpr const char *kRootLogger = "sgf";
constexpr std::size_t kMaxLogFileSize = 1024 * 1024 * 5;

std::weak_ptr<spdlog::logger> g_logger;
std::mutex g_logger_mutex;

/**
 * Path of the rotated file with the given index, following spdlog's
 * `name.N.ext` convention. Index zero is the live file.
 */
fs::path rotated_path(const fs::path &base, std::size_t index) {
  if (index == 0) {
    return base;
  }
  fs::path stem = base.stem();
  fs::path ext = base.extension();
  fs::path name = stem;
  name += "." + std::to_string(index);
  name += ext;
  return base.parent_path() / name;
}

fs::path gz_path(const fs::path &path) {
  fs::path out = path;
  out += ".gz";
  return out;
}

/// Gzip @p path into `<path>.gz` and remove the original on success.
bool gzip_file(const fs::path &path) {
  std::ifstream input(path, std::ios::binary);
  if (!input) {
    return false;
  }
  const fs::path target = gz_path(path);
  gzFile gz = gzopen(target.string().c_str(), "wb");
  if (gz == nullptr) {
    return false;
  }
  std::vector<char> buffer(16 * 1024);
  bool ok = true;
  while (ok && input) {
    input.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
    const std::streamsize n = input.gcount();
    if (n > 0 && gzwrite(gz, buffer.data(), static_cast<unsigned>(n)) != n) {
      ok = false;
    }
  }
  gzclose(gz);
  input.close();
  std::error_code ec;
  if (!ok) {
    fs::remove(target, ec);
    return false;
  }
  fs::remove(path, ec);
  return true;
}

/**
 * Shift previously compressed rotations up by one slot and compress the file
 * spdlog just rotated into slot one.
 */
void compress_rotations(const fs::path &base, std::size_t max_files) {
  std::error_code ec;
  fs::remove(gz_path(rotated_path(base, max_files)), ec);
  for (std::size_t i = max_files; i > 1; --i) {
    const fs::path from = gz_path(rotated_path(base, i - 1));
    if (fs::exists(from, ec)) {
      fs::rename(from, gz_path(rotated_path(base, i)), ec);
    }
  }
  const fs::path newest = rotated_path(base, 1);
  // Runs under the file sink's lock, so failures cannot go through spdlog.
  if (fs::exists(newest, ec) && !gzip_file(newest)) {
    std::cerr << "Failed to compress rotated log " << newest.string() << '\n';
  }
}

std::vector<spdlog::sink_ptr> make_sinks(const std::string &file,
                                         std::size_t rotate_files,
                                         bool compress) {
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
  if (compress) {
    handlers.before_open = [rotate_files](const spdlog::filename_t &name) {
      compress_rotations(fs::path(spdlog::details::os::filename_to_str(name)),
                         rotate_files);
    };
  }
  sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
      file, kMaxLogFileSize, rotate_files, false, handlers));
  return sinks;
}

} // namespace

namespace sgf {

void init_logger(spdlog::level::level_enum level, const std::string &pattern,
                 const std::string &file, std::size_t rotate_files,
                 bool compress_rotations) {
  std::unique_lock<std::mutex> lock(g_logger_mutex);
  auto logger = spdlog::get(kRootLogger);
  if (!logger || !file.empty()) {
    if (logger) {
      spdlog::drop(kRootLogger);
    }
    auto sinks = make_sinks(file, rotate_files, compress_rotations);
    logger = std::make_shared<spdlog::logger>(kRootLogger, sinks.begin(),
                                              sinks.end());
    spdlog::set_default_logger(logger);
    g_logger = logger;
  }
  lock.unlock();
  const std::string prefix = std::string(kRootLogger) + ".";
  spdlog::apply_all([&](const std::shared_ptr<spdlog::logger> &l) {
    if (l->name().rfind(prefix, 0) == 0) {
      l->sinks() = logger->sinks();
      l->set_level(level);
    }
  });
  logger->set_level(level);
  logger->flush_on(spdlog::level::warn);
  if (!pattern.empty()) {
    spdlog::set_pattern(pattern);
  }
  logger->debug("Logger initialised (level={}, file='{}', rotate={}, "
                "compress={})",
                spdlog::level::to_string_view(level), file, rotate_files,
                compress_rotations);
}

void ensure_default_logger() {
  auto locked = g_logger.lock();
  if (!locked || spdlog::default_logger().get() != locked.get()) {
    init_logger(spdlog::level::info);
  }
}

std::shared_ptr<spdlog::logger> category_logger(const std::string &category) {
  const std::string name = std::string(kRootLogger) + "." + category;
  std::unique_lock<std::mutex> lock(g_logger_mutex);
  if (auto existing = spdlog::get(name)) {
    return existing;
  }
  auto root = g_logger.lock();
  if (!root) {
    lock.unlock();
    init_logger(spdlog::level::info);
    lock.lock();
    root = g_logger.lock();
  }
  auto logger = std::make_shared<spdlog::logger>(name, root->sinks().begin(),
                                                 root->sinks().end());
  logger->set_level(root->level());
  logger->flush_on(spdlog::level::warn);
  spdlog::register_logger(logger);
  return logger;
}

void configure_log_categories(
    const std::unordered_map<std::string, spdlog::level::level_enum>
        &overrides) {
  for (const auto &[category, level] : overrides) {
    category_logger(category)->set_level(level);
  }
  if (!overrides.empty()) {
    category_logger("logging")->debug("Applied {} log category override(s)",
                                      overrides.size());
  }
}

} // namespace sgf
