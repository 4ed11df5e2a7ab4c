/**
 * @file process_engine.cpp
 * @brief ffmpeg child-process engine implementation
 */

#include "slide_reel/process_engine.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <system_error>

#include <fmt/core.h>

#include "slide_reel/logging.hpp"

namespace slide_reel {

namespace fs = std::filesystem;

namespace {

/// Global flags placed in front of every operation's arguments
constexpr const char *GLOBAL_FLAGS = "-y -hide_banner -nostdin -loglevel error";

/// Longest cause kept from encoder stderr
constexpr size_t MAX_CAUSE_LENGTH = 200;

/// Last non-empty line of a text file, trimmed to MAX_CAUSE_LENGTH
std::string last_line_of(const std::string &path) {
  std::ifstream f(path);
  std::string line, last;
  while (std::getline(f, line)) {
    if (line.find_first_not_of(" \t\r") != std::string::npos)
      last = line;
  }
  while (!last.empty() && (last.back() == '\r' || last.back() == ' '))
    last.pop_back();
  if (last.size() > MAX_CAUSE_LENGTH)
    last = last.substr(0, MAX_CAUSE_LENGTH) + "...";
  return last;
}

} // namespace

std::string shell_quote(const std::string &arg) {
  std::string out = "'";
  for (char c : arg) {
    if (c == '\'')
      out += "'\\''";
    else
      out += c;
  }
  out += "'";
  return out;
}

bool is_safe_name(const std::string &name) {
  return !name.empty() && name != "." && name != ".." &&
         name.find('/') == std::string::npos &&
         name.find('\0') == std::string::npos;
}

ProcessEngine::ProcessEngine(std::string workspace_root, std::string ffmpeg_path)
    : root_(std::move(workspace_root)), ffmpeg_(std::move(ffmpeg_path)) {}

std::string ProcessEngine::namespace_dir(const std::string &ns) const {
  return (fs::path(root_) / ns).string();
}

std::string ProcessEngine::blob_path(const std::string &ns,
                                     const std::string &name) const {
  return (fs::path(root_) / ns / name).string();
}

// **---- Lifecycle ----**

bool ProcessEngine::initialize() {
  if (initialized_)
    return true;

  std::error_code ec;
  fs::create_directories(root_, ec);
  if (ec) {
    LOG_ERROR("Cannot create workspace root {}: {}", root_, ec.message());
    return false;
  }

  std::string cmd = fmt::format("{} -hide_banner -version > /dev/null 2>&1",
                                shell_quote(ffmpeg_));
  int status = std::system(cmd.c_str());
  if (status != 0) {
    LOG_ERROR("Encoder not usable: {} (status {})", ffmpeg_, status);
    return false;
  }

  initialized_ = true;
  return true;
}

// **---- Namespaces ----**

bool ProcessEngine::create_namespace(const std::string &ns) {
  if (!is_safe_name(ns))
    return false;
  std::error_code ec;
  std::string dir = namespace_dir(ns);
  if (fs::exists(dir, ec)) {
    LOG_ERROR("Namespace already exists: {}", dir);
    return false;
  }
  if (!fs::create_directories(dir, ec) || ec) {
    LOG_ERROR("Cannot create namespace {}: {}", dir, ec.message());
    return false;
  }
  return true;
}

bool ProcessEngine::drop_namespace(const std::string &ns) {
  if (!is_safe_name(ns))
    return false;
  std::error_code ec;
  fs::remove_all(namespace_dir(ns), ec);
  if (ec) {
    LOG_ERROR("Cannot remove namespace {}: {}", namespace_dir(ns),
              ec.message());
    return false;
  }
  return true;
}

bool ProcessEngine::namespace_exists(const std::string &ns) const {
  std::error_code ec;
  return is_safe_name(ns) && fs::is_directory(namespace_dir(ns), ec);
}

// **---- Blobs ----**

bool ProcessEngine::write_blob(const std::string &ns, const std::string &name,
                               const Blob &data) {
  if (!is_safe_name(ns) || !is_safe_name(name) || !namespace_exists(ns))
    return false;

  std::string final_path = blob_path(ns, name);
  std::string temp_path = blob_path(ns, "." + name + ".partial");
  {
    std::ofstream out(temp_path, std::ios::binary | std::ios::trunc);
    if (!out) {
      LOG_ERROR("Cannot open {} for writing", temp_path);
      return false;
    }
    out.write(reinterpret_cast<const char *>(data.data()),
              static_cast<std::streamsize>(data.size()));
    out.flush();
    if (!out) {
      LOG_ERROR("Short write to {}", temp_path);
      std::error_code ignored;
      fs::remove(temp_path, ignored);
      return false;
    }
  }

  std::error_code ec;
  fs::rename(temp_path, final_path, ec);
  if (ec) {
    LOG_ERROR("Cannot move {} into place: {}", final_path, ec.message());
    std::error_code ignored;
    fs::remove(temp_path, ignored);
    return false;
  }
  return true;
}

bool ProcessEngine::read_blob(const std::string &ns, const std::string &name,
                              Blob &out) const {
  if (!is_safe_name(ns) || !is_safe_name(name))
    return false;
  std::ifstream in(blob_path(ns, name), std::ios::binary);
  if (!in)
    return false;
  out.assign(std::istreambuf_iterator<char>(in),
             std::istreambuf_iterator<char>());
  return !in.bad();
}

std::vector<std::string>
ProcessEngine::list_namespace(const std::string &ns) const {
  std::vector<std::string> names;
  if (!namespace_exists(ns))
    return names;
  std::error_code ec;
  for (fs::directory_iterator it(namespace_dir(ns), ec), end; !ec && it != end;
       it.increment(ec)) {
    names.push_back(it->path().filename().string());
  }
  return names;
}

bool ProcessEngine::delete_blob(const std::string &ns, const std::string &name) {
  if (!is_safe_name(ns) || !is_safe_name(name))
    return false;
  std::error_code ec;
  fs::remove(blob_path(ns, name), ec);
  return !ec;
}

// **---- Execution ----**

std::string ProcessEngine::build_command(const std::string &ns,
                                         const EncodeOperation &op) const {
  std::string args;
  args.reserve(1024);
  for (const auto &a : op.args) {
    args += ' ';
    args += shell_quote(a);
  }
  std::string log_path = blob_path(ns, "." + op.step + ".stderr");
  return fmt::format("cd {} && {} {}{} 2> {}", shell_quote(namespace_dir(ns)),
                     shell_quote(ffmpeg_), GLOBAL_FLAGS, args,
                     shell_quote(log_path));
}

ExecResult ProcessEngine::execute(const std::string &ns,
                                  const EncodeOperation &op) {
  ExecResult result;
  if (!initialized_) {
    result.cause = "engine not initialized";
    return result;
  }
  if (!namespace_exists(ns)) {
    result.cause = fmt::format("namespace '{}' does not exist", ns);
    return result;
  }
  if (!is_safe_name(op.output)) {
    result.cause = fmt::format("invalid output name '{}'", op.output);
    return result;
  }

  std::error_code ec;
  for (const auto &input : op.inputs) {
    if (!is_safe_name(input) || !fs::is_regular_file(blob_path(ns, input), ec)) {
      result.cause = fmt::format("missing input '{}'", input);
      return result;
    }
  }
  fs::remove(blob_path(ns, op.output), ec);

  std::string cmd = build_command(ns, op);
  int status = std::system(cmd.c_str());

  std::string log_path = blob_path(ns, "." + op.step + ".stderr");
  std::string stderr_line = last_line_of(log_path);
  fs::remove(log_path, ec);

  if (status != 0) {
    result.exit_code = (status >> 8) & 0xFF;
    result.cause = stderr_line.empty()
                       ? fmt::format("exit code {}", result.exit_code)
                       : fmt::format("exit code {}: {}", result.exit_code,
                                     stderr_line);
    return result;
  }

  result.exit_code = 0;
  auto size = fs::file_size(blob_path(ns, op.output), ec);
  if (ec || size == 0) {
    result.cause = fmt::format("output '{}' not produced", op.output);
    return result;
  }

  result.ok = true;
  return result;
}

} // namespace slide_reel
