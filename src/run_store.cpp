/**
 * @file run_store.cpp
 * @brief JSON run descriptors
 */

#include "slide_reel/run_store.hpp"

#include <algorithm>
#include <filesystem>
#include <system_error>

#include <nlohmann/json.hpp>

#include "slide_reel/file_util.hpp"
#include "slide_reel/logging.hpp"

using json = nlohmann::json;

namespace slide_reel {

namespace fs = std::filesystem;

RunStore::RunStore(std::string dir) : dir_(std::move(dir)) {}

bool RunStore::is_valid_id(const std::string &run_id) {
  if (run_id.empty() || run_id.size() > 128)
    return false;
  return std::all_of(run_id.begin(), run_id.end(), [](char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
           (c >= '0' && c <= '9') || c == '_' || c == '-';
  });
}

std::string RunStore::path_for(const std::string &run_id) const {
  return (fs::path(dir_) / (run_id + ".json")).string();
}

std::string RunStore::to_json(const RunSnapshot &snapshot) {
  json doc = {
      {"runId", snapshot.run_id},
      {"projectName", snapshot.project_name},
      {"phase", phase_name(snapshot.phase)},
      {"progressPercent", snapshot.progress_percent},
      {"totalDurationSeconds", snapshot.total_duration},
  };
  if (snapshot.error) {
    json err = {{"kind", error_kind_name(snapshot.error->kind)},
                {"cause", snapshot.error->cause},
                {"reason", describe(*snapshot.error)}};
    if (!snapshot.error->subject.empty())
      err["step"] = snapshot.error->subject;
    doc["error"] = err;
  }
  if (snapshot.output_ref)
    doc["outputRef"] = *snapshot.output_ref;
  return doc.dump(2);
}

std::optional<RunSnapshot> RunStore::from_json(const std::string &text) {
  json doc = json::parse(text, nullptr, false);
  if (doc.is_discarded() || !doc.is_object())
    return std::nullopt;

  auto run_id = doc.find("runId");
  auto phase = doc.find("phase");
  if (run_id == doc.end() || !run_id->is_string() || phase == doc.end() ||
      !phase->is_string())
    return std::nullopt;

  auto parsed_phase = phase_from_name(phase->get<std::string>());
  if (!parsed_phase)
    return std::nullopt;

  RunSnapshot s;
  /// value() throws type_error for fields of the wrong JSON type
  try {
    s.run_id = run_id->get<std::string>();
    s.phase = *parsed_phase;
    s.project_name = doc.value("projectName", std::string());
    s.progress_percent = std::clamp(doc.value("progressPercent", 0), 0, 100);
    s.total_duration = doc.value("totalDurationSeconds", 0.0);

    auto err = doc.find("error");
    if (err != doc.end() && err->is_object()) {
      auto kind = error_kind_from_name(err->value("kind", std::string()));
      if (!kind)
        return std::nullopt;
      s.error = ErrorDetail{*kind, err->value("step", std::string()),
                            err->value("cause", std::string())};
    }

    auto out = doc.find("outputRef");
    if (out != doc.end() && out->is_string())
      s.output_ref = out->get<std::string>();
  } catch (const json::exception &e) {
    LOG_WARN("Malformed run descriptor: {}", e.what());
    return std::nullopt;
  }
  return s;
}

bool RunStore::save(const RunSnapshot &snapshot) {
  if (!is_valid_id(snapshot.run_id)) {
    LOG_ERROR("Refusing to persist run with invalid id '{}'", snapshot.run_id);
    return false;
  }
  return write_file_atomic(path_for(snapshot.run_id), to_json(snapshot));
}

std::optional<RunSnapshot> RunStore::load(const std::string &run_id) const {
  if (!is_valid_id(run_id))
    return std::nullopt;
  std::string text;
  if (!read_text(path_for(run_id), text))
    return std::nullopt;
  auto s = from_json(text);
  if (!s || s->run_id != run_id)
    return std::nullopt;
  return s;
}

bool RunStore::remove(const std::string &run_id) {
  if (!is_valid_id(run_id))
    return false;
  std::error_code ec;
  fs::remove(path_for(run_id), ec);
  if (ec) {
    LOG_WARN("Could not remove run descriptor {}: {}", path_for(run_id),
             ec.message());
    return false;
  }
  return true;
}

std::vector<RunSnapshot> RunStore::load_all() const {
  std::vector<RunSnapshot> out;
  std::error_code ec;
  for (fs::directory_iterator it(dir_, ec), end; !ec && it != end;
       it.increment(ec)) {
    const fs::path &p = it->path();
    if (p.extension() != ".json")
      continue;
    auto s = load(p.stem().string());
    if (s)
      out.push_back(std::move(*s));
    else
      LOG_WARN("Skipping unreadable run descriptor {}", p.string());
  }
  std::sort(out.begin(), out.end(),
            [](const RunSnapshot &a, const RunSnapshot &b) {
              return a.run_id < b.run_id;
            });
  return out;
}

std::vector<RunSnapshot> RunStore::recover() {
  std::vector<RunSnapshot> runs = load_all();
  size_t interrupted = 0;
  for (auto &s : runs) {
    if (is_terminal(s.phase))
      continue;
    s.phase = Phase::kError;
    s.error = ErrorDetail{ErrorKind::kCancelled, "", INTERRUPTED_CAUSE};
    s.output_ref.reset();
    if (save(s))
      ++interrupted;
  }
  if (interrupted > 0)
    LOG_WARN("Marked {} unfinished runs as interrupted", interrupted);
  return runs;
}

} // namespace slide_reel
