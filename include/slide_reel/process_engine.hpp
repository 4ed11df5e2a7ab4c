/**
 * @file process_engine.hpp
 * @brief EncodeEngine backed by the ffmpeg executable
 *
 * @details Namespaces are directories below a workspace root. Each
 *          execute() runs one ffmpeg child process with the namespace
 *          directory as working directory, so blob names in the operation's
 *          arguments resolve to the namespace's files.
 */

#ifndef SLIDE_REEL_PROCESS_ENGINE_HPP
#define SLIDE_REEL_PROCESS_ENGINE_HPP

#include <string>
#include <vector>

#include "encode_engine.hpp"

namespace slide_reel {

/**
 * @class ProcessEngine
 * @brief Direct child-process engine.
 *
 * @attention ROBUSTNESS:
 *
 * - Declared inputs are checked before launching the encoder
 *
 * - The declared output must exist and be non-empty afterwards
 *
 * - Blob writes go to a hidden temp name and are renamed into place
 *
 * - Encoder stderr is captured per step; its last line becomes the cause
 */
class ProcessEngine : public EncodeEngine {
public:
  /**
   * @param workspace_root Directory holding the namespaces
   * @param ffmpeg_path Encoder executable
   */
  ProcessEngine(std::string workspace_root, std::string ffmpeg_path);

  bool initialize() override;
  bool is_initialized() const override { return initialized_; }

  bool create_namespace(const std::string &ns) override;
  bool drop_namespace(const std::string &ns) override;
  bool namespace_exists(const std::string &ns) const override;

  ExecResult execute(const std::string &ns, const EncodeOperation &op) override;

  bool write_blob(const std::string &ns, const std::string &name,
                  const Blob &data) override;
  bool read_blob(const std::string &ns, const std::string &name,
                 Blob &out) const override;
  std::vector<std::string> list_namespace(const std::string &ns) const override;
  bool delete_blob(const std::string &ns, const std::string &name) override;

  /**
   * @brief Shell command line execute() would run for an operation.
   * @note Every argument is single-quoted; exposed for diagnostics.
   */
  std::string build_command(const std::string &ns,
                            const EncodeOperation &op) const;

  const std::string &workspace_root() const { return root_; }

private:
  std::string root_;
  std::string ffmpeg_;
  bool initialized_ = false;

  std::string namespace_dir(const std::string &ns) const;
  std::string blob_path(const std::string &ns, const std::string &name) const;
};

/**
 * @brief Quote a string for /bin/sh.
 * @note Wraps in single quotes; embedded quotes become '\''.
 */
std::string shell_quote(const std::string &arg);

/**
 * @brief True for names usable as a blob or namespace: non-empty, no path
 *        separators, not "." or "..".
 */
bool is_safe_name(const std::string &name);

} // namespace slide_reel

#endif // SLIDE_REEL_PROCESS_ENGINE_HPP
