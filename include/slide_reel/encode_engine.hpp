/**
 * @file encode_engine.hpp
 * @brief Capability interface over the external media-encoding engine
 *
 * @details The pipeline only ever talks to an EncodeEngine:
 *
 *          - named byte blobs inside a per-run namespace
 *
 *          - execute(): one encoder invocation reading blobs of that
 *            namespace and producing one new blob
 *
 *          Which implementation backs a run (a direct child process, or the
 *          shared encode queue) is decided by the deployment through an
 *          EngineFactory, never by the pipeline.
 */

#ifndef SLIDE_REEL_ENCODE_ENGINE_HPP
#define SLIDE_REEL_ENCODE_ENGINE_HPP

#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "types.hpp"

namespace slide_reel {

/**
 * @struct EncodeOperation
 * @brief One encoder invocation.
 * @note `args` are encoder arguments after the global flags; blob names
 *       appear in them as plain relative file names.
 */
struct EncodeOperation {
  std::string step;                //< Step name for logs and errors
  std::vector<std::string> inputs; //< Blobs that must exist beforehand
  std::vector<std::string> args;   //< Encoder arguments
  std::string output;              //< Blob the invocation must produce
};

/**
 * @struct ExecResult
 * @brief Outcome of execute().
 */
struct ExecResult {
  bool ok = false;
  int exit_code = -1;
  std::string cause; //< Short, single-line reason when !ok
};

/**
 * @class EncodeEngine
 * @brief Operation-execution contract of the encoding engine.
 * @note One instance per run. Instances are not shared across concurrent
 *       runs; isolation between runs is by namespace.
 */
class EncodeEngine {
public:
  virtual ~EncodeEngine() = default;

  /**
   * @brief Acquire the engine.
   * @note Idempotent: calling it on an initialized engine returns true.
   * @return false if the engine cannot be used
   */
  virtual bool initialize() = 0;
  virtual bool is_initialized() const = 0;

  /// Create an empty namespace; false if it already exists or on I/O error
  virtual bool create_namespace(const std::string &ns) = 0;
  /// Remove a namespace and anything left in it
  virtual bool drop_namespace(const std::string &ns) = 0;
  virtual bool namespace_exists(const std::string &ns) const = 0;

  virtual ExecResult execute(const std::string &ns,
                             const EncodeOperation &op) = 0;

  /// Write a blob; the blob is visible under `name` only once complete
  virtual bool write_blob(const std::string &ns, const std::string &name,
                          const Blob &data) = 0;
  virtual bool read_blob(const std::string &ns, const std::string &name,
                         Blob &out) const = 0;
  virtual std::vector<std::string>
  list_namespace(const std::string &ns) const = 0;
  virtual bool delete_blob(const std::string &ns, const std::string &name) = 0;
};

/// Deployment hook producing a fresh engine for each run
using EngineFactory = std::function<std::unique_ptr<EncodeEngine>()>;

} // namespace slide_reel

#endif // SLIDE_REEL_ENCODE_ENGINE_HPP
