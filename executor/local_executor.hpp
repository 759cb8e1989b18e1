#ifndef EXECUTOR_LOCAL_EXECUTOR_HPP
#define EXECUTOR_LOCAL_EXECUTOR_HPP

#include "executor/classifier.hpp"
#include "executor/executor.hpp"
#include "sandbox/sandbox.hpp"

namespace executor {

// Runs each unit with the Python interpreter in a fresh sandbox directory.
class LocalExecutor : public Executor {
 public:
  std::string Id() const override { return "LOCAL"; }
  proto::ExecutionOutcome Execute(const proto::ExecutionUnit& unit,
                                  const LimitPolicy& policy,
                                  const std::atomic<bool>* cancelled) override;

  LocalExecutor(const LocalExecutor&) = delete;
  LocalExecutor& operator=(const LocalExecutor&) = delete;
  LocalExecutor(LocalExecutor&&) = delete;
  LocalExecutor& operator=(LocalExecutor&&) = delete;
  ~LocalExecutor() override = default;

  // interpreter is either a path or a command looked up in PATH.
  LocalExecutor(const std::string& interpreter, std::string temp_directory,
                bool keep_sandboxes = false);

  // Absolute path of the interpreter, empty if it could not be found.
  const std::string& Interpreter() const { return interpreter_; }

 private:
  static const constexpr char* kBoxDir = "box";
  static const constexpr int64_t kMaxFileSizeKb = 64 * 1024;
  static const constexpr int32_t kMaxFiles = 256;

  // Writes the program and the runner in a new sandbox and runs them.
  void Run(const proto::ExecutionUnit& unit, const LimitPolicy& policy,
           const std::atomic<bool>* cancelled, RawExecution* raw,
           proto::ExecutionOutcome* outcome);

  std::string interpreter_;
  std::string temp_directory_;
  bool keep_sandboxes_;
};

}  // namespace executor

#endif
