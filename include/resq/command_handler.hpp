#pragma once

#include "resq/worker.hpp"
#include <functional>
#include <string>

namespace resq {

// Run a shell command, capture stderr+stdout, return exit code (-1 when the
// command could not be started or did not exit normally). Each output line is
// passed to on_line before it is appended. With max_output_bytes > 0 only the
// last max_output_bytes of output are kept, starting on a character boundary.
int run_command(const std::string& cmd, std::string& output,
                const std::function<void(const std::string&)>& on_line = nullptr,
                size_t max_output_bytes = 0);

// Quotes value for /bin/sh
std::string shell_quote(const std::string& value);

/**
 * Runs an external command per job.
 *
 * The job is described to the command through RESQ_JOB_ID,
 * RESQ_BATCH_SPEC_ID, RESQ_ALLOW_UNSUPPORTED and RESQ_ALLOW_IGNORED. The last
 * output line is reported as progress. Exit status 0 is success,
 * permanent_failure_exit_code (when > 0) is a permanent failure and anything
 * else is a retryable failure carrying the tail of the output. Progress and
 * the message are cut on UTF-8 character boundaries, with invalid bytes
 * replaced by U+FFFD.
 *
 * The command is not interrupted when the worker stops or the lease is lost:
 * handle() returns only once the command exits, and the worker then drops the
 * result of a lost lease.
 */
class CommandHandler : public JobHandler {
public:
    static constexpr size_t kMaxMessageBytes = 4096;
    static constexpr size_t kMaxProgressBytes = 256;

    explicit CommandHandler(std::string command, int permanent_failure_exit_code = 0);

    HandlerResult handle(const Job& job, JobContext& context) override;

    // Environment assignments plus command, as handed to /bin/sh
    std::string build_command_line(const Job& job) const;

    const std::string& command() const { return command_; }

private:
    std::string command_;
    int permanent_failure_exit_code_;
};

} // namespace resq
