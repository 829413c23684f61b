#include "resq/command_handler.hpp"
#include "resq/utf8.hpp"
#include <spdlog/spdlog.h>
#include <cstdio>
#include <stdexcept>
#include <sys/wait.h>

namespace resq {

namespace {

std::string trim_line(std::string line) {
    while (!line.empty() && (line.back() == '\n' || line.back() == '\r')) {
        line.pop_back();
    }
    return line;
}

} // namespace

int run_command(const std::string& cmd, std::string& output,
                const std::function<void(const std::string&)>& on_line,
                size_t max_output_bytes) {
    std::string full_cmd = "(" + cmd + ") 2>&1";
    FILE* pipe = popen(full_cmd.c_str(), "r");
    if (!pipe) return -1;

    char buffer[4096];
    while (fgets(buffer, sizeof(buffer), pipe)) {
        if (on_line) on_line(buffer);
        output += buffer;
        if (max_output_bytes > 0 && output.size() > max_output_bytes) {
            size_t cut = output.size() - max_output_bytes;
            while (cut < output.size() && is_utf8_continuation(output[cut])) {
                cut++;
            }
            output.erase(0, cut);
        }
    }

    int status = pclose(pipe);
    if (status != -1 && WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    return -1;
}

std::string shell_quote(const std::string& value) {
    std::string quoted = "'";
    for (char c : value) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted += c;
        }
    }
    quoted += "'";
    return quoted;
}

CommandHandler::CommandHandler(std::string command, int permanent_failure_exit_code)
    : command_(std::move(command)), permanent_failure_exit_code_(permanent_failure_exit_code) {
    if (command_.empty()) {
        throw std::invalid_argument("command must not be empty");
    }
}

std::string CommandHandler::build_command_line(const Job& job) const {
    return "RESQ_JOB_ID=" + std::to_string(job.id) +
           " RESQ_BATCH_SPEC_ID=" + std::to_string(job.batch_spec_id) +
           " RESQ_ALLOW_UNSUPPORTED=" + (job.allow_unsupported ? "true" : "false") +
           " RESQ_ALLOW_IGNORED=" + (job.allow_ignored ? "true" : "false") +
           " RESQ_ATTEMPT=" + std::to_string(job.attempt()) +
           " /bin/sh -c " + shell_quote(command_);
}

HandlerResult CommandHandler::handle(const Job& job, JobContext& context) {
    std::string output;
    size_t total_bytes = 0;
    int exit_code = run_command(build_command_line(job), output, [&](const std::string& line) {
        total_bytes += line.size();
        std::string progress = trim_line(line);
        if (!progress.empty()) {
            context.set_progress(utf8_prefix(sanitize_utf8(progress), kMaxProgressBytes));
        }
    }, kMaxMessageBytes);

    if (exit_code == 0) {
        spdlog::debug("Job {} command succeeded", job.id);
        return HandlerResult::success();
    }

    std::string message = "command exited with " +
        (exit_code < 0 ? std::string("abnormal status") : "status " + std::to_string(exit_code));
    if (!output.empty()) {
        message += total_bytes > output.size() ? ": ..." : ": ";
        message += utf8_suffix(sanitize_utf8(output), kMaxMessageBytes);
    }

    if (permanent_failure_exit_code_ > 0 && exit_code == permanent_failure_exit_code_) {
        return HandlerResult::permanent_failure(message);
    }
    return HandlerResult::failure(message);
}

} // namespace resq
