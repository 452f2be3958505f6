#pragma once

#include "system/cancel_token.hpp"
#include "util/result.hpp"

#include <chrono>
#include <cstddef>
#include <string>
#include <utility>
#include <vector>

namespace genup {

struct ProcessSpec {
    std::string command;  // run as: /bin/sh -c <command>
    std::vector<std::pair<std::string, std::string>> env;  // added to the inherited environment
    std::string stdin_data;
    std::size_t output_limit = 1024 * 1024;  // keeps the tail of stdout+stderr
    std::chrono::milliseconds kill_grace{2000};
};

struct ProcessResult {
    int exit_code = -1;
    int term_signal = 0;
    bool cancelled = false;
    bool output_truncated = false;
    std::string output;

    bool Succeeded() const { return !cancelled && term_signal == 0 && exit_code == 0; }
    std::string Describe() const;
};

// Runs the command to completion or until `cancel` trips; a cancelled child's
// process group gets SIGTERM, then SIGKILL after `kill_grace`.
// Fails when the child could not be started or could no longer be waited for.
Result RunProcess(const ProcessSpec& spec, const CancelToken& cancel, ProcessResult& out);

// Last non-empty line of `text`, trimmed.
std::string LastNonEmptyLine(const std::string& text);

} // namespace genup
