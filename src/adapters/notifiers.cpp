#include "adapters/notifiers.hpp"

#include "io/file_writer.hpp"
#include "system/process.hpp"
#include "util/logger.hpp"

#include <chrono>
#include <exception>
#include <sstream>
#include <utility>

namespace genup {

namespace {
constexpr std::chrono::seconds kNotifyCommandTimeout{30};
} // namespace

Result LogNotifier::Send(const std::string& message) {
    std::istringstream in(message);
    std::string line;
    while (std::getline(in, line))
        LogInfo("| %s", line.c_str());
    return Result::Ok();
}

FileNotifier::FileNotifier(std::string path) : path_(std::move(path)) {}

Result FileNotifier::Send(const std::string& message) {
    FileWriter w;
    Result r = FileWriter::Open(path_, w, FileWriter::Mode::Append);
    if (!r.ok)
        return r;
    r = w.WriteAll(message + (message.ends_with('\n') ? "" : "\n") + "----\n");
    if (r.ok)
        r = w.Sync();
    if (!r.ok)
        return r;
    return w.Close();
}

CommandNotifier::CommandNotifier(std::string command) : command_(std::move(command)) {}

Result CommandNotifier::Send(const std::string& message) {
    ProcessSpec spec;
    spec.command = command_;
    spec.stdin_data = message;
    spec.output_limit = 16 * 1024;

    ProcessResult pr;
    Result r = RunProcess(spec, CancelToken().WithTimeout(kNotifyCommandTimeout), pr);
    if (!r.ok)
        return r;
    if (!pr.Succeeded())
        return Result::Fail(-1, "notify command " + pr.Describe());
    return Result::Ok();
}

FanoutNotifier::FanoutNotifier(std::vector<std::unique_ptr<INotifier>> channels)
    : channels_(std::move(channels)) {}

Result FanoutNotifier::Send(const std::string& message) {
    std::string failures;
    for (size_t i = 0; i < channels_.size(); ++i) {
        Result r;
        try {
            r = channels_[i]->Send(message);
        } catch (const std::exception& e) {
            r = Result::Fail(-1, e.what());
        }
        if (!r.ok) {
            LogWarn("Notification channel %zu failed: %s", i, r.msg.c_str());
            if (!failures.empty()) failures += "; ";
            failures += r.msg;
        }
    }
    if (!failures.empty())
        return Result::Fail(-1, failures);
    return Result::Ok();
}

} // namespace genup
