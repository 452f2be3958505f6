#pragma once

#include "update/collaborators.hpp"

#include <memory>
#include <string>
#include <vector>

namespace genup {

class LogNotifier final : public INotifier {
public:
    Result Send(const std::string& message) override;
};

// Appends each message, followed by a separator line, to a file.
class FileNotifier final : public INotifier {
public:
    explicit FileNotifier(std::string path);
    Result Send(const std::string& message) override;

private:
    std::string path_;
};

// Pipes the message into the command's stdin.
class CommandNotifier final : public INotifier {
public:
    explicit CommandNotifier(std::string command);
    Result Send(const std::string& message) override;

private:
    std::string command_;
};

// Delivers to every channel even when some fail; fails if any channel failed.
class FanoutNotifier final : public INotifier {
public:
    explicit FanoutNotifier(std::vector<std::unique_ptr<INotifier>> channels);
    Result Send(const std::string& message) override;

    size_t Size() const { return channels_.size(); }

private:
    std::vector<std::unique_ptr<INotifier>> channels_;
};

} // namespace genup
