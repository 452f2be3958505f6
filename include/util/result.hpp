#pragma once

#include <cstring>
#include <string>
#include <utility>

namespace genup {

// Outcome of an operation that yields no value. `err` holds an errno value
// where one applies and -1 otherwise.
struct Result {
    bool ok{true};
    int err{0};
    std::string msg;

    bool is_ok() const { return ok; }

    static Result Ok() { return {}; }
    static Result Fail(int e, std::string m) {
        return {.ok = false, .err = e, .msg = std::move(m)};
    }
    // "<what>: <strerror(e)>"
    static Result FromErrno(int e, const std::string& what) {
        return Fail(e, what + ": " + std::strerror(e));
    }

    // Copy with "<context>: " in front of the message; success passes through.
    Result Within(const std::string& context) const {
        if (ok) return *this;
        return Fail(err, context + ": " + msg);
    }
};

} // namespace genup
