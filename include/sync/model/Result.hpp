#pragma once

#include <string>
#include <utility>

namespace sl::sync::model {

// (success, message) pair surfaced by every inbound operation and low-level transfer.
struct OpResult {
    bool success{false};
    std::string message;

    static OpResult ok(std::string msg) { return {true, std::move(msg)}; }
    static OpResult fail(std::string msg) { return {false, std::move(msg)}; }

    explicit operator bool() const { return success; }
};

}
