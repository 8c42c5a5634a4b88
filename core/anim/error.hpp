#pragma once

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace splinerig::core::anim {

enum class ErrorKind {
    Cycle,
    MissingDriver,
    InvalidFrameCount,
    EmptyPath,
    SelfDrive,
    DuplicateName,
    MalformedPoint,
    OffsetClamped,
    InvalidParameter,
};

const char* errorKindName(ErrorKind kind);

// Fatal condition: aborts the whole resolution request.
class EngineError : public std::runtime_error {
public:
    EngineError(ErrorKind kind, std::string layer, const std::string& message,
                std::vector<std::string> cycle = {})
        : std::runtime_error(message), kind_(kind), layer_(std::move(layer)), cycle_(std::move(cycle)) {}

    ErrorKind kind() const { return kind_; }
    const std::string& layer() const { return layer_; }
    const std::vector<std::string>& cycle() const { return cycle_; }

private:
    ErrorKind kind_;
    std::string layer_;
    std::vector<std::string> cycle_;
};

// Recoverable condition recorded alongside a successful resolution.
struct Diagnostic {
    ErrorKind kind{ErrorKind::MissingDriver};
    std::string layer{};
    std::string message{};
};

using Diagnostics = std::vector<Diagnostic>;

// Records the diagnostic and forwards it to the log sink.
void report(Diagnostics& out, ErrorKind kind, const std::string& layer, const std::string& message);

} // namespace splinerig::core::anim
