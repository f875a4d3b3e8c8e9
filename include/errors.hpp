#ifndef ERRORS_HPP
#define ERRORS_HPP

#include <stdexcept>
#include <string>

namespace Rootstock {

/**
 * @brief Machine-readable category of a provisioning or service failure.
 */
enum class ErrorKind
{
    ToolMissing,          // sandbox binary absent, nothing downstream can work
    DownloadFailed,       // every rootfs source failed
    ExtractionFailed,     // corrupt or truncated archive stream
    ConfigurationFailed,  // resolver write failed (non-fatal)
    RuntimeInstallFailed, // bootstrap command exited non-zero (non-fatal)
    ExecutionTimeout,
    Cancelled,
    InvalidArgument,
    Busy,                 // a run for this environment is already active
    NotFound,
    IoError
};

/**
 * @brief Returns the stable upper-case name of an error kind,
 *        e.g. "TOOL_MISSING".
 */
const char* errorKindName(ErrorKind kind);

/**
 * @class SetupError
 * @brief Exception raised by the provisioning pipeline and the service
 *        boundary. Carries an ErrorKind next to the human-readable message.
 */
class SetupError : public std::runtime_error
{
public:
    SetupError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

} // namespace Rootstock

#endif // ERRORS_HPP
