#include "errors.hpp"

namespace Rootstock {

const char* errorKindName(ErrorKind kind)
{
    switch (kind) {
        case ErrorKind::ToolMissing:          return "TOOL_MISSING";
        case ErrorKind::DownloadFailed:       return "DOWNLOAD_FAILED";
        case ErrorKind::ExtractionFailed:     return "EXTRACTION_FAILED";
        case ErrorKind::ConfigurationFailed:  return "CONFIGURATION_FAILED";
        case ErrorKind::RuntimeInstallFailed: return "RUNTIME_INSTALL_FAILED";
        case ErrorKind::ExecutionTimeout:     return "EXECUTION_TIMEOUT";
        case ErrorKind::Cancelled:            return "CANCELLED";
        case ErrorKind::InvalidArgument:      return "INVALID_ARGUMENT";
        case ErrorKind::Busy:                 return "BUSY";
        case ErrorKind::NotFound:             return "NOT_FOUND";
        case ErrorKind::IoError:              return "IO_ERROR";
    }
    return "UNKNOWN";
}

} // namespace Rootstock
