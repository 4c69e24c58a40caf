#pragma once

namespace my_errors {

namespace GENERAL {  // General errors

constexpr int INVALID_ARGUMENT = 5000;  // Invalid argument
constexpr int UNEXPECTED_RESULT = 5017;  // Unexpected result
constexpr int FILE_READ_WRITE = 5020;  // File read/write error
}  // namespace GENERAL

namespace IDENTITY {  // Device identity errors

constexpr int PROVIDER_UNAVAILABLE = 8000;  // No identity provider returned a value
constexpr int UNKNOWN_PROVIDER = 8001;  // Provider name not recognised
constexpr int PERSIST_FAILED = 8002;  // Unable to write the identifier file
}  // namespace IDENTITY

namespace LAUNCH {  // Launcher errors

constexpr int MISSING_ASSET = 8100;  // Runtime or target entry point missing
constexpr int SETUP_STEP_FAILED = 8101;  // One-time setup step failed
constexpr int SPAWN_FAILED = 8102;  // Child process could not be started
constexpr int CHILD_TIMEOUT = 8103;  // Child process timed out
constexpr int MARKER_WRITE_FAILED = 8104;  // Unable to create the marker file
constexpr int CONFIG_ERROR = 8105;  // Launcher configuration invalid
}  // namespace LAUNCH

}  // namespace my_errors
