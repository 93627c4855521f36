// Auto-generated from error_codes.ini
#pragma once

namespace my_errors {

namespace GENERAL {  // General errors

constexpr int INVALID_ARGUMENT = 5000;  // Invalid argument
constexpr int SHOW_OPT_DESC = 5002;  // Show options description
constexpr int NOT_FOUND = 5003;  // Not found
constexpr int MISSING_FIELD = 5008;  // Missing field
constexpr int UNEXPECTED_RESULT = 5017;  // Unexpected result
constexpr int FILE_NOT_FOUND = 5019;  // File not found
constexpr int FILE_READ_WRITE = 5020;  // File read/write error
}  // namespace GENERAL

namespace NETWORK {  // Network errors

constexpr int CONNECT_ERROR = 5200;  // Connect error
constexpr int READ_ERROR = 5201;  // Read error
constexpr int WRITE_ERROR = 5202;  // Write error
constexpr int TIMEOUT_ERROR = 5203;  // Timeout error
constexpr int BAD_STATUS = 5206;  // Unexpected HTTP status
constexpr int INVALID_URL = 5207;  // Invalid URL
}  // namespace NETWORK

namespace STORE {  // Resource store errors

constexpr int NOT_FOUND = 5300;  // Resource not found
constexpr int ALREADY_EXISTS = 5301;  // Resource already exists
constexpr int CONFLICT = 5302;  // Resource version conflict
constexpr int BACKEND_ERROR = 5303;  // Store backend failure
}  // namespace STORE

namespace PROVISION {  // Provisioning errors

constexpr int DEADLINE_EXCEEDED = 5400;  // Readiness deadline exceeded
constexpr int CANCELLED = 5401;  // Operation cancelled
constexpr int STAGE_FAILED = 5402;  // Provisioning stage failed
constexpr int RETRIES_EXHAUSTED = 5403;  // Conditional update retries exhausted
constexpr int BOOTSTRAP_FAILED = 5404;  // One or more bootstrap steps failed
}  // namespace PROVISION

namespace JSON {  // Json errors

constexpr int MALFORMED = 9000;  // Malformed JSON text
constexpr int DECODE_ERROR = 9001;  // Failed to decode/parse JSON (low-level)
constexpr int TYPE_MISMATCH = 9003;  // JSON type mismatch
constexpr int MISSING_JSON_FIELD = 9004;  // Required JSON field missing
}  // namespace JSON

namespace CONTROL {  // Control errors

constexpr int NOT_AN_ERROR = 999999;  // Not an error
}  // namespace CONTROL

namespace OPENSSL {  // OPENSSL errors

constexpr int UNEXPECTED_RESULT = 8000;  // Unexpected result
constexpr int INVALID_KEY = 8001;  // Invalid key
constexpr int UNSUPPORTED_KEY_TYPE = 8002;  // Unsupported key type
constexpr int MALFORMED_INPUT = 8003;  // Malformed PEM or certificate
}  // namespace OPENSSL

}  // namespace my_errors
