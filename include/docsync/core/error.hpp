#pragma once

#include <string>

namespace docsync {

/**
 * @brief Failure classes surfaced by the library
 *
 * WHO RETURNS WHAT:
 * - KeyDecode:          Table::search() when a log key is not valid UTF-8
 * - ContentNotFound:    ContentStore::resolve() for an unknown digest
 * - SizeLimitExceeded:  Table::insert() before anything is written
 * - SubscriptionFailed: DocumentLog::subscribe(), fatal to one session
 * - DecodeFailed:       entity or hex decoding of malformed bytes
 * - UnknownDataset:     registry lookups for names outside the configured set
 * - AlreadyOpen:        opening the same dataset twice
 * - InvalidTicket:      joining with a ticket nobody issued
 * - InvalidConfig:      configuration parsing/validation
 * - Io:                 filesystem access (seeding, config files)
 */
enum class ErrorCode {
    KeyDecode,
    ContentNotFound,
    SizeLimitExceeded,
    SubscriptionFailed,
    DecodeFailed,
    UnknownDataset,
    AlreadyOpen,
    InvalidTicket,
    InvalidConfig,
    Io
};

inline const char* to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::KeyDecode: return "KeyDecode";
        case ErrorCode::ContentNotFound: return "ContentNotFound";
        case ErrorCode::SizeLimitExceeded: return "SizeLimitExceeded";
        case ErrorCode::SubscriptionFailed: return "SubscriptionFailed";
        case ErrorCode::DecodeFailed: return "DecodeFailed";
        case ErrorCode::UnknownDataset: return "UnknownDataset";
        case ErrorCode::AlreadyOpen: return "AlreadyOpen";
        case ErrorCode::InvalidTicket: return "InvalidTicket";
        case ErrorCode::InvalidConfig: return "InvalidConfig";
        case ErrorCode::Io: return "Io";
    }
    return "Unknown";
}

struct Error {
    ErrorCode code = ErrorCode::Io;
    std::string message;

    Error() = default;
    Error(ErrorCode c, std::string msg) : code(c), message(std::move(msg)) {}

    std::string describe() const {
        return std::string(to_string(code)) + ": " + message;
    }
};

} // namespace docsync
