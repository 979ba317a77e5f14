#ifndef METALOADER_ERRORS_HPP
#define METALOADER_ERRORS_HPP

#include <string>

#include <spdlog/spdlog.h>
#include <metaloader/export.hpp>
#include <metaloader/enums.hpp>

namespace metaloader
{
    struct DownloaderError
    {
        ErrorLevel level;
        ErrorCode code;
        std::string reason;
        // HTTP status of the response that produced this error, 0 if none.
        long http_status = 0;

        bool is_serious() const noexcept
        {
            return (level == ErrorLevel::SERIOUS || level == ErrorLevel::FATAL);
        }

        bool is_fatal() const noexcept
        {
            return level == ErrorLevel::FATAL;
        }

        // Transient errors may succeed on a later attempt, even with the same mirror.
        bool is_transient() const noexcept
        {
            switch (code)
            {
                case ErrorCode::ML_TEMPORARYERR:
                case ErrorCode::ML_TIMEOUT:
                case ErrorCode::ML_CONNECTION_RESET:
                case ErrorCode::ML_PIECE_MISMATCH:
                case ErrorCode::ML_CURL:
                    return !is_fatal();
                default:
                    return false;
            }
        }

        bool is_integrity_error() const noexcept
        {
            return code == ErrorCode::ML_PIECE_MISMATCH
                   || code == ErrorCode::ML_CHECKSUM_MISMATCH;
        }

        void log() const
        {
            switch (level)
            {
                case ErrorLevel::FATAL:
                    spdlog::critical(reason);
                    break;
                case ErrorLevel::SERIOUS:
                    spdlog::error(reason);
                    break;
                default:
                    spdlog::warn(reason);
            }
        }
    };

    enum class ParseErrorKind
    {
        kMALFORMED_XML,
        kUNKNOWN_NAMESPACE,
        kMISSING_REQUIRED_FIELD,
        kINVALID_VALUE,
    };

    // Returned by the metalink parser, aborts the run before any network activity.
    struct ParseError
    {
        ParseErrorKind kind;
        // Name of the offending element or attribute (`file@name`, `size`, ...).
        std::string field;
        std::string reason;

        std::string message() const
        {
            switch (kind)
            {
                case ParseErrorKind::kMALFORMED_XML:
                    return fmt::format("Malformed XML: {}", reason);
                case ParseErrorKind::kUNKNOWN_NAMESPACE:
                    return fmt::format("Unknown namespace: {}", reason);
                case ParseErrorKind::kMISSING_REQUIRED_FIELD:
                    return fmt::format("Missing required field '{}'", field);
                default:
                    return fmt::format("Invalid value for '{}': {}", field, reason);
            }
        }
    };

    enum class PlanErrorKind
    {
        kUNRESOLVABLE_FILE,
        kINVALID_PIECE_LAYOUT,
    };

    // Attached to a single file of the plan; sibling files proceed.
    struct PlanError
    {
        PlanErrorKind kind;
        std::string reason;

        DownloaderError to_downloader_error() const
        {
            return DownloaderError{ ErrorLevel::FATAL,
                                    kind == PlanErrorKind::kUNRESOLVABLE_FILE
                                        ? ErrorCode::ML_UNRESOLVABLE_FILE
                                        : ErrorCode::ML_INVALID_PIECE_LAYOUT,
                                    reason };
        }
    };
}

#endif
