#ifndef METALOADER_ENUMS_HPP
#define METALOADER_ENUMS_HPP

#define METALINK_NAMESPACE "urn:ietf:params:xml:ns:metalink"
#define EMPTY_SHA "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855"

namespace metaloader
{
    enum class Protocol
    {
        kOTHER,
        kFILE,
        kHTTP,
        kFTP,
    };

    enum class SegmentState
    {
        // The segment waits for a worker (possibly after a retry delay).
        kPENDING,
        // A worker is transferring the segment.
        kINFLIGHT,
        // All bytes of the segment were written (and its piece verified, if any).
        kCOMPLETED,
        // The segment cannot be completed anymore.
        kFAILED,
    };

    enum class HeaderCbState
    {
        // Default state
        kDEFAULT,
        // HTTP headers with OK state
        kHTTP_STATE_OK,
        // Download was interrupted (e.g. Content-Length doesn't match
        // expected size etc.)
        kINTERRUPTED,
        // All headers which we were looking for are already found
        kDONE
    };

    // Ranges capability of a mirror, learned from its responses.
    enum class RangeSupport
    {
        kUNKNOWN,
        kSUPPORTED,
        kUNSUPPORTED,
    };

    enum class ChecksumType
    {
        kMD2,
        kMD5,
        kSHA1,
        kSHA224,
        kSHA256,
        kSHA384,
        kSHA512,
        // Declared by the document but not known to us: retained, never verified.
        kUNSUPPORTED,
    };

    enum class FileStatus
    {
        // Still being processed.
        kRUNNING,
        // Every byte written and at least one supported digest matched.
        kVERIFIED,
        // Every byte written but nothing could be verified.
        kCOMPLETED_UNVERIFIED,
        // Digest mismatch with no mirror left to try.
        kCHECKSUM_MISMATCH,
        // Some segment could not be fetched from any mirror.
        kINCOMPLETE_NO_MIRRORS,
        // Writing or reading the destination failed.
        kIO_ERROR,
        // The file entry was rejected while planning.
        kPLAN_ERROR,
        // The run was cancelled before the file finished.
        kCANCELLED,
    };

    enum class ErrorCode
    {
        // everything is ok
        ML_OK,
        // bad function argument
        ML_BADFUNCARG,
        // cURL error
        ML_CURL,
        // HTTP or FTP returned status code which do not represent success
        // (file doesn't exists, etc.)
        ML_BADSTATUS,
        // some error that should be temporary and next try could work
        // (HTTP status codes 500, 502-504, ...)
        ML_TEMPORARYERR,
        // the operation timed out (connect or low speed limit)
        ML_TIMEOUT,
        // the connection was reset or closed before the end of the body
        ML_CONNECTION_RESET,
        // TLS handshake or certificate error
        ML_TLS,
        // the server answered with something we cannot use (wrong length, ...)
        ML_MALFORMED_RESPONSE,
        // input output error
        ML_IO,
        // no usable mirror left
        ML_NOURL,
        // a piece does not match its declared digest
        ML_PIECE_MISMATCH,
        // the whole file does not match its declared digest
        ML_CHECKSUM_MISMATCH,
        // the file entry has no usable resource
        ML_UNRESOLVABLE_FILE,
        // the piece hashes do not cover the file
        ML_INVALID_PIECE_LAYOUT,
        // Download was interrupted by signal or cancellation.
        ML_INTERRUPTED,
        // (xx) unknown error - sentinel of error codes enum
        ML_UNKNOWNERROR,
    };

    enum ErrorLevel
    {
        INFO,
        SERIOUS,
        FATAL
    };
}

#endif
