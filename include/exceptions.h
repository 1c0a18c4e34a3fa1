/*
 * exceptions.h - Error classes for the TAF codec.
 * This file is part of TafKit.
 * Copyright © 2011-2025 Kirn Gill <segin2005@gmail.com>
 *
 * TafKit is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 *
 * Permission to use, copy, modify, and/or distribute this software for
 * any purpose with or without fee is hereby granted, provided that
 * the above copyright notice and this permission notice appear in all
 * copies.
 *
 * THE SOFTWARE IS PROVIDED "AS IS" AND THE AUTHOR DISCLAIMS ALL
 * WARRANTIES WITH REGARD TO THIS SOFTWARE INCLUDING ALL IMPLIED
 * WARRANTIES OF MERCHANTABILITY AND FITNESS. IN NO EVENT SHALL THE
 * AUTHOR BE LIABLE FOR ANY SPECIAL, DIRECT, INDIRECT, OR CONSEQUENTIAL
 * DAMAGES OR ANY DAMAGES WHATSOEVER RESULTING FROM LOSS OF USE, DATA
 * OR PROFITS, WHETHER IN AN ACTION OF CONTRACT, NEGLIGENCE OR OTHER
 * TORTIOUS ACTION, ARISING OUT OF OR IN CONNECTION WITH THE USE OR
 * PERFORMANCE OF THIS SOFTWARE.
 */

#ifndef TAFKIT_EXCEPTIONS_H
#define TAFKIT_EXCEPTIONS_H

#include <exception>
#include <string>

namespace TafKit {

enum class ErrorCode {
    // FormatError
    BadCapturePattern,
    ChecksumMismatch,
    TruncatedPage,
    MalformedPage,
    UnexpectedContinuation,
    MissingContinuation,
    TruncatedPacket,
    TruncatedHeader,
    MalformedHeader,
    MalformedOpusPacket,
    // StructuralError
    PageSizeMismatch,
    MissingStreamHeader,
    InvalidIdentificationHeader,
    InvalidCommentHeader,
    UnsupportedStreamFormat,
    IncompatibleStreamParameters,
    NonMonotonicChapters,
    ChapterNotPageAligned,
    // IntegrityError
    ContentHashMismatch,
    ContentLengthMismatch,
    // CapacityError
    LacingOverflow,
    HeaderOverflow,
    PacketTooLarge,
    PagePaddingFailed,
    // InputError
    EmptyInput,
    SerialDiscontinuity,
    SequenceGap,
    InvalidTrackBoundary
};

/**
 * @brief Returns the symbolic name of an error code, e.g. "ChecksumMismatch".
 */
const char* errorCodeName(ErrorCode code);

// Base class of every codec error. Carries the precise condition.
class TafException : public std::exception
{
    public:
        TafException(ErrorCode code, std::string why);
        ~TafException() noexcept override = default;
        const char *what() const noexcept override;
        ErrorCode code() const noexcept { return m_code; }
    private:
        ErrorCode m_code;
        std::string m_why;
};

// Bytes do not form valid framing (capture pattern, checksum, truncation).
class FormatError : public TafException
{
    public:
        FormatError(ErrorCode code, std::string why);
};

// Framing is fine but the stream does not have the required shape.
class StructuralError : public TafException
{
    public:
        StructuralError(ErrorCode code, std::string why);
};

// Stored digest disagrees with the content.
class IntegrityError : public TafException
{
    public:
        IntegrityError(ErrorCode code, std::string why);
};

// Something does not fit into a page, a lacing table or the header block.
class CapacityError : public TafException
{
    public:
        CapacityError(ErrorCode code, std::string why);
};

// Caller supplied source material the codec cannot work with.
class InputError : public TafException
{
    public:
        InputError(ErrorCode code, std::string why);
};

} // namespace TafKit

#endif // TAFKIT_EXCEPTIONS_H
