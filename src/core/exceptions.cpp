/*
 * exceptions.cpp - Error classes for the TAF codec.
 * This file is part of TafKit.
 * Copyright © 2011-2025 Kirn Gill <segin2005@gmail.com>
 *
 * TafKit is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#include "tafkit.h"

namespace TafKit {

const char* errorCodeName(ErrorCode code) {
    switch (code) {
        case ErrorCode::BadCapturePattern: return "BadCapturePattern";
        case ErrorCode::ChecksumMismatch: return "ChecksumMismatch";
        case ErrorCode::TruncatedPage: return "TruncatedPage";
        case ErrorCode::MalformedPage: return "MalformedPage";
        case ErrorCode::UnexpectedContinuation: return "UnexpectedContinuation";
        case ErrorCode::MissingContinuation: return "MissingContinuation";
        case ErrorCode::TruncatedPacket: return "TruncatedPacket";
        case ErrorCode::TruncatedHeader: return "TruncatedHeader";
        case ErrorCode::MalformedHeader: return "MalformedHeader";
        case ErrorCode::MalformedOpusPacket: return "MalformedOpusPacket";
        case ErrorCode::PageSizeMismatch: return "PageSizeMismatch";
        case ErrorCode::MissingStreamHeader: return "MissingStreamHeader";
        case ErrorCode::InvalidIdentificationHeader: return "InvalidIdentificationHeader";
        case ErrorCode::InvalidCommentHeader: return "InvalidCommentHeader";
        case ErrorCode::UnsupportedStreamFormat: return "UnsupportedStreamFormat";
        case ErrorCode::IncompatibleStreamParameters: return "IncompatibleStreamParameters";
        case ErrorCode::NonMonotonicChapters: return "NonMonotonicChapters";
        case ErrorCode::ChapterNotPageAligned: return "ChapterNotPageAligned";
        case ErrorCode::ContentHashMismatch: return "ContentHashMismatch";
        case ErrorCode::ContentLengthMismatch: return "ContentLengthMismatch";
        case ErrorCode::LacingOverflow: return "LacingOverflow";
        case ErrorCode::HeaderOverflow: return "HeaderOverflow";
        case ErrorCode::PacketTooLarge: return "PacketTooLarge";
        case ErrorCode::PagePaddingFailed: return "PagePaddingFailed";
        case ErrorCode::EmptyInput: return "EmptyInput";
        case ErrorCode::SerialDiscontinuity: return "SerialDiscontinuity";
        case ErrorCode::SequenceGap: return "SequenceGap";
        case ErrorCode::InvalidTrackBoundary: return "InvalidTrackBoundary";
    }
    return "Unknown";
}

/**
 * @brief Constructs a TafException.
 *
 * The message returned by what() is prefixed with the symbolic error code so
 * that a report line is self-describing.
 * @param code The condition that failed.
 * @param why A string describing the reason for the failure.
 */
TafException::TafException(ErrorCode code, std::string why)
    : std::exception(), m_code(code), m_why(std::string(errorCodeName(code)) + ": " + why) {
  // ctor
}

/**
 * @brief Returns the exception's explanatory string.
 */
const char *TafException::what() const noexcept {
  return m_why.c_str();
}

FormatError::FormatError(ErrorCode code, std::string why)
    : TafException(code, std::move(why)) {
}

StructuralError::StructuralError(ErrorCode code, std::string why)
    : TafException(code, std::move(why)) {
}

IntegrityError::IntegrityError(ErrorCode code, std::string why)
    : TafException(code, std::move(why)) {
}

CapacityError::CapacityError(ErrorCode code, std::string why)
    : TafException(code, std::move(why)) {
}

InputError::InputError(ErrorCode code, std::string why)
    : TafException(code, std::move(why)) {
}

} // namespace TafKit
