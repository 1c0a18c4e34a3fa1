/*
 * TafValidator.h - Structural validation of TAF containers
 * This file is part of TafKit.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * TafKit is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 *
 * The validator runs every check regardless of earlier failures and never
 * throws for a defective container. Each check carries a stable name:
 *
 *   header.length_prefix   structured header fits the block
 *   header.decode          structured header decodes
 *   header.content_length  stored length equals the page stream size
 *   content.hash           stored hash equals the recomputed hash
 *   pages.framing          page stream frames into whole pages
 *   pages.size             every page has the fixed size
 *   pages.checksum         every page CRC is valid
 *   pages.sequence         sequence numbers run 0, 1, 2, ...
 *   stream.serial          every page carries the header timestamp as serial
 *   stream.identification  first packet is OpusHead with the expected format
 *   stream.comment         second packet is a valid OpusTags
 *   chapters.order         chapter pages strictly increasing, within the stream
 *   chapters.alignment     chapter pages start with a fresh packet
 */

#ifndef TAFKIT_TAF_TAFVALIDATOR_H
#define TAFKIT_TAF_TAFVALIDATOR_H

#include "taf/TafContainer.h"

#include <string>
#include <vector>

namespace TafKit {
namespace Taf {

struct ValidationCheck {
    std::string name;
    bool passed = false;
    std::string detail;
};

struct ValidationReport {
    std::vector<ValidationCheck> checks;

    bool valid() const;
    size_t failureCount() const;

    /**
     * @return nullptr if no check of that name ran
     */
    const ValidationCheck* find(const std::string& name) const;
};

struct ValidationOptions {
    unsigned expected_channels = 2;
    uint32_t expected_sample_rate = 48000;
    size_t page_size = Ogg::DEFAULT_PAGE_SIZE;
    HashScope hash_scope = HashScope::PageBodies;
};

class TafValidator {
public:
    explicit TafValidator(ValidationOptions options = ValidationOptions());

    ValidationReport validate(const TafContainer& container) const;

    /**
     * @brief Validate raw bytes, including input shorter than the header block.
     */
    ValidationReport validate(const std::vector<uint8_t>& bytes) const;

    const ValidationOptions& options() const { return m_options; }

private:
    ValidationOptions m_options;
};

} // namespace Taf
} // namespace TafKit

#endif // TAFKIT_TAF_TAFVALIDATOR_H
