/*
 * AEVUMDB COMMUNITY LICENSE
 * Version 1.0, February 2026
 *
 * Copyright (c) 2026 Ananda Firmansyah.
 * Official Organization: AevumDB (https://github.com/aevumdb)
 *
 * This source code is licensed under the AevumDB Community License.
 * You may not use this file except in compliance with the License.
 */

/**
 * @file identifier.cpp
 * @brief Binary wire conversion for `Identifier`.
 */

#include "chronoid/timeuuid/identifier.hpp"

namespace chronoid::timeuuid {

Identifier::Bytes Identifier::to_bytes() const
{
    Bytes out{};
    for (std::size_t i = 0; i < 8; ++i) {
        out[i] = static_cast<std::uint8_t>(msb_ >> (56 - 8 * i));
        out[i + 8] = static_cast<std::uint8_t>(lsb_ >> (56 - 8 * i));
    }
    return out;
}

Identifier Identifier::from_bytes(const Bytes& bytes)
{
    std::uint64_t msb = 0;
    std::uint64_t lsb = 0;
    for (std::size_t i = 0; i < 8; ++i) {
        msb = (msb << 8) | bytes[i];
        lsb = (lsb << 8) | bytes[i + 8];
    }
    return Identifier(msb, lsb);
}

} // namespace chronoid::timeuuid
