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
 * @file node_identifier.cpp
 * @brief Lazy, once-only selection of the node value.
 */

#include "chronoid/timeuuid/node_identifier.hpp"

#include "chronoid/infra/entropy.hpp"
#include "chronoid/infra/logger.hpp"

#include <iomanip>
#include <sstream>
#include <utility>

namespace chronoid::timeuuid {

NodeIdentifier::NodeIdentifier(std::optional<std::uint64_t> fixed, EntropySource source)
    : source_(source ? std::move(source) : EntropySource(&infra::Entropy::next_u64)),
      value_(fixed ? ((*fixed & kMask) | kLocalBit) : 0), fixed_(fixed.has_value())
{
}

std::uint64_t NodeIdentifier::value() const
{
    std::call_once(once_, [this] {
        if (fixed_) {
            return;
        }

        value_ = (source_() & kMask) | kLocalBit;

        std::ostringstream msg;
        msg << "Node: selected node identifier 0x" << std::hex << std::setfill('0')
            << std::setw(12) << value_;
        infra::Logger::log(infra::LogLevel::DEBUG, msg.str());
    });
    return value_;
}

} // namespace chronoid::timeuuid
