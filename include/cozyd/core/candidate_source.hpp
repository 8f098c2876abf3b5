/**
 * @file candidate_source.hpp
 * @brief Interface for producers of candidate device addresses.
 *
 * @copyright Copyright (c) 2024 cozyd Contributors
 * @license MIT License
 */

#pragma once

#include <set>
#include <string>

namespace cozyd {
namespace core {

/**
 * @class CandidateSource
 * @brief One discovery strategy (broadcast, subnet scan, ...).
 *
 * collect() returns the addresses found by one pass. It may throw; the
 * coordinator logs the failure and continues with the other sources.
 */
class CandidateSource {
public:
    virtual ~CandidateSource() = default;

    virtual std::set<std::string> collect() = 0;

    virtual std::string name() const = 0;
};

}  // namespace core
}  // namespace cozyd
