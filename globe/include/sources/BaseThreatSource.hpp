#pragma once

#include <string>

#include "utility/threat_types.hpp"

namespace globe
{

// Feed that hands the engine a complete record set whenever it changes.
class BaseThreatSource
{
public:
    virtual ~BaseThreatSource() = default;

    virtual const std::string& identifier() const noexcept = 0;

    // Replaces destination and returns true when a new record set is
    // available. Returns false and leaves destination alone otherwise.
    virtual bool poll(utility::ThreatRecords& destination) = 0;
};

} // namespace globe
