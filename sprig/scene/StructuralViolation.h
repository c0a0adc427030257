// Error raised when the single-parent ownership rule would be broken.
#pragma once

#include <stdexcept>
#include <string>

namespace Sprig {

class StructuralViolation : public std::logic_error {
public:
    explicit StructuralViolation(const std::string& what) : std::logic_error(what) {}
};

}  // namespace Sprig
