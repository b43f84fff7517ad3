#pragma once

#include <stdexcept>
#include <string>

namespace plotcore
{

// Raised while building a model object. Once construction succeeds the
// object is valid for its whole lifetime; nothing on the render path throws.
class ConstructionError : public std::invalid_argument
{
   public:
    using std::invalid_argument::invalid_argument;
};

class InvalidRangeError : public ConstructionError
{
   public:
    using ConstructionError::ConstructionError;
};

class InvalidGridError : public ConstructionError
{
   public:
    using ConstructionError::ConstructionError;
};

}   // namespace plotcore
