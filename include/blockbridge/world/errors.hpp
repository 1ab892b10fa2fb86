// blockbridge World
// errors.hpp - Exceptions raised by the palette subsystem

#pragma once

#include <stdexcept>
#include <string>

namespace blockbridge::world {

// Unknown, destroyed or null palette / id-list handle
class InvalidHandleError : public std::invalid_argument {
public:
    explicit InvalidHandleError(const std::string& what) : std::invalid_argument(what) {}
};

// Malformed palette packet; the target palette is left untouched
class PacketDecodeError : public std::runtime_error {
public:
    explicit PacketDecodeError(const std::string& what) : std::runtime_error(what) {}
};

// Positional read from a palette with no entries
class EmptyPaletteError : public std::logic_error {
public:
    explicit EmptyPaletteError(const std::string& what) : std::logic_error(what) {}
};

}  // namespace blockbridge::world
