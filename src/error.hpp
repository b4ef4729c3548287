#ifndef KATZIFY_ERROR_HPP
#define KATZIFY_ERROR_HPP

#include <stdexcept>
#include <string>

namespace katzify {

// All failures are fatal and reach main() as one of these.
struct Error : std::runtime_error {
    using std::runtime_error::runtime_error;
};

// input unreadable, truncated, or in a format we can't decode
struct DecodeError : Error { using Error::Error; };

// background color absent from the image palette
struct NoClearColorError : Error { using Error::Error; };

// bad animation / erosion / CLI parameter
struct InvalidParameterError : Error { using Error::Error; };

// output could not be assembled or written
struct EncodeError : Error { using Error::Error; };

} // namespace katzify

#endif
