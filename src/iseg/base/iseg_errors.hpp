/*
 * iseg_errors.hpp
 *
 * Exception types thrown by immutable_segment and the copy dispatcher.
 *
 *   invalid_argument       absent source (null buffer / null callable)
 *   out_of_range           index, offset or length outside the source; fault() tells
 *                          "starts beyond the source" from "extends past its end"
 *   inconsistent_sequence  a source walked twice produced two different lengths
 *   invalid_state          enumerator read outside its valid window
 *
 * None of these are retried internally. They are programming errors.
 */

#ifndef ISEG_ERRORS_HPP_
#define ISEG_ERRORS_HPP_

#include <stdexcept>

#include "iseg_tools.hpp" // ISEG_NOINLINE

namespace iseg {

enum class range_fault : unsigned {
    index,                 // single element position outside [0, size)
    starts_beyond_source,  // offset > source length
    extends_past_end       // offset + length > source length
};

enum class sequence_fault : unsigned {
    shorter_on_second_pass,
    longer_on_second_pass
};

class invalid_argument : public std::invalid_argument
{
public:
    using std::invalid_argument::invalid_argument;
};

class out_of_range : public std::out_of_range
{
public:
    out_of_range(const range_fault fault, const char* what)
        : std::out_of_range(what)
        , fault_(fault)
    {}

    [[nodiscard]] range_fault fault() const noexcept { return fault_; }

private:
    range_fault fault_;
};

class inconsistent_sequence : public std::logic_error
{
public:
    inconsistent_sequence(const sequence_fault fault, const char* what)
        : std::logic_error(what)
        , fault_(fault)
    {}

    [[nodiscard]] sequence_fault fault() const noexcept { return fault_; }

private:
    sequence_fault fault_;
};

class invalid_state : public std::logic_error
{
public:
    using std::logic_error::logic_error;
};

namespace detail {

inline constexpr const char* kMsgIndex =
    "iseg: index is outside the segment";
inline constexpr const char* kMsgStartsBeyond =
    "iseg: offset lies beyond the end of the source";
inline constexpr const char* kMsgExtendsPast =
    "iseg: requested span extends past the end of the source";
inline constexpr const char* kMsgShorter =
    "iseg: the input sequence is shorter the second time than the first time";
inline constexpr const char* kMsgLonger =
    "iseg: the input sequence is longer the second time than the first time";

[[noreturn]] ISEG_NOINLINE inline void throw_out_of_range(const range_fault fault)
{
    switch (fault) {
    case range_fault::index:
        throw out_of_range(fault, kMsgIndex);
    case range_fault::starts_beyond_source:
        throw out_of_range(fault, kMsgStartsBeyond);
    case range_fault::extends_past_end:
        break;
    }
    throw out_of_range(range_fault::extends_past_end, kMsgExtendsPast);
}

[[noreturn]] ISEG_NOINLINE inline void throw_inconsistent(const sequence_fault fault)
{
    throw inconsistent_sequence(fault, (fault == sequence_fault::shorter_on_second_pass)
                                           ? kMsgShorter : kMsgLonger);
}

[[noreturn]] ISEG_NOINLINE inline void throw_invalid_argument(const char* what)
{
    throw invalid_argument(what);
}

[[noreturn]] ISEG_NOINLINE inline void throw_invalid_state(const char* what)
{
    throw invalid_state(what);
}

} // namespace detail
} // namespace iseg

#endif /* ISEG_ERRORS_HPP_ */
