#pragma once

#include <initializer_list>
#include <optional>

#include "stats/sample.hpp"

namespace stats {

/* A statistic of a sample.
   std::nullopt means the statistic is undefined for that sample.
*/
typedef std::optional<double> (*StatFn)(Sample);

/*! \brief arithmetic mean

    0.0 for an empty sample
*/
std::optional<double> mean(Sample sample);

/*! \brief sample standard deviation (divides by n - 1)

    undefined for an empty sample.
    For a single value the division by zero is not caught and the result is NaN.
*/
std::optional<double> stddev(Sample sample);

/*! \brief median, taking the lower middle value when the size is even

    undefined for an empty sample.
    The sample must not contain NaN.
    The sample is not modified.
*/
std::optional<double> median(Sample sample);

/*! \brief Euclidean norm

    0.0 for an empty sample
*/
std::optional<double> l2(Sample sample);

// braced-list forms, e.g. stats::mean({1.0, 2.0})
std::optional<double> mean(std::initializer_list<double> values);
std::optional<double> stddev(std::initializer_list<double> values);
std::optional<double> median(std::initializer_list<double> values);
std::optional<double> l2(std::initializer_list<double> values);

} // namespace stats
