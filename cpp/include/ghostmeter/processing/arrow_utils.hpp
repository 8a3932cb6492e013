/**
 * Arrow Utilities - column reductions for the estimation components
 *
 * Zero-copy wrapping of std::vector columns for Arrow compute kernels.
 */

#pragma once

#include <vector>
#include <memory>
#include <numeric>
#include <stdexcept>
#include <string>

#ifdef HAVE_ARROW
#include <arrow/api.h>
#include <arrow/compute/api.h>
#endif

namespace ghostmeter {
namespace arrow_utils {

#ifdef HAVE_ARROW

/**
 * Wrap C++ vector as Arrow array (zero-copy!)
 *
 * CRITICAL: The input vector MUST stay alive while Arrow array is used!
 */
inline std::shared_ptr<arrow::DoubleArray> wrap_vector_as_arrow(
    const std::vector<double>& data
) {
    auto buffer = arrow::Buffer::Wrap(
        reinterpret_cast<const uint8_t*>(data.data()),
        data.size() * sizeof(double)
    );

    auto array_data = arrow::ArrayData::Make(
        arrow::float64(),
        data.size(),
        {nullptr, buffer},
        0
    );

    return std::make_shared<arrow::DoubleArray>(array_data);
}

/**
 * Sum of a column using the Arrow "sum" kernel
 *
 * @param data Input values (no NaN handling, callers pass finite values)
 * @return Sum, 0.0 for an empty column
 */
inline double sum(const std::vector<double>& data) {
    if (data.empty()) {
        return 0.0;
    }

    auto array = wrap_vector_as_arrow(data);
    arrow::compute::ExecContext ctx;
    auto result = arrow::compute::CallFunction("sum", {array}, &ctx);
    if (!result.ok()) {
        throw std::runtime_error("Arrow sum failed: " + result.status().ToString());
    }
    return result.ValueOrDie().scalar_as<arrow::DoubleScalar>().value;
}

/**
 * Check if Arrow is available at runtime
 */
inline bool is_arrow_available() {
    return true;
}

#else  // HAVE_ARROW not defined

inline double sum(const std::vector<double>& data) {
    return std::accumulate(data.begin(), data.end(), 0.0);
}

inline bool is_arrow_available() {
    return false;
}

#endif  // HAVE_ARROW

}  // namespace arrow_utils
}  // namespace ghostmeter
